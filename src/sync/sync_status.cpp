// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/sync_status.hpp"
#include "util/time.hpp"

namespace anchorsync {
namespace sync {

namespace {

std::vector<std::string> ModelsOf(const nlohmann::json &data) {
  if (data.is_object() && data.contains("models") && data["models"].is_array()) {
    return data["models"].get<std::vector<std::string>>();
  }
  return {};
}

int64_t BlockField(const nlohmann::json &data, const char *key) {
  if (data.is_object() && data.contains(key) && data[key].is_number_integer()) {
    return data[key].get<int64_t>();
  }
  return 0;
}

} // namespace

ActiveSync ActiveSyncFromJob(const QueuedJob &job) {
  ActiveSync sync;
  sync.models = ModelsOf(job.data);
  sync.start_block = BlockField(job.data, "fromBlock");
  sync.current_block = job.current_block;
  sync.end_block = BlockField(job.data, "toBlock");
  sync.started_at = job.started_on;
  sync.created_at = job.created_on;
  return sync;
}

PendingSync PendingSyncFromJob(const QueuedJob &job) {
  PendingSync sync;
  sync.models = ModelsOf(job.data);
  sync.start_block = BlockField(job.data, "fromBlock");
  sync.end_block = BlockField(job.data, "toBlock");
  sync.created_at = job.created_on;
  return sync;
}

void to_json(nlohmann::json &j, const ActiveSync &sync) {
  j = nlohmann::json{{"models", sync.models},
                     {"startBlock", sync.start_block},
                     {"endBlock", sync.end_block},
                     {"createdAt", util::FormatIso8601Millis(sync.created_at)}};
  j["currentBlock"] = sync.current_block ? nlohmann::json(*sync.current_block)
                                         : nlohmann::json(nullptr);
  j["startedAt"] = sync.started_at
                       ? nlohmann::json(util::FormatIso8601Millis(*sync.started_at))
                       : nlohmann::json(nullptr);
}

void to_json(nlohmann::json &j, const PendingSync &sync) {
  j = nlohmann::json{{"models", sync.models},
                     {"startBlock", sync.start_block},
                     {"endBlock", sync.end_block},
                     {"createdAt", util::FormatIso8601Millis(sync.created_at)}};
}

void to_json(nlohmann::json &j, const ContinuousSync &sync) {
  j = nlohmann::json{{"confirmations", sync.confirmations},
                     {"currentBlock", sync.current_block},
                     {"latestBlock", sync.latest_block},
                     {"models", sync.models},
                     {"startBlock", sync.start_block}};
}

void to_json(nlohmann::json &j, const SyncStatus &status) {
  j = nlohmann::json{{"activeSyncs", status.active_syncs},
                     {"continuousSync", status.continuous_sync},
                     {"pendingSyncs", status.pending_syncs}};
}

} // namespace sync
} // namespace anchorsync
