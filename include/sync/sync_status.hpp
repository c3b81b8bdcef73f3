// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_SYNC_STATUS_HPP
#define ANCHORSYNC_SYNC_SYNC_STATUS_HPP

#include "sync/job_queue.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace anchorsync {
namespace sync {

// A historical job currently running. Timestamps are ms since epoch.
struct ActiveSync {
  std::vector<std::string> models;
  int64_t start_block{0};
  std::optional<int64_t> current_block;
  int64_t end_block{0};
  std::optional<int64_t> started_at;
  int64_t created_at{0};

  bool operator==(const ActiveSync &) const = default;
};

// A historical job waiting for a worker slot
struct PendingSync {
  std::vector<std::string> models;
  int64_t start_block{0};
  int64_t end_block{0};
  int64_t created_at{0};

  bool operator==(const PendingSync &) const = default;
};

// Live tailing position
struct ContinuousSync {
  int confirmations{0};
  int64_t current_block{0};
  int64_t latest_block{0};
  std::vector<std::string> models;
  int64_t start_block{0};

  bool operator==(const ContinuousSync &) const = default;
};

struct SyncStatus {
  std::vector<ActiveSync> active_syncs;
  std::vector<PendingSync> pending_syncs;
  std::vector<ContinuousSync> continuous_sync;
};

// Build status entries from job records. Missing payload fields are
// tolerated (reported as empty / 0) since this is diagnostics only.
ActiveSync ActiveSyncFromJob(const QueuedJob &job);
PendingSync PendingSyncFromJob(const QueuedJob &job);

// Field names follow the admin API: activeSyncs, pendingSyncs,
// continuousSync, startBlock, currentBlock, ...; times as ISO-8601
void to_json(nlohmann::json &j, const ActiveSync &sync);
void to_json(nlohmann::json &j, const PendingSync &sync);
void to_json(nlohmann::json &j, const ContinuousSync &sync);
void to_json(nlohmann::json &j, const SyncStatus &status);

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_SYNC_STATUS_HPP
