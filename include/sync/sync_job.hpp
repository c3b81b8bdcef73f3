// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_SYNC_JOB_HPP
#define ANCHORSYNC_SYNC_SYNC_JOB_HPP

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace anchorsync {
namespace sync {

// Blocks behind the chain head before a block is treated as final
constexpr int BLOCK_CONFIRMATIONS = 20;

/**
 * Semantic kind of a sync job.
 *
 * Catchup and Full cover a bounded historical range, Continuous is a single
 * live-tail block (from_block == to_block).
 */
enum class SyncJobKind {
  Catchup,
  Full,
  Continuous,
};

/**
 * Queue a job is routed to. Orthogonal to SyncJobKind.
 */
enum class QueueName {
  Historical,
  Continuous,
  Rebuild,
};

// Stable names used in the job table ("historySync", "continuousSync",
// "rebuildAnchor")
const char *QueueNameToString(QueueName queue);
std::optional<QueueName> QueueNameFromString(const std::string &name);

const char *SyncJobKindToString(SyncJobKind kind);
std::optional<SyncJobKind> SyncJobKindFromString(const std::string &name);

struct SyncJobRequest {
  SyncJobKind job_type{SyncJobKind::Catchup};
  int64_t from_block{0};
  int64_t to_block{0};
  std::vector<std::string> models;

  bool operator==(const SyncJobRequest &other) const {
    return job_type == other.job_type && from_block == other.from_block &&
           to_block == other.to_block && models == other.models;
  }
  bool operator!=(const SyncJobRequest &other) const { return !(*this == other); }
};

// Comma separated list for log lines
std::string JoinModels(const std::vector<std::string> &models);

struct RebuildAnchorRequest {
  std::vector<std::string> models;
};

// Wire shape matches the stored job payload: {"jobType", "fromBlock",
// "toBlock", "models"}. from_json throws nlohmann::json::exception on
// missing fields and std::invalid_argument on an unknown job type.
void to_json(nlohmann::json &j, const SyncJobRequest &req);
void from_json(const nlohmann::json &j, SyncJobRequest &req);

void to_json(nlohmann::json &j, const RebuildAnchorRequest &req);
void from_json(const nlohmann::json &j, RebuildAnchorRequest &req);

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_SYNC_JOB_HPP
