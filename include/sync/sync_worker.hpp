// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_SYNC_WORKER_HPP
#define ANCHORSYNC_SYNC_SYNC_WORKER_HPP

#include "sync/anchor_processor.hpp"
#include "sync/job_queue.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace anchorsync {
namespace sync {

// Called once per historical job when it will not run again; succeeded is
// false after a terminal failure
using HistoricalSyncDoneCallback =
    std::function<void(const std::vector<std::string> &models, bool succeeded)>;

/**
 * SyncWorker - runs historical and continuous sync jobs
 *
 * The same logic backs both queues. The range is applied in batches of
 * blocks_per_batch, and the job's current_block cursor is advanced after
 * every batch so a retried job resumes after the last applied batch.
 */
class SyncWorker : public JobWorker {
public:
  SyncWorker(QueueName queue, AnchorApplier &applier, int64_t blocks_per_batch,
             HistoricalSyncDoneCallback on_historical_done = nullptr);

  void HandleJob(JobContext &ctx) override;
  void OnTerminalFailure(const QueuedJob &job, const std::string &error) override;

  QueueName queue() const { return queue_; }

private:
  void NotifyDone(const std::vector<std::string> &models, bool succeeded);

  QueueName queue_;
  AnchorApplier &applier_;
  int64_t blocks_per_batch_;
  HistoricalSyncDoneCallback on_historical_done_;
};

/**
 * RebuildAnchorWorker - runs administrative anchor rebuild jobs
 */
class RebuildAnchorWorker : public JobWorker {
public:
  explicit RebuildAnchorWorker(AnchorRebuilder &rebuilder) : rebuilder_(rebuilder) {}

  void HandleJob(JobContext &ctx) override;
  void OnTerminalFailure(const QueuedJob &job, const std::string &error) override;

private:
  AnchorRebuilder &rebuilder_;
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_SYNC_WORKER_HPP
