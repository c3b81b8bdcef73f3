// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/sync_worker.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace anchorsync {
namespace sync {

SyncWorker::SyncWorker(QueueName queue, AnchorApplier &applier,
                       int64_t blocks_per_batch,
                       HistoricalSyncDoneCallback on_historical_done)
    : queue_(queue), applier_(applier),
      blocks_per_batch_(std::max<int64_t>(1, blocks_per_batch)),
      on_historical_done_(std::move(on_historical_done)) {}

void SyncWorker::HandleJob(JobContext &ctx) {
  const QueuedJob &job = ctx.job();
  const SyncJobRequest req = job.sync_request();

  if (req.from_block > req.to_block) {
    throw std::invalid_argument("invalid block range " +
                                std::to_string(req.from_block) + ".." +
                                std::to_string(req.to_block));
  }

  int64_t next = req.from_block;
  if (job.current_block && *job.current_block >= req.from_block) {
    next = *job.current_block + 1;
    LOG_SYNC_DEBUG("Job {} resuming at block {}", job.id, next);
  }

  while (next <= req.to_block) {
    const int64_t batch_end = std::min(req.to_block, next + blocks_per_batch_ - 1);
    applier_.ApplyAnchors(next, batch_end, req.models);
    ctx.UpdateProgress(batch_end);
    next = batch_end + 1;
  }

  if (queue_ == QueueName::Historical) {
    LOG_SYNC_INFO("Historical sync of blocks {}..{} complete for {} model(s)",
                  req.from_block, req.to_block, req.models.size());
    NotifyDone(req.models, true);
  } else {
    LOG_SYNC_TRACE("Continuous sync of block {} complete", req.to_block);
  }
}

void SyncWorker::OnTerminalFailure(const QueuedJob &job, const std::string &error) {
  if (queue_ != QueueName::Historical) {
    return;
  }

  SyncJobRequest req;
  try {
    req = job.sync_request();
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed historical job {} has an unreadable payload: {}",
                   job.id, e.what());
    return;
  }

  LOG_SYNC_ERROR("Historical sync of blocks {}..{} gave up for models [{}]; "
                 "their data may be incomplete: {}",
                 req.from_block, req.to_block, JoinModels(req.models), error);
  NotifyDone(req.models, false);
}

void SyncWorker::NotifyDone(const std::vector<std::string> &models, bool succeeded) {
  if (on_historical_done_) {
    on_historical_done_(models, succeeded);
  }
}

void RebuildAnchorWorker::HandleJob(JobContext &ctx) {
  const auto req = ctx.job().data.get<RebuildAnchorRequest>();
  LOG_SYNC_INFO("Rebuilding anchors for {} model(s)", req.models.size());
  rebuilder_.RebuildAnchors(req.models);
}

void RebuildAnchorWorker::OnTerminalFailure(const QueuedJob &job,
                                            const std::string &error) {
  LOG_SYNC_ERROR("Anchor rebuild job {} failed: {}", job.id, error);
}

} // namespace sync
} // namespace anchorsync
