// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_SYNC_API_HPP
#define ANCHORSYNC_SYNC_SYNC_API_HPP

#include "sync/anchor_processor.hpp"
#include "sync/block_subscription.hpp"
#include "sync/job_queue.hpp"
#include "sync/sync_job.hpp"
#include "sync/sync_query_api.hpp"
#include "sync/sync_state_store.hpp"
#include "sync/sync_status.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace anchorsync {

namespace index {
class ModelIndex;
}

namespace util {
class PeriodicTask;
}

namespace sync {

struct SyncConfig {
  std::string db_path;  // SQLite file shared by the state table and job queue
  int block_confirmations;
  std::chrono::milliseconds status_log_interval;

  // Job queue
  size_t worker_slots;
  int max_job_retries;
  std::chrono::milliseconds retry_delay;

  // Completed jobs older than this are purged on the status interval;
  // zero keeps them forever
  std::chrono::milliseconds completed_job_retention;

  int64_t blocks_per_batch;              // Historical worker batch size
  std::chrono::milliseconds poll_interval; // Default block listener

  SyncConfig()
      : db_path(":memory:"), block_confirmations(BLOCK_CONFIRMATIONS),
        status_log_interval(std::chrono::seconds(60)), worker_slots(4),
        max_job_retries(5), retry_delay(std::chrono::seconds(10)),
        completed_job_retention(std::chrono::hours(1)),
        blocks_per_batch(1000), poll_interval(std::chrono::seconds(5)) {}
};

/**
 * SyncApi - keeps the node's view of anchored stream state in step with
 * the chain
 *
 * Owns the set of models being synced and, per model, the number of
 * historical jobs still outstanding. A model with outstanding historical
 * work is not ready to be queried (SyncComplete() == false).
 *
 * Lifecycle
 * - Init() loads progress, counts historical jobs left over from a previous
 *   run, starts the job queue, schedules catch-up to the safe tip,
 *   subscribes to confirmed blocks and starts the status logger
 * - Every confirmed block schedules exactly one job and then persists the
 *   block as processed
 * - Shutdown() stops block events first, then the logger, then the queue
 *
 * The orchestrator never applies anchors itself; all chain work runs in the
 * job queue's workers.
 */
class SyncApi : public SyncQueryApi {
public:
  // job_queue defaults to a SqliteJobQueue on config.db_path, listener
  // factory to PollingBlockListener
  SyncApi(const SyncConfig &config, index::ModelIndex &model_index,
          AnchorApplier &applier, AnchorRebuilder &rebuilder,
          std::shared_ptr<JobQueue> job_queue = nullptr,
          BlockListenerFactory listener_factory = nullptr);
  virtual ~SyncApi();

  SyncApi(const SyncApi &) = delete;
  SyncApi &operator=(const SyncApi &) = delete;

  // Lifecycle
  bool Init(ChainProvider &provider);
  void Shutdown();
  bool IsRunning() const;

  // Block subscription handler
  void HandleBlockEvent(const BlockConfirmationEvent &event);

  // Enrollment
  void StartModelSync(const std::string &model, int64_t from_block,
                      int64_t to_block, SyncJobKind kind = SyncJobKind::Catchup);
  void StartModelSync(const std::vector<std::string> &models, int64_t from_block,
                      int64_t to_block, SyncJobKind kind = SyncJobKind::Catchup);
  void StopModelSync(const std::string &model);
  void StopModelSync(const std::vector<std::string> &models);

  // Enqueue a sync job. Historical jobs that were actually added count
  // against each of their models until OnHistoricalJobFinished.
  virtual JobHandle AddSyncJob(QueueName queue, const SyncJobRequest &request);

  // Admin: re-derive anchor state for models in the rebuild queue
  JobHandle RebuildAnchors(const std::vector<std::string> &models);

  // Readiness
  bool SyncComplete(const std::string &model) const override;

  // Historical worker completion (succeeded == false after terminal failure)
  void OnHistoricalJobFinished(const std::vector<std::string> &models,
                               bool succeeded);

  // Status
  SyncStatus GetSyncStatus();
  void LogSyncStatus();

  // Drop completed jobs past completed_job_retention. Errors are logged,
  // not thrown; returns the number removed.
  size_t PurgeCompletedJobs();

  // Observers
  std::vector<std::string> ModelsToSync() const;
  int HistoricSyncCount(const std::string &model) const;
  int64_t CurrentBlock() const;
  int64_t StartBlock() const;
  const SyncConfig &config() const { return config_; }
  bool IsSubscribed() const;
  bool IsStatusLoggerRunning() const;

  // Test-only: position the block cursor without a chain
  void SetBlockCursorForTest(int64_t start_block, int64_t current_block);

protected:
  // Init steps, in call order
  virtual SyncProgress InitStateTable();
  virtual void InitModelsToSync();
  virtual void InitHistoricSyncCounts();
  virtual bool InitJobQueue();
  virtual bool InitBlockSubscription(const BlockInfo &safe_tip);
  virtual void InitPeriodicStatusLogger();

  // Persist the last processed block
  virtual void UpdateStoredState(const SyncProgress &progress);

  JobQueue &job_queue() { return *job_queue_; }

private:
  void ScheduleCatchup(const SyncProgress &progress, const BlockInfo &safe_tip);

  SyncConfig config_;
  index::ModelIndex &model_index_;
  AnchorApplier &applier_;
  AnchorRebuilder &rebuilder_;
  std::shared_ptr<JobQueue> job_queue_;
  BlockListenerFactory listener_factory_;

  std::unique_ptr<SyncStateStore> state_store_;

  ChainProvider *provider_{nullptr};
  std::string chain_id_;

  // Guards models_to_sync_, historic_sync_counts_ and the block cursor
  mutable std::mutex state_mutex_;
  std::set<std::string> models_to_sync_;
  std::map<std::string, int> historic_sync_counts_;
  int64_t start_block_{0};
  int64_t current_block_{0};

  // Serializes block events against each other
  std::mutex handler_mutex_;

  mutable std::mutex lifecycle_mutex_;
  std::unique_ptr<BlockSubscription> subscription_;
  std::unique_ptr<util::PeriodicTask> status_logger_;
  bool running_{false};
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_SYNC_API_HPP
