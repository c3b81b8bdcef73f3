// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/sync_api.hpp"
#include "index/model_index.hpp"
#include "sync/polling_block_listener.hpp"
#include "sync/sqlite_job_queue.hpp"
#include "sync/sync_worker.hpp"
#include "util/logging.hpp"
#include "util/periodic_task.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace anchorsync {
namespace sync {

namespace {

std::shared_ptr<JobQueue> MakeDefaultJobQueue(const SyncConfig &config) {
  SqliteJobQueue::Options options;
  options.worker_slots = config.worker_slots;
  options.max_retries = config.max_job_retries;
  options.retry_delay = config.retry_delay;
  return std::make_shared<SqliteJobQueue>(config.db_path, options);
}

BlockListenerFactory MakeDefaultListenerFactory(const SyncConfig &config) {
  PollingBlockListener::Options options;
  options.poll_interval = config.poll_interval;
  return PollingBlockListener::Factory(options);
}

} // namespace

SyncApi::SyncApi(const SyncConfig &config, index::ModelIndex &model_index,
                 AnchorApplier &applier, AnchorRebuilder &rebuilder,
                 std::shared_ptr<JobQueue> job_queue,
                 BlockListenerFactory listener_factory)
    : config_(config), model_index_(model_index), applier_(applier),
      rebuilder_(rebuilder),
      job_queue_(job_queue ? std::move(job_queue) : MakeDefaultJobQueue(config)),
      listener_factory_(listener_factory ? std::move(listener_factory)
                                         : MakeDefaultListenerFactory(config)) {}

SyncApi::~SyncApi() { Shutdown(); }

bool SyncApi::Init(ChainProvider &provider) {
  LOG_SYNC_INFO("Initializing anchor sync (confirmations={})",
                config_.block_confirmations);

  SyncProgress progress;
  try {
    progress = InitStateTable();
    InitModelsToSync();
    // Before dispatch starts, so a leftover job cannot finish uncounted
    InitHistoricSyncCounts();
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed to load sync state: {}", e.what());
    return false;
  }

  if (!InitJobQueue()) {
    LOG_SYNC_ERROR("Failed to initialize job queue");
    return false;
  }

  // Sync cannot start without a reference tip
  BlockInfo safe_tip;
  try {
    safe_tip = provider.GetBlock(-config_.block_confirmations);
    chain_id_ = ToCaip2ChainId(provider.GetNetwork());
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed to read safe tip from chain provider: {}", e.what());
    job_queue_->Stop();
    return false;
  }
  provider_ = &provider;

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    start_block_ = safe_tip.number;
    current_block_ = safe_tip.number + config_.block_confirmations;
  }

  try {
    ScheduleCatchup(progress, safe_tip);
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed to schedule catch-up sync: {}", e.what());
    job_queue_->Stop();
    return false;
  }

  if (!InitBlockSubscription(safe_tip)) {
    LOG_SYNC_ERROR("Failed to subscribe to confirmed blocks");
    job_queue_->Stop();
    return false;
  }
  InitPeriodicStatusLogger();

  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    running_ = true;
  }

  LOG_SYNC_INFO("Anchor sync started on {} at block {} ({} model(s))", chain_id_,
                safe_tip.number, ModelsToSync().size());
  return true;
}

void SyncApi::ScheduleCatchup(const SyncProgress &progress, const BlockInfo &safe_tip) {
  const auto models = ModelsToSync();

  if (progress.IsUnset()) {
    LOG_SYNC_INFO("No sync progress recorded, syncing blocks 0..{}", safe_tip.number);
    AddSyncJob(QueueName::Historical,
               SyncJobRequest{SyncJobKind::Catchup, 0, safe_tip.number, models});
  } else if (*progress.processed_block_number < safe_tip.number) {
    LOG_SYNC_INFO("Catching up from block {} to {}", *progress.processed_block_number,
                  safe_tip.number);
    AddSyncJob(QueueName::Historical,
               SyncJobRequest{SyncJobKind::Catchup, *progress.processed_block_number,
                              safe_tip.number, models});
  } else {
    LOG_SYNC_INFO("Already synced to block {}", *progress.processed_block_number);
    return;
  }

  // The catch-up job owns everything up to the safe tip
  UpdateStoredState(SyncProgress{safe_tip.hash, safe_tip.number});
}

SyncProgress SyncApi::InitStateTable() {
  if (!state_store_) {
    state_store_ = std::make_unique<SyncStateStore>(config_.db_path);
  }
  return state_store_->Load();
}

void SyncApi::InitModelsToSync() {
  const auto models = model_index_.IndexedModels();
  std::lock_guard<std::mutex> lock(state_mutex_);
  models_to_sync_.insert(models.begin(), models.end());
}

void SyncApi::InitHistoricSyncCounts() {
  const std::vector<QueueName> historical{QueueName::Historical};
  std::map<std::string, int> counts;
  size_t leftover = 0;

  // Jobs a previous run left queued or running will be dispatched again
  for (JobState state : {JobState::Created, JobState::Active}) {
    auto jobs = job_queue_->GetJobs(state, historical);
    for (const auto &job : jobs[QueueName::Historical]) {
      for (const auto &model : job.data.value("models", std::vector<std::string>{})) {
        ++counts[model];
      }
      ++leftover;
    }
  }

  if (leftover == 0) {
    return;
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  for (const auto &[model, count] : counts) {
    historic_sync_counts_[model] += count;
  }
  LOG_SYNC_INFO("Resuming {} unfinished historical job(s) from a previous run",
                leftover);
}

bool SyncApi::InitJobQueue() {
  WorkerSet workers;
  workers.rebuild_anchor = std::make_shared<RebuildAnchorWorker>(rebuilder_);
  workers.history_sync = std::make_shared<SyncWorker>(
      QueueName::Historical, applier_, config_.blocks_per_batch,
      [this](const std::vector<std::string> &models, bool succeeded) {
        OnHistoricalJobFinished(models, succeeded);
      });
  workers.continuous_sync = std::make_shared<SyncWorker>(
      QueueName::Continuous, applier_, config_.blocks_per_batch);
  return job_queue_->Init(std::move(workers));
}

bool SyncApi::InitBlockSubscription(const BlockInfo &safe_tip) {
  BlockListenerParams params;
  params.confirmations = config_.block_confirmations;
  params.chain_id = chain_id_;
  params.provider = provider_;
  params.expected_parent_hash = safe_tip.hash;
  params.start_block_number = safe_tip.number;

  std::unique_ptr<BlockSubscription> subscription;
  try {
    auto listener = listener_factory_(params);
    if (!listener) {
      LOG_CHAIN_ERROR("Block listener factory returned no listener");
      return false;
    }
    subscription = std::make_unique<BlockSubscription>(
        std::move(listener),
        [this](const BlockConfirmationEvent &event) { HandleBlockEvent(event); });
  } catch (const std::exception &e) {
    LOG_CHAIN_ERROR("Failed to start block listener: {}", e.what());
    return false;
  }

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  subscription_ = std::move(subscription);
  return true;
}

void SyncApi::InitPeriodicStatusLogger() {
  auto logger = std::make_unique<util::PeriodicTask>(
      "sync-status", config_.status_log_interval, [this]() {
        LogSyncStatus();
        PurgeCompletedJobs();
      });

  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  status_logger_ = std::move(logger);
}

void SyncApi::Shutdown() {
  std::unique_ptr<BlockSubscription> subscription;
  std::unique_ptr<util::PeriodicTask> status_logger;
  bool was_running;
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    subscription = std::move(subscription_);
    status_logger = std::move(status_logger_);
    was_running = running_;
    running_ = false;
  }

  // Block events first so nothing new is enqueued while the queue drains
  if (subscription) {
    try {
      subscription->Unsubscribe();
    } catch (const std::exception &e) {
      LOG_CHAIN_ERROR("Failed to unsubscribe from blocks: {}", e.what());
    }
    subscription.reset();
  }

  if (status_logger) {
    try {
      status_logger->Cancel();
    } catch (const std::exception &e) {
      LOG_SYNC_ERROR("Failed to stop status logger: {}", e.what());
    }
    status_logger.reset();
  }

  try {
    job_queue_->Stop();
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed to stop job queue: {}", e.what());
  }

  if (was_running) {
    LOG_SYNC_INFO("Anchor sync stopped");
  }
}

bool SyncApi::IsRunning() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return running_;
}

void SyncApi::HandleBlockEvent(const BlockConfirmationEvent &event) {
  std::lock_guard<std::mutex> handler_lock(handler_mutex_);

  const int64_t number = event.block.number;
  const auto models = ModelsToSync();

  try {
    if (event.reorganized) {
      const int64_t from_block =
          std::max<int64_t>(0, number - config_.block_confirmations);
      LOG_SYNC_WARN("Reorganization detected at block {} (expected parent {}), "
                    "resyncing blocks {}..{}",
                    number, event.expected_parent_hash.value_or(""), from_block,
                    number);
      AddSyncJob(QueueName::Historical,
                 SyncJobRequest{SyncJobKind::Catchup, from_block, number, models});
    } else {
      LOG_SYNC_TRACE("Block {} confirmed ({})", number, event.block.hash);
      AddSyncJob(QueueName::Continuous,
                 SyncJobRequest{SyncJobKind::Continuous, number, number, models});
    }
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed to schedule sync for block {}: {}", number, e.what());
  }

  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    current_block_ = number + config_.block_confirmations;
  }

  try {
    UpdateStoredState(SyncProgress{event.block.hash, number});
  } catch (const std::exception &e) {
    LOG_SYNC_ERROR("Failed to persist progress for block {}: {}", number, e.what());
  }
}

void SyncApi::UpdateStoredState(const SyncProgress &progress) {
  if (!state_store_) {
    state_store_ = std::make_unique<SyncStateStore>(config_.db_path);
  }
  state_store_->Save(progress);
}

void SyncApi::StartModelSync(const std::string &model, int64_t from_block,
                             int64_t to_block, SyncJobKind kind) {
  StartModelSync(std::vector<std::string>{model}, from_block, to_block, kind);
}

void SyncApi::StartModelSync(const std::vector<std::string> &models,
                             int64_t from_block, int64_t to_block,
                             SyncJobKind kind) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    models_to_sync_.insert(models.begin(), models.end());
  }

  LOG_SYNC_INFO("Starting {} sync of blocks {}..{} for [{}]",
                SyncJobKindToString(kind), from_block, to_block, JoinModels(models));
  AddSyncJob(QueueName::Historical,
             SyncJobRequest{kind, from_block, to_block, models});
}

void SyncApi::StopModelSync(const std::string &model) {
  StopModelSync(std::vector<std::string>{model});
}

void SyncApi::StopModelSync(const std::vector<std::string> &models) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  for (const auto &model : models) {
    if (models_to_sync_.erase(model) > 0) {
      LOG_SYNC_INFO("Stopped syncing model {}", model);
    }
  }
}

JobHandle SyncApi::AddSyncJob(QueueName queue, const SyncJobRequest &request) {
  const bool historical = queue == QueueName::Historical;

  // Count before enqueueing: a fast worker may finish the job before
  // AddJob returns
  if (historical) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    for (const auto &model : request.models) {
      ++historic_sync_counts_[model];
    }
  }

  JobHandle handle;
  try {
    handle = job_queue_->AddJob(queue, nlohmann::json(request));
  } catch (...) {
    if (historical) {
      OnHistoricalJobFinished(request.models, true);
    }
    throw;
  }

  if (historical && !handle.inserted) {
    LOG_SYNC_DEBUG("Historical job {}..{} already queued as job {}",
                   request.from_block, request.to_block, handle.id);
    OnHistoricalJobFinished(request.models, true);
  }
  return handle;
}

JobHandle SyncApi::RebuildAnchors(const std::vector<std::string> &models) {
  LOG_SYNC_INFO("Scheduling anchor rebuild for [{}]", JoinModels(models));
  return job_queue_->AddJob(QueueName::Rebuild,
                            nlohmann::json(RebuildAnchorRequest{models}));
}

bool SyncApi::SyncComplete(const std::string &model) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = historic_sync_counts_.find(model);
  return it == historic_sync_counts_.end() || it->second == 0;
}

void SyncApi::OnHistoricalJobFinished(const std::vector<std::string> &models,
                                      bool succeeded) {
  if (!succeeded) {
    LOG_SYNC_ERROR("Historical sync failed for [{}]; data for these models may "
                   "be incomplete",
                   JoinModels(models));
  }

  std::lock_guard<std::mutex> lock(state_mutex_);
  for (const auto &model : models) {
    auto it = historic_sync_counts_.find(model);
    if (it == historic_sync_counts_.end()) {
      continue;
    }
    if (--it->second <= 0) {
      historic_sync_counts_.erase(it);
    }
  }
}

SyncStatus SyncApi::GetSyncStatus() {
  const std::vector<QueueName> queues{QueueName::Continuous, QueueName::Historical};
  auto active = job_queue_->GetJobs(JobState::Active, queues);
  auto created = job_queue_->GetJobs(JobState::Created, queues);

  SyncStatus status;
  for (const auto &job : active[QueueName::Historical]) {
    status.active_syncs.push_back(ActiveSyncFromJob(job));
  }
  for (const auto &job : created[QueueName::Historical]) {
    status.pending_syncs.push_back(PendingSyncFromJob(job));
  }

  ContinuousSync continuous;
  continuous.confirmations = config_.block_confirmations;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    continuous.latest_block = current_block_;
    continuous.start_block = start_block_;
  }

  const auto &running = active[QueueName::Continuous];
  if (!running.empty()) {
    const auto &job = running.front();
    continuous.current_block = job.data.value("fromBlock", int64_t{0});
    continuous.models = job.data.value("models", std::vector<std::string>{});
  } else {
    // Nothing in flight: progress sits at the confirmed edge
    continuous.current_block = continuous.latest_block - config_.block_confirmations;
    continuous.models = ModelsToSync();
  }
  status.continuous_sync.push_back(std::move(continuous));

  return status;
}

void SyncApi::LogSyncStatus() {
  try {
    const nlohmann::json status = GetSyncStatus();
    LOG_SYNC_INFO("Sync status: {}", status.dump());
  } catch (const std::exception &e) {
    LOG_SYNC_WARN("Failed to report sync status: {}", e.what());
  }
}

size_t SyncApi::PurgeCompletedJobs() {
  const auto retention = config_.completed_job_retention;
  if (retention.count() <= 0) {
    return 0;
  }

  const int64_t cutoff = util::GetTimeMillis() - retention.count();
  try {
    const size_t purged = job_queue_->PurgeCompleted(cutoff);
    if (purged > 0) {
      LOG_SYNC_DEBUG("Purged {} completed job(s)", purged);
    }
    return purged;
  } catch (const std::exception &e) {
    LOG_SYNC_WARN("Failed to purge completed jobs: {}", e.what());
    return 0;
  }
}

std::vector<std::string> SyncApi::ModelsToSync() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return std::vector<std::string>(models_to_sync_.begin(), models_to_sync_.end());
}

int SyncApi::HistoricSyncCount(const std::string &model) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  auto it = historic_sync_counts_.find(model);
  return it == historic_sync_counts_.end() ? 0 : it->second;
}

int64_t SyncApi::CurrentBlock() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return current_block_;
}

int64_t SyncApi::StartBlock() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return start_block_;
}

bool SyncApi::IsSubscribed() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return subscription_ != nullptr && subscription_->active();
}

bool SyncApi::IsStatusLoggerRunning() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return status_logger_ != nullptr && status_logger_->running();
}

void SyncApi::SetBlockCursorForTest(int64_t start_block, int64_t current_block) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  start_block_ = start_block;
  current_block_ = current_block;
}

} // namespace sync
} // namespace anchorsync
