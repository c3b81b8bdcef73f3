// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#include "sync/sqlite_job_queue.hpp"
#include "store/database.hpp"
#include "util/logging.hpp"
#include "util/threadpool.hpp"
#include "util/time.hpp"

namespace anchorsync {
namespace sync {

namespace {

constexpr const char *kJobColumns =
    "id, queue, data, current_block, state, retry_count, last_error, "
    "created_on, started_on, completed_on";

QueuedJob ReadJob(const store::Statement &stmt) {
  QueuedJob job;
  job.id = stmt.ColumnInt64(0);
  auto queue = QueueNameFromString(stmt.ColumnText(1));
  if (!queue) {
    throw store::DatabaseError("unknown queue name in job row: " + stmt.ColumnText(1));
  }
  job.queue = *queue;
  job.data = nlohmann::json::parse(stmt.ColumnText(2));
  job.current_block = stmt.ColumnOptionalInt64(3);
  auto state = JobStateFromString(stmt.ColumnText(4));
  if (!state) {
    throw store::DatabaseError("unknown job state in job row: " + stmt.ColumnText(4));
  }
  job.state = *state;
  job.retry_count = static_cast<int>(stmt.ColumnInt64(5));
  job.last_error = stmt.ColumnOptionalText(6).value_or("");
  job.created_on = stmt.ColumnInt64(7);
  job.started_on = stmt.ColumnOptionalInt64(8);
  job.completed_on = stmt.ColumnOptionalInt64(9);
  return job;
}

} // namespace

// ============================================================================
// SqliteJobQueue::Context
// ============================================================================

class SqliteJobQueue::Context : public JobContext {
public:
  Context(SqliteJobQueue &queue, QueuedJob &job) : queue_(queue), job_(job) {}

  const QueuedJob &job() const override { return job_; }

  void UpdateProgress(int64_t current_block) override {
    queue_.UpdateProgress(job_.id, current_block);
    job_.current_block = current_block;
  }

private:
  SqliteJobQueue &queue_;
  QueuedJob &job_;
};

// ============================================================================
// SqliteJobQueue
// ============================================================================

SqliteJobQueue::SqliteJobQueue(const std::string &db_path)
    : SqliteJobQueue(db_path, Options{}) {}

SqliteJobQueue::SqliteJobQueue(const std::string &db_path, const Options &options)
    : options_(options), db_(std::make_unique<store::Database>(db_path)) {
  if (options_.worker_slots == 0) {
    options_.worker_slots = 1;
  }
  EnsureSchema();
}

SqliteJobQueue::~SqliteJobQueue() { Stop(); }

void SqliteJobQueue::EnsureSchema() {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  db_->Exec("CREATE TABLE IF NOT EXISTS sync_jobs ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "queue TEXT NOT NULL, "
            "data TEXT NOT NULL, "
            "current_block INTEGER, "
            "state TEXT NOT NULL, "
            "retry_count INTEGER NOT NULL DEFAULT 0, "
            "last_error TEXT, "
            "start_after INTEGER NOT NULL, "
            "created_on INTEGER NOT NULL, "
            "started_on INTEGER, "
            "completed_on INTEGER)");
  db_->Exec("CREATE INDEX IF NOT EXISTS sync_jobs_state_queue_idx "
            "ON sync_jobs(state, queue)");
}

bool SqliteJobQueue::Init(WorkerSet workers) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (initialized_) {
    LOG_QUEUE_ERROR("Job queue already initialized");
    return false;
  }
  if (!workers.rebuild_anchor || !workers.history_sync || !workers.continuous_sync) {
    LOG_QUEUE_ERROR("Job queue requires one worker per queue");
    return false;
  }

  workers_ = std::move(workers);

  size_t recovered = RecoverInterruptedJobs();
  if (recovered > 0) {
    LOG_QUEUE_WARN("Requeued {} job(s) interrupted by a previous shutdown", recovered);
  }

  stopping_.store(false, std::memory_order_release);
  pool_ = std::make_unique<util::ThreadPool>(options_.worker_slots, "queue-worker");
  dispatcher_ = std::thread(&SqliteJobQueue::DispatchLoop, this);
  initialized_ = true;

  LOG_QUEUE_INFO("Job queue started with {} worker slot(s)", options_.worker_slots);
  return true;
}

size_t SqliteJobQueue::RecoverInterruptedJobs() {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  db_->Prepare("UPDATE sync_jobs SET state = 'created', started_on = NULL "
               "WHERE state = 'active'")
      .Run();
  return static_cast<size_t>(db_->Changes());
}

JobHandle SqliteJobQueue::AddJob(QueueName queue, const nlohmann::json &data) {
  const std::string payload = data.dump();
  const std::string queue_name = QueueNameToString(queue);
  JobHandle handle;

  {
    std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
    store::Transaction tx(*db_);

    auto existing = db_->Prepare("SELECT id FROM sync_jobs WHERE queue = ? AND "
                                 "data = ? AND state = 'created' LIMIT 1");
    existing.Bind(1, queue_name).Bind(2, payload);
    if (existing.Step()) {
      handle.id = existing.ColumnInt64(0);
      handle.inserted = false;
      tx.Commit();
      LOG_QUEUE_DEBUG("Job {} already waiting on {}, not adding a duplicate",
                      handle.id, queue_name);
      return handle;
    }

    const int64_t now = util::GetTimeMillis();
    auto insert = db_->Prepare(
        "INSERT INTO sync_jobs (queue, data, state, start_after, created_on) "
        "VALUES (?, ?, 'created', ?, ?)");
    insert.Bind(1, queue_name).Bind(2, payload).Bind(3, now).Bind(4, now);
    insert.Run();
    handle.id = db_->LastInsertRowId();
    handle.inserted = true;
    tx.Commit();
  }

  LOG_QUEUE_DEBUG("Added job {} to {}: {}", handle.id, queue_name, payload);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    wakeup_ = true;
  }
  cv_.notify_all();
  return handle;
}

std::map<QueueName, std::vector<QueuedJob>>
SqliteJobQueue::GetJobs(JobState state, const std::vector<QueueName> &queues) {
  std::map<QueueName, std::vector<QueuedJob>> result;
  if (queues.empty()) {
    return result;
  }

  std::string sql = std::string("SELECT ") + kJobColumns +
                    " FROM sync_jobs WHERE state = ? AND queue IN (";
  for (size_t i = 0; i < queues.size(); ++i) {
    sql += (i == 0) ? "?" : ", ?";
    result[queues[i]];
  }
  sql += ") ORDER BY id";

  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  auto stmt = db_->Prepare(sql);
  stmt.Bind(1, std::string(JobStateToString(state)));
  for (size_t i = 0; i < queues.size(); ++i) {
    stmt.Bind(static_cast<int>(i + 2), std::string(QueueNameToString(queues[i])));
  }
  while (stmt.Step()) {
    QueuedJob job = ReadJob(stmt);
    result[job.queue].push_back(std::move(job));
  }
  return result;
}

std::optional<QueuedJob> SqliteJobQueue::GetJob(int64_t id) {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  auto stmt = db_->Prepare(std::string("SELECT ") + kJobColumns +
                           " FROM sync_jobs WHERE id = ?");
  stmt.Bind(1, id);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return ReadJob(stmt);
}

void SqliteJobQueue::UpdateProgress(int64_t id, int64_t current_block) {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  auto stmt = db_->Prepare("UPDATE sync_jobs SET current_block = ? WHERE id = ?");
  stmt.Bind(1, current_block).Bind(2, id);
  stmt.Run();
}

void SqliteJobQueue::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      return;
    }
    initialized_ = false;
    stopping_.store(true, std::memory_order_release);
  }
  cv_.notify_all();

  if (dispatcher_.joinable()) {
    dispatcher_.join();
  }

  // Let running jobs finish; claimed-but-unstarted tasks still run
  if (pool_) {
    pool_->shutdown();
    pool_.reset();
  }

  LOG_QUEUE_INFO("Job queue stopped");
}

bool SqliteJobQueue::WaitForIdle(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    int64_t pending = 0;
    {
      std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
      auto stmt = db_->Prepare("SELECT COUNT(*) FROM sync_jobs "
                               "WHERE state IN ('created', 'active')");
      if (stmt.Step()) {
        pending = stmt.ColumnInt64(0);
      }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    if (pending == 0 && active_count_ == 0) {
      return true;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    cv_.wait_for(lock, std::chrono::milliseconds(10));
  }
}

size_t SqliteJobQueue::PurgeCompleted(int64_t completed_before_millis) {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  auto stmt = db_->Prepare("DELETE FROM sync_jobs WHERE state = 'completed' "
                           "AND completed_on < ?");
  stmt.Bind(1, completed_before_millis);
  stmt.Run();
  return static_cast<size_t>(db_->Changes());
}

void SqliteJobQueue::DispatchLoop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_.load(std::memory_order_acquire)) {
    if (active_count_ < options_.worker_slots) {
      std::optional<QueuedJob> job;
      try {
        job = ClaimNextJob();
      } catch (const std::exception &e) {
        LOG_QUEUE_ERROR("Failed to claim next job: {}", e.what());
      }

      if (job) {
        ++active_count_;
        try {
          pool_->post([this, claimed = std::move(*job)]() mutable {
            RunJob(std::move(claimed));
          });
        } catch (const std::exception &e) {
          // Pool refused the task; the row stays active and is requeued on
          // the next Init()
          --active_count_;
          LOG_QUEUE_ERROR("Failed to dispatch job: {}", e.what());
        }
        continue;
      }
    }

    cv_.wait_for(lock, options_.poll_interval, [this] {
      return wakeup_ || stopping_.load(std::memory_order_acquire);
    });
    wakeup_ = false;
  }
}

std::optional<QueuedJob> SqliteJobQueue::ClaimNextJob() {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  store::Transaction tx(*db_);

  const int64_t now = util::GetTimeMillis();
  auto select = db_->Prepare(std::string("SELECT ") + kJobColumns +
                             " FROM sync_jobs WHERE state = 'created' AND "
                             "start_after <= ? ORDER BY id LIMIT 1");
  select.Bind(1, now);
  if (!select.Step()) {
    tx.Commit();
    return std::nullopt;
  }

  QueuedJob job = ReadJob(select);
  auto update = db_->Prepare(
      "UPDATE sync_jobs SET state = 'active', started_on = ? WHERE id = ?");
  update.Bind(1, now).Bind(2, job.id);
  update.Run();
  tx.Commit();

  job.state = JobState::Active;
  job.started_on = now;
  return job;
}

void SqliteJobQueue::RunJob(QueuedJob job) {
  std::shared_ptr<JobWorker> worker = workers_.ForQueue(job.queue);

  LOG_QUEUE_DEBUG("Running job {} on {} (attempt {})", job.id,
                  QueueNameToString(job.queue), job.retry_count + 1);

  try {
    Context ctx(*this, job);
    worker->HandleJob(ctx);
    MarkCompleted(job);
  } catch (const std::exception &e) {
    HandleFailure(job, worker, e.what());
  } catch (...) {
    HandleFailure(job, worker, "unknown error");
  }

  ReleaseSlot();
}

void SqliteJobQueue::MarkCompleted(const QueuedJob &job) {
  std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
  auto stmt = db_->Prepare("UPDATE sync_jobs SET state = 'completed', "
                           "completed_on = ? WHERE id = ?");
  stmt.Bind(1, util::GetTimeMillis()).Bind(2, job.id);
  stmt.Run();
  LOG_QUEUE_DEBUG("Job {} on {} completed", job.id, QueueNameToString(job.queue));
}

void SqliteJobQueue::HandleFailure(const QueuedJob &job,
                                   const std::shared_ptr<JobWorker> &worker,
                                   const std::string &error) {
  const int64_t now = util::GetTimeMillis();
  const bool retry = job.retry_count < options_.max_retries;

  try {
    std::lock_guard<std::recursive_mutex> db_lock(db_->mutex());
    if (retry) {
      auto stmt = db_->Prepare(
          "UPDATE sync_jobs SET state = 'created', started_on = NULL, "
          "retry_count = retry_count + 1, last_error = ?, start_after = ? "
          "WHERE id = ?");
      stmt.Bind(1, error)
          .Bind(2, now + static_cast<int64_t>(options_.retry_delay.count()))
          .Bind(3, job.id);
      stmt.Run();
    } else {
      auto stmt = db_->Prepare(
          "UPDATE sync_jobs SET state = 'failed', completed_on = ?, "
          "last_error = ? WHERE id = ?");
      stmt.Bind(1, now).Bind(2, error).Bind(3, job.id);
      stmt.Run();
    }
  } catch (const std::exception &e) {
    LOG_QUEUE_ERROR("Failed to record failure of job {}: {}", job.id, e.what());
  }

  if (retry) {
    LOG_QUEUE_WARN("Job {} on {} failed (attempt {}/{}), will retry: {}", job.id,
                   QueueNameToString(job.queue), job.retry_count + 1,
                   options_.max_retries + 1, error);
    return;
  }

  LOG_QUEUE_ERROR("Job {} on {} failed permanently after {} attempt(s): {}",
                  job.id, QueueNameToString(job.queue), job.retry_count + 1, error);

  if (!worker) {
    return;
  }
  try {
    worker->OnTerminalFailure(job, error);
  } catch (const std::exception &e) {
    LOG_QUEUE_ERROR("Terminal failure handler for job {} threw: {}", job.id, e.what());
  }
}

void SqliteJobQueue::ReleaseSlot() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_count_ > 0) {
      --active_count_;
    }
    wakeup_ = true;
  }
  cv_.notify_all();
}

} // namespace sync
} // namespace anchorsync
