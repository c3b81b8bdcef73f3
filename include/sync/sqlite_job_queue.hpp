// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_SQLITE_JOB_QUEUE_HPP
#define ANCHORSYNC_SYNC_SQLITE_JOB_QUEUE_HPP

#include "sync/job_queue.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace anchorsync {

namespace store {
class Database;
}

namespace util {
class ThreadPool;
}

namespace sync {

/**
 * SqliteJobQueue - persistent JobQueue backed by a SQLite table
 *
 * Jobs survive restarts: anything still `created` is picked up again on the
 * next Init(), and jobs that were `active` when the process died are reset
 * to `created` first.
 *
 * Dispatch
 * - One dispatcher thread claims the oldest runnable job whenever a worker
 *   slot is free and hands it to the thread pool
 * - A job is runnable when it is `created` and its retry backoff expired
 *
 * Retries
 * - A worker exception puts the job back to `created` with a backoff of
 *   retry_delay, until max_retries is exceeded
 * - Then the job becomes `failed` and the worker's OnTerminalFailure runs
 */
class SqliteJobQueue : public JobQueue {
public:
  struct Options {
    size_t worker_slots{4};
    int max_retries{5};
    std::chrono::milliseconds retry_delay{10000};
    // Upper bound on how long the dispatcher sleeps between scans
    std::chrono::milliseconds poll_interval{500};
  };

  // Opens (and if needed creates) the job table in the database at db_path
  explicit SqliteJobQueue(const std::string &db_path);
  SqliteJobQueue(const std::string &db_path, const Options &options);
  ~SqliteJobQueue() override;

  SqliteJobQueue(const SqliteJobQueue &) = delete;
  SqliteJobQueue &operator=(const SqliteJobQueue &) = delete;

  bool Init(WorkerSet workers) override;
  JobHandle AddJob(QueueName queue, const nlohmann::json &data) override;
  std::map<QueueName, std::vector<QueuedJob>>
  GetJobs(JobState state, const std::vector<QueueName> &queues) override;
  size_t PurgeCompleted(int64_t completed_before_millis) override;
  void Stop() override;

  std::optional<QueuedJob> GetJob(int64_t id);

  // Record a worker's progress cursor
  void UpdateProgress(int64_t id, int64_t current_block);

  // Block until no job is waiting or running, or the timeout expires.
  // Jobs in retry backoff count as waiting.
  bool WaitForIdle(std::chrono::milliseconds timeout);


private:
  class Context;

  void EnsureSchema();
  size_t RecoverInterruptedJobs();
  void DispatchLoop();
  std::optional<QueuedJob> ClaimNextJob();
  void RunJob(QueuedJob job);
  void MarkCompleted(const QueuedJob &job);
  void HandleFailure(const QueuedJob &job, const std::shared_ptr<JobWorker> &worker,
                     const std::string &error);
  void ReleaseSlot();

  Options options_;
  std::unique_ptr<store::Database> db_;
  WorkerSet workers_;

  std::unique_ptr<util::ThreadPool> pool_;
  std::thread dispatcher_;

  std::mutex mutex_;
  std::condition_variable cv_;
  size_t active_count_{0};
  bool wakeup_{false};
  bool initialized_{false};
  std::atomic<bool> stopping_{false};
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_SQLITE_JOB_QUEUE_HPP
