// Copyright (c) 2024 AnchorSync Developers
// Distributed under the MIT software license

#ifndef ANCHORSYNC_SYNC_JOB_QUEUE_HPP
#define ANCHORSYNC_SYNC_JOB_QUEUE_HPP

#include "sync/sync_job.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace anchorsync {
namespace sync {

enum class JobState {
  Created,
  Active,
  Completed,
  Failed,
};

const char *JobStateToString(JobState state);
std::optional<JobState> JobStateFromString(const std::string &name);

/**
 * QueuedJob - a job record as maintained by the queue
 *
 * Timestamps are milliseconds since epoch. current_block is the progress
 * cursor a worker may advance while running a ranged job.
 */
struct QueuedJob {
  int64_t id{0};
  QueueName queue{QueueName::Historical};
  nlohmann::json data;
  std::optional<int64_t> current_block;
  JobState state{JobState::Created};
  int retry_count{0};
  std::string last_error;
  int64_t created_on{0};
  std::optional<int64_t> started_on;
  std::optional<int64_t> completed_on;

  // Decode data as a sync request (throws on malformed payloads)
  SyncJobRequest sync_request() const { return data.get<SyncJobRequest>(); }
};

struct JobHandle {
  int64_t id{0};
  // False when an identical job was already waiting and no row was added
  bool inserted{false};
};

/**
 * Handed to a worker for the duration of one job run
 */
class JobContext {
public:
  virtual ~JobContext() = default;

  virtual const QueuedJob &job() const = 0;

  // Persist the worker's progress cursor for this job
  virtual void UpdateProgress(int64_t current_block) = 0;
};

/**
 * JobWorker - executes jobs of one queue
 *
 * HandleJob reports failure by throwing. The queue owns the retry policy;
 * OnTerminalFailure is called once when a job will not be retried again.
 */
class JobWorker {
public:
  virtual ~JobWorker() = default;

  virtual void HandleJob(JobContext &ctx) = 0;

  virtual void OnTerminalFailure(const QueuedJob &job, const std::string &error) {}
};

/**
 * One worker per queue, registered at startup
 */
struct WorkerSet {
  std::shared_ptr<JobWorker> rebuild_anchor;
  std::shared_ptr<JobWorker> history_sync;
  std::shared_ptr<JobWorker> continuous_sync;

  std::shared_ptr<JobWorker> ForQueue(QueueName queue) const {
    switch (queue) {
    case QueueName::Historical:
      return history_sync;
    case QueueName::Continuous:
      return continuous_sync;
    case QueueName::Rebuild:
      return rebuild_anchor;
    }
    return nullptr;
  }
};

/**
 * JobQueue - named-queue task scheduler
 *
 * AddJob is fire-and-forget: it returns once the job is recorded, never
 * after it ran. Execution is at-least-once, so workers must tolerate
 * re-running a range that was already applied.
 */
class JobQueue {
public:
  virtual ~JobQueue() = default;

  // Register workers and start dispatch. Returns false if already
  // initialized or a worker is missing.
  virtual bool Init(WorkerSet workers) = 0;

  virtual JobHandle AddJob(QueueName queue, const nlohmann::json &data) = 0;

  // Point-in-time snapshot keyed by queue; every requested queue is present
  // in the result, possibly with no jobs
  virtual std::map<QueueName, std::vector<QueuedJob>>
  GetJobs(JobState state, const std::vector<QueueName> &queues) = 0;

  // Delete completed jobs that finished before the cutoff (epoch millis).
  // Returns the number of jobs removed.
  virtual size_t PurgeCompleted(int64_t completed_before_millis) = 0;

  // Stop dispatch and wait for running jobs to finish
  virtual void Stop() = 0;
};

} // namespace sync
} // namespace anchorsync

#endif // ANCHORSYNC_SYNC_JOB_QUEUE_HPP
