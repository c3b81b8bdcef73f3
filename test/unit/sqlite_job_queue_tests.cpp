// Copyright (c) 2024 AnchorSync Developers
// Unit tests for SqliteJobQueue
// Dispatch, dedup, retries and recovery after a crash

#include <catch2/catch_test_macros.hpp>
#include "store/database.hpp"
#include "sync/sqlite_job_queue.hpp"
#include "sync/test_helpers.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <stdexcept>

using namespace anchorsync;
using namespace anchorsync::sync;
using namespace anchorsync::test;
using json = nlohmann::json;

namespace {

class ScriptedWorker : public JobWorker {
public:
    void HandleJob(JobContext &ctx) override {
        ++runs;
        if (script) script(ctx);
    }

    void OnTerminalFailure(const QueuedJob &job, const std::string &error) override {
        std::lock_guard<std::mutex> lock(mutex);
        terminal.emplace_back(job.id, error);
    }

    std::function<void(JobContext &)> script;
    std::atomic<int> runs{0};
    std::mutex mutex;
    std::vector<std::pair<int64_t, std::string>> terminal;
};

WorkerSet AllQueues(const std::shared_ptr<ScriptedWorker> &worker) {
    WorkerSet set;
    set.rebuild_anchor = worker;
    set.history_sync = worker;
    set.continuous_sync = worker;
    return set;
}

SqliteJobQueue::Options FastOptions() {
    SqliteJobQueue::Options options;
    options.worker_slots = 2;
    options.max_retries = 2;
    options.retry_delay = std::chrono::milliseconds(0);
    options.poll_interval = std::chrono::milliseconds(10);
    return options;
}

json Payload(int64_t from, int64_t to) {
    return SyncJobRequest{SyncJobKind::Catchup, from, to, {"m"}};
}

} // namespace

TEST_CASE("SqliteJobQueue - runs a job to completion", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_complete"), FastOptions());
    auto worker = std::make_shared<ScriptedWorker>();

    auto handle = queue.AddJob(QueueName::Historical, Payload(0, 10));
    CHECK(handle.inserted);
    REQUIRE(queue.Init(AllQueues(worker)));
    REQUIRE(queue.WaitForIdle(std::chrono::seconds(5)));

    auto job = queue.GetJob(handle.id);
    REQUIRE(job.has_value());
    CHECK(job->state == JobState::Completed);
    CHECK(job->queue == QueueName::Historical);
    CHECK(job->data == Payload(0, 10));
    CHECK(job->started_on.has_value());
    CHECK(job->completed_on.has_value());
    CHECK(worker->runs == 1);
    queue.Stop();
}

TEST_CASE("SqliteJobQueue - identical waiting jobs are not duplicated", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_dedup"), FastOptions());

    auto first = queue.AddJob(QueueName::Historical, Payload(0, 10));
    auto second = queue.AddJob(QueueName::Historical, Payload(0, 10));
    auto other_range = queue.AddJob(QueueName::Historical, Payload(0, 11));
    auto other_queue = queue.AddJob(QueueName::Continuous, Payload(0, 10));

    CHECK(first.inserted);
    CHECK_FALSE(second.inserted);
    CHECK(second.id == first.id);
    CHECK(other_range.inserted);
    CHECK(other_queue.inserted);

    auto jobs = queue.GetJobs(JobState::Created, {QueueName::Historical, QueueName::Continuous});
    CHECK(jobs[QueueName::Historical].size() == 2);
    CHECK(jobs[QueueName::Continuous].size() == 1);
}

TEST_CASE("SqliteJobQueue - GetJobs reports every requested queue", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_getjobs"), FastOptions());
    queue.AddJob(QueueName::Rebuild, json{{"models", {"m"}}});

    auto jobs = queue.GetJobs(JobState::Created, {QueueName::Continuous, QueueName::Historical});
    REQUIRE(jobs.size() == 2);
    CHECK(jobs.count(QueueName::Continuous) == 1);
    CHECK(jobs.count(QueueName::Historical) == 1);
    CHECK(jobs[QueueName::Continuous].empty());
    CHECK(jobs[QueueName::Historical].empty());
    CHECK(jobs.count(QueueName::Rebuild) == 0);

    CHECK(queue.GetJobs(JobState::Created, {}).empty());
}

TEST_CASE("SqliteJobQueue - failed jobs are retried", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_retry"), FastOptions());
    auto worker = std::make_shared<ScriptedWorker>();
    std::atomic<int> attempts{0};
    worker->script = [&](JobContext &) {
        if (++attempts <= 2) throw std::runtime_error("boom");
    };

    auto handle = queue.AddJob(QueueName::Continuous, Payload(3, 3));
    REQUIRE(queue.Init(AllQueues(worker)));
    REQUIRE(queue.WaitForIdle(std::chrono::seconds(5)));

    auto job = queue.GetJob(handle.id);
    REQUIRE(job.has_value());
    CHECK(job->state == JobState::Completed);
    CHECK(job->retry_count == 2);
    CHECK(job->last_error == "boom");
    CHECK(worker->runs == 3);
    CHECK(worker->terminal.empty());
    queue.Stop();
}

TEST_CASE("SqliteJobQueue - terminal failure notifies the worker once", "[unit][job_queue]") {
    auto options = FastOptions();
    options.max_retries = 1;
    SqliteJobQueue queue(TempDbPath("queue_terminal"), options);
    auto worker = std::make_shared<ScriptedWorker>();
    worker->script = [](JobContext &) { throw std::runtime_error("chain unreachable"); };

    auto handle = queue.AddJob(QueueName::Historical, Payload(0, 10));
    REQUIRE(queue.Init(AllQueues(worker)));
    REQUIRE(queue.WaitForIdle(std::chrono::seconds(5)));

    auto job = queue.GetJob(handle.id);
    REQUIRE(job.has_value());
    CHECK(job->state == JobState::Failed);
    CHECK(job->last_error == "chain unreachable");
    CHECK(worker->runs == 2);

    std::lock_guard<std::mutex> lock(worker->mutex);
    REQUIRE(worker->terminal.size() == 1);
    CHECK(worker->terminal[0].first == handle.id);
    CHECK(worker->terminal[0].second == "chain unreachable");
}

TEST_CASE("SqliteJobQueue - progress cursor survives a retry", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_progress"), FastOptions());
    auto worker = std::make_shared<ScriptedWorker>();
    std::mutex seen_mutex;
    std::vector<std::optional<int64_t>> seen;
    worker->script = [&](JobContext &ctx) {
        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.push_back(ctx.job().current_block);
        }
        if (!ctx.job().current_block) {
            ctx.UpdateProgress(42);
            throw std::runtime_error("interrupted");
        }
    };

    auto handle = queue.AddJob(QueueName::Historical, Payload(0, 100));
    REQUIRE(queue.Init(AllQueues(worker)));
    REQUIRE(queue.WaitForIdle(std::chrono::seconds(5)));
    queue.Stop();

    std::lock_guard<std::mutex> lock(seen_mutex);
    REQUIRE(seen.size() == 2);
    CHECK_FALSE(seen[0].has_value());
    CHECK(seen[1] == std::optional<int64_t>(42));
    CHECK(queue.GetJob(handle.id)->current_block == std::optional<int64_t>(42));
}

TEST_CASE("SqliteJobQueue - interrupted jobs run again after restart", "[unit][job_queue]") {
    const std::string path = TempDbPath("queue_recover");
    int64_t id = 0;
    {
        SqliteJobQueue queue(path, FastOptions());
        id = queue.AddJob(QueueName::Historical, Payload(0, 10)).id;
    }
    {
        // Simulate a crash while the job was running
        store::Database db(path);
        db.Exec("UPDATE sync_jobs SET state = 'active', started_on = 1 WHERE id = " +
                std::to_string(id));
    }

    SqliteJobQueue queue(path, FastOptions());
    REQUIRE(queue.GetJobs(JobState::Active, {QueueName::Historical})[QueueName::Historical].size() == 1);

    auto worker = std::make_shared<ScriptedWorker>();
    REQUIRE(queue.Init(AllQueues(worker)));
    REQUIRE(queue.WaitForIdle(std::chrono::seconds(5)));

    CHECK(worker->runs == 1);
    CHECK(queue.GetJob(id)->state == JobState::Completed);
    queue.Stop();
}

TEST_CASE("SqliteJobQueue - Init validates workers", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_init"), FastOptions());
    auto worker = std::make_shared<ScriptedWorker>();

    WorkerSet missing = AllQueues(worker);
    missing.rebuild_anchor = nullptr;
    CHECK_FALSE(queue.Init(missing));

    CHECK(queue.Init(AllQueues(worker)));
    CHECK_FALSE(queue.Init(AllQueues(worker)));
    queue.Stop();
    queue.Stop();
}

TEST_CASE("SqliteJobQueue - Stop waits for the running job", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_stop"), FastOptions());
    auto worker = std::make_shared<ScriptedWorker>();
    std::atomic<bool> finished{false};
    worker->script = [&](JobContext &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        finished = true;
    };

    queue.AddJob(QueueName::Historical, Payload(0, 10));
    REQUIRE(queue.Init(AllQueues(worker)));
    REQUIRE(WaitFor([&] { return worker->runs.load() == 1; }));

    queue.Stop();
    CHECK(finished);
}

TEST_CASE("SqliteJobQueue - PurgeCompleted removes finished jobs only", "[unit][job_queue]") {
    SqliteJobQueue queue(TempDbPath("queue_purge"), FastOptions());
    auto worker = std::make_shared<ScriptedWorker>();

    auto done = queue.AddJob(QueueName::Historical, Payload(0, 10));
    REQUIRE(queue.Init(AllQueues(worker)));
    REQUIRE(queue.WaitForIdle(std::chrono::seconds(5)));
    queue.Stop();

    auto waiting = queue.AddJob(QueueName::Historical, Payload(10, 20));

    const int64_t later = *queue.GetJob(done.id)->completed_on + 1;
    CHECK(queue.PurgeCompleted(later) == 1);
    CHECK_FALSE(queue.GetJob(done.id).has_value());
    CHECK(queue.GetJob(waiting.id).has_value());
}
