// Copyright (c) 2024 AnchorSync Developers
// Unit tests for util: PeriodicTask, ThreadPool, time and files

#include <catch2/catch_test_macros.hpp>
#include "util/files.hpp"
#include "util/periodic_task.hpp"
#include "util/threadpool.hpp"
#include "util/time.hpp"
#include "sync/test_helpers.hpp"
#include <atomic>
#include <future>
#include <memory>
#include <stdexcept>

using namespace anchorsync;
using namespace anchorsync::util;

TEST_CASE("PeriodicTask - runs on its interval until cancelled", "[unit][util][periodic_task]") {
    std::atomic<int> runs{0};
    PeriodicTask task("test", std::chrono::milliseconds(5), [&] { ++runs; });

    CHECK(task.running());
    CHECK(task.name() == "test");
    REQUIRE(test::WaitFor([&] { return runs.load() >= 3; }));

    task.Cancel();
    CHECK_FALSE(task.running());
    const int after_cancel = runs.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK(runs.load() == after_cancel);

    // Second cancel is harmless
    task.Cancel();
}

TEST_CASE("PeriodicTask - exceptions do not stop the schedule", "[unit][util][periodic_task]") {
    std::atomic<int> runs{0};
    PeriodicTask task("throwing", std::chrono::milliseconds(5), [&] {
        ++runs;
        throw std::runtime_error("status unavailable");
    });

    CHECK(test::WaitFor([&] { return runs.load() >= 2; }));
}

TEST_CASE("PeriodicTask - long interval does not delay cancel", "[unit][util][periodic_task]") {
    std::atomic<int> runs{0};
    PeriodicTask task("slow", std::chrono::hours(1), [&] { ++runs; }, true);

    REQUIRE(test::WaitFor([&] { return runs.load() == 1; }));
    const auto start = std::chrono::steady_clock::now();
    task.Cancel();
    CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST_CASE("PeriodicTask - a task may cancel itself", "[unit][util][periodic_task]") {
    std::atomic<int> runs{0};
    std::promise<void> constructed;
    std::shared_future<void> ready = constructed.get_future().share();
    PeriodicTask *self = nullptr;

    PeriodicTask task("self-cancel", std::chrono::milliseconds(5), [&] {
        ready.wait();
        ++runs;
        self->Cancel();
    });
    self = &task;
    constructed.set_value();

    REQUIRE(test::WaitFor([&] { return !task.running(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK(runs.load() == 1);
}

TEST_CASE("PeriodicTask - a task may destroy its own handle", "[unit][util][periodic_task]") {
    std::atomic<int> runs{0};
    std::atomic<bool> destroyed{false};
    std::promise<void> constructed;
    std::shared_future<void> ready = constructed.get_future().share();

    std::unique_ptr<PeriodicTask> task;
    task = std::make_unique<PeriodicTask>("self-destroy", std::chrono::milliseconds(5), [&] {
        ready.wait();
        ++runs;
        task.reset();
        destroyed = true;
    });
    constructed.set_value();

    REQUIRE(test::WaitFor([&] { return destroyed.load(); }));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    CHECK(runs.load() == 1);
}

TEST_CASE("ThreadPool - runs submitted tasks", "[unit][util][threadpool]") {
    ThreadPool pool(3);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 10; ++i) {
        results.push_back(pool.enqueue([i] { return i * i; }));
    }
    int sum = 0;
    for (auto &r : results) sum += r.get();
    CHECK(sum == 285);

    pool.shutdown();
    CHECK_THROWS_AS(pool.enqueue([] { return 0; }), std::runtime_error);
}

TEST_CASE("ThreadPool - a throwing posted task does not kill its worker", "[unit][util][threadpool]") {
    ThreadPool pool(1, "single");
    CHECK(pool.name() == "single");

    std::atomic<int> ran{0};
    pool.post([] { throw std::runtime_error("handler failed"); });
    pool.post([&] { ++ran; });

    REQUIRE(test::WaitFor([&] { return ran.load() == 1; }));
    CHECK(pool.pending() == 0);

    // enqueue() carries the exception to the caller instead
    auto f = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    CHECK_THROWS_AS(f.get(), std::runtime_error);
}

TEST_CASE("FormatIso8601Millis - UTC with milliseconds", "[unit][util][time]") {
    CHECK(FormatIso8601Millis(0) == "1970-01-01T00:00:00.000Z");
    CHECK(FormatIso8601Millis(1677012000867) == "2023-02-21T20:40:00.867Z");
}

TEST_CASE("MockTimeScope - pins and restores the clock", "[unit][util][time]") {
    REQUIRE(GetMockTime() == 0);
    {
        MockTimeScope scope(1000);
        CHECK(GetTime() == 1000);
        CHECK(GetTimeMillis() == 1000000);
    }
    CHECK(GetMockTime() == 0);
}

TEST_CASE("sync_db_path - lives in the data directory", "[unit][util][files]") {
    CHECK(sync_db_path("/var/lib/anchorsync") == std::filesystem::path("/var/lib/anchorsync/sync.db"));

    const std::filesystem::path dir = "/tmp/anchorsync_test_datadir/nested";
    std::filesystem::remove_all("/tmp/anchorsync_test_datadir");
    CHECK(ensure_directory(dir));
    CHECK(std::filesystem::is_directory(dir));
    CHECK(ensure_directory(dir));
}
