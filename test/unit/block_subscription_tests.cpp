// Copyright (c) 2024 AnchorSync Developers
// Unit tests for BlockSubscription and PollingBlockListener

#include <catch2/catch_test_macros.hpp>
#include "sync/block_subscription.hpp"
#include "sync/polling_block_listener.hpp"
#include "sync/test_helpers.hpp"
#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

using namespace anchorsync;
using namespace anchorsync::sync;
using namespace anchorsync::test;

TEST_CASE("BlockSubscription - delivers events in order without overlap", "[unit][subscription]") {
    auto listener = std::make_unique<ManualBlockListener>();
    ManualBlockListener *raw = listener.get();

    std::mutex mutex;
    std::vector<int64_t> handled;
    std::atomic<int> in_handler{0};
    std::atomic<bool> overlapped{false};

    BlockSubscription subscription(std::move(listener), [&](const BlockConfirmationEvent &event) {
        if (++in_handler > 1) overlapped = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        {
            std::lock_guard<std::mutex> lock(mutex);
            handled.push_back(event.block.number);
        }
        --in_handler;
    });

    CHECK(raw->started());
    std::thread producer([&] {
        for (int64_t n = 1; n <= 20; ++n) raw->EmitBlock(n);
    });
    producer.join();

    REQUIRE(WaitFor([&] { return subscription.delivered() == 20; }));
    CHECK_FALSE(overlapped);
    std::lock_guard<std::mutex> lock(mutex);
    for (size_t i = 0; i < handled.size(); ++i) {
        CHECK(handled[i] == static_cast<int64_t>(i + 1));
    }
}

TEST_CASE("BlockSubscription - a throwing handler does not stop delivery", "[unit][subscription]") {
    auto listener = std::make_unique<ManualBlockListener>();
    ManualBlockListener *raw = listener.get();
    std::atomic<int> calls{0};

    BlockSubscription subscription(std::move(listener), [&](const BlockConfirmationEvent &event) {
        ++calls;
        if (event.block.number == 1) throw std::runtime_error("handler failed");
    });

    raw->EmitBlock(1);
    raw->EmitBlock(2);
    REQUIRE(WaitFor([&] { return subscription.delivered() == 2; }));
    CHECK(calls == 2);
}

TEST_CASE("BlockSubscription - Unsubscribe stops the listener and is idempotent", "[unit][subscription]") {
    auto listener = std::make_unique<ManualBlockListener>();
    ManualBlockListener *raw = listener.get();
    std::atomic<int> calls{0};

    BlockSubscription subscription(std::move(listener),
                                   [&](const BlockConfirmationEvent &) { ++calls; });
    raw->EmitBlock(1);
    subscription.Unsubscribe();

    CHECK_FALSE(subscription.active());
    CHECK(raw->stopped());
    // Events received before unsubscribing are still handled
    CHECK(calls == 1);

    raw->EmitBlock(2);
    subscription.Unsubscribe();
    CHECK(calls == 1);
}

namespace {

struct PollingFixture {
    explicit PollingFixture(int64_t head, int64_t start) : provider(head) {
        params.confirmations = 3;
        params.chain_id = "eip155:1337";
        params.provider = &provider;
        params.expected_parent_hash = provider.GetBlockByNumber(start).hash;
        params.start_block_number = start;
        options.poll_interval = std::chrono::hours(1);
    }

    void Start(PollingBlockListener &listener) {
        listener.Start([this](const BlockConfirmationEvent &event) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(event);
        });
    }

    std::vector<BlockConfirmationEvent> Events() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    FakeChainProvider provider;
    BlockListenerParams params;
    PollingBlockListener::Options options;
    std::mutex mutex;
    std::vector<BlockConfirmationEvent> events;
};

} // namespace

TEST_CASE("BlockSubscription - a listener that cannot start fails construction", "[unit][subscription]") {
    std::atomic<int> handled{0};
    CHECK_THROWS_AS(BlockSubscription(std::make_unique<FailingBlockListener>(),
                                      [&](const BlockConfirmationEvent &) { ++handled; }),
                    std::runtime_error);
    CHECK(handled == 0);
}

TEST_CASE("PollingBlockListener - emits each newly confirmed block", "[unit][polling_listener]") {
    PollingFixture f(13, 10);  // confirmed tip = 10
    PollingBlockListener listener(f.params, f.options);
    f.Start(listener);

    f.provider.ExtendTo(16);  // confirmed tip = 13
    listener.PollOnce();

    REQUIRE(WaitFor([&] { return f.Events().size() == 3; }));
    auto events = f.Events();
    for (size_t i = 0; i < events.size(); ++i) {
        CHECK(events[i].block.number == static_cast<int64_t>(11 + i));
        CHECK_FALSE(events[i].reorganized);
    }

    // Nothing new
    listener.PollOnce();
    CHECK(f.Events().size() == 3);
    listener.Stop();
}

TEST_CASE("PollingBlockListener - parent mismatch is reported as a reorganization", "[unit][polling_listener]") {
    PollingFixture f(13, 10);
    PollingBlockListener listener(f.params, f.options);
    f.Start(listener);

    f.provider.ExtendTo(14);
    listener.PollOnce();
    REQUIRE(WaitFor([&] { return f.Events().size() == 1; }));

    // Block 11 is replaced after it was emitted
    f.provider.ReorgFrom(11, "fork");
    f.provider.ExtendTo(15);
    listener.PollOnce();

    REQUIRE(WaitFor([&] { return f.Events().size() == 2; }));
    auto event = f.Events()[1];
    CHECK(event.block.number == 12);
    CHECK(event.reorganized);
    CHECK(event.expected_parent_hash == std::optional<std::string>("0xforkblock11"));
    listener.Stop();
}

TEST_CASE("PollingBlockListener - provider errors skip the poll", "[unit][polling_listener]") {
    PollingFixture f(13, 10);
    PollingBlockListener listener(f.params, f.options);
    f.Start(listener);

    f.provider.SetFailing(true);
    f.provider.ExtendTo(15);
    REQUIRE_NOTHROW(listener.PollOnce());
    CHECK(f.Events().empty());

    f.provider.SetFailing(false);
    listener.PollOnce();
    REQUIRE(WaitFor([&] { return f.Events().size() == 2; }));
    CHECK(f.Events()[0].block.number == 11);
    listener.Stop();
}

TEST_CASE("PollingBlockListener - no callbacks after Stop", "[unit][polling_listener]") {
    PollingFixture f(13, 10);
    PollingBlockListener listener(f.params, f.options);
    f.Start(listener);
    listener.Stop();

    f.provider.ExtendTo(20);
    listener.PollOnce();
    CHECK(f.Events().empty());
}
