#include "engine/AnnounceIngestionPipeline.hpp"
#include "engine/AsyncTaskService.hpp"
#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/PresenceStore.hpp"
#include "engine/ReachabilityTracker.hpp"
#include "engine/SchedulerService.hpp"
#include "PresenceTestUtils.hpp"

#include <chrono>
#include <thread>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using mp::engine::NodeType;
using mp::engine::ReachabilityTracker;
using mp::test::epoch_plus;
using mp::test::make_announce;
using mp::test::make_peer_id;

namespace
{

struct TrackerFixture
{
    explicit TrackerFixture(std::string_view tag,
                            ReachabilityTracker::Options options = {})
        : root(tag), store(root.db()), pipeline(store, writer, nullptr),
          tracker(store, transport, scheduler, fetch_worker, &bus, options)
    {
        REQUIRE(store.is_valid());
        fetch_worker.start();
    }

    ~TrackerFixture() { fetch_worker.stop(); }

    void add_peer(unsigned n, NodeType type = NodeType::Peer)
    {
        auto raw = make_announce(n, epoch_plus(0ms), 3);
        raw.node_type = type;
        REQUIRE(pipeline.ingest(raw));
    }

    mp::test::TempRoot root;
    mp::engine::PresenceStore store;
    mp::test::FakeTransport transport;
    mp::engine::SchedulerService scheduler;
    mp::engine::AsyncTaskService writer{"ingest"};
    mp::engine::AsyncTaskService fetch_worker{"path-table"};
    mp::engine::EventBus bus;
    mp::engine::AnnounceIngestionPipeline pipeline;
    ReachabilityTracker tracker;
};

} // namespace

TEST_CASE("reachable count follows the path table while peers stay known")
{
    TrackerFixture fx("reach-scenario");
    fx.add_peer(1);

    fx.transport.set_path_table({make_peer_id(1)});
    auto count = fx.tracker.recompute();
    REQUIRE(count);
    CHECK(*count == 1);
    CHECK(fx.tracker.current() == 1);

    fx.transport.set_path_table({});
    count = fx.tracker.recompute();
    REQUIRE(count);
    CHECK(*count == 0);
    CHECK(fx.tracker.current() == 0);

    // Still known even though unreachable.
    CHECK(fx.store.find(make_peer_id(1)).has_value());
}

TEST_CASE("recompute leaves the count alone while the network is not ready")
{
    TrackerFixture fx("reach-not-ready");
    fx.add_peer(1);
    fx.add_peer(2);
    fx.transport.set_path_table({make_peer_id(1), make_peer_id(2)});
    REQUIRE(fx.tracker.recompute() == 2);

    fx.transport.set_path_table({});
    for (auto status : {mp::engine::NetworkStatus::Initializing,
                        mp::engine::NetworkStatus::Connecting,
                        mp::engine::NetworkStatus::Error,
                        mp::engine::NetworkStatus::Shutdown})
    {
        fx.transport.set_status(status);
        CHECK_FALSE(fx.tracker.recompute().has_value());
        CHECK(fx.tracker.current() == 2);
    }
    CHECK(fx.transport.snapshot_calls() == 1);
}

TEST_CASE("a failing path table fetch keeps the last count")
{
    TrackerFixture fx("reach-failure");
    fx.add_peer(1);
    fx.transport.set_path_table({make_peer_id(1)});
    REQUIRE(fx.tracker.recompute() == 1);

    fx.transport.set_fail_snapshot(true);
    CHECK_FALSE(fx.tracker.recompute().has_value());
    CHECK(fx.tracker.current() == 1);
}

TEST_CASE("a slow path table fetch times out")
{
    ReachabilityTracker::Options options;
    options.fetch_timeout = 20ms;
    TrackerFixture fx("reach-timeout", options);
    fx.add_peer(1);
    fx.transport.set_path_table({make_peer_id(1)});
    fx.transport.set_snapshot_delay(300ms);

    CHECK_FALSE(fx.tracker.recompute().has_value());
    CHECK(fx.tracker.current() == 0);

    fx.transport.set_snapshot_delay(0ms);
    fx.tracker.set_fetch_timeout(2s);
    CHECK(fx.tracker.recompute() == 1);
}

TEST_CASE("recomputes behind a stuck fetch reuse it instead of queueing more")
{
    ReachabilityTracker::Options options;
    options.fetch_timeout = 20ms;
    TrackerFixture fx("reach-stuck-fetch", options);
    fx.add_peer(1);
    fx.add_peer(2);
    fx.transport.set_path_table({make_peer_id(1)});
    fx.transport.set_snapshot_delay(600ms);

    CHECK_FALSE(fx.tracker.recompute().has_value());
    fx.transport.set_snapshot_delay(0ms);
    for (int i = 0; i < 5; ++i)
    {
        CHECK_FALSE(fx.tracker.recompute().has_value());
    }
    CHECK(fx.tracker.fetch_in_flight());
    CHECK(fx.transport.snapshot_calls() == 1);
    CHECK(fx.fetch_worker.pending() == 0);

    // Announce-triggered requests must not wait on the stuck fetch.
    fx.tracker.set_fetch_timeout(2s);
    auto const started = std::chrono::steady_clock::now();
    CHECK_FALSE(fx.tracker.request_eager_recompute().has_value());
    CHECK(std::chrono::steady_clock::now() - started < 200ms);

    auto const deadline = std::chrono::steady_clock::now() + 5s;
    while (fx.tracker.fetch_in_flight() &&
           std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(5ms);
    }
    REQUIRE_FALSE(fx.tracker.fetch_in_flight());

    // The finished slow result is stale; a fresh fetch answers.
    fx.transport.set_path_table({make_peer_id(1), make_peer_id(2)});
    fx.tracker.set_fetch_timeout(1s);
    CHECK(fx.tracker.recompute() == 2);
    CHECK(fx.tracker.current() == 2);
    CHECK(fx.transport.snapshot_calls() == 2);
}

TEST_CASE("only the configured node types count as reachable")
{
    TrackerFixture fx("reach-node-types");
    fx.add_peer(1, NodeType::Peer);
    fx.add_peer(2, NodeType::Node);
    fx.add_peer(3, NodeType::PropagationNode);
    fx.transport.set_path_table(
        {make_peer_id(1), make_peer_id(2), make_peer_id(3), make_peer_id(77)});

    CHECK(fx.tracker.recompute() == 2);

    fx.tracker.set_node_types({NodeType::PropagationNode});
    CHECK(fx.tracker.recompute() == 1);
}

TEST_CASE("count observers see the latest value and changes only")
{
    TrackerFixture fx("reach-observers");
    std::vector<int> first;
    std::vector<int> second;
    std::vector<int> events;
    fx.tracker.count().subscribe([&](int value) { first.push_back(value); });
    fx.bus.subscribe<mp::engine::ReachabilityChangedEvent>(
        [&](mp::engine::ReachabilityChangedEvent const &event)
        { events.push_back(event.reachable); });

    fx.add_peer(1);
    fx.transport.set_path_table({make_peer_id(1)});
    fx.tracker.recompute();
    fx.tracker.recompute();

    fx.tracker.count().subscribe([&](int value) { second.push_back(value); });

    CHECK(first == std::vector<int>{0, 1});
    CHECK(second == std::vector<int>{1});
    CHECK(events == std::vector<int>{1});
}

TEST_CASE("eager requests inside the coalesce window are dropped")
{
    ReachabilityTracker::Options options;
    options.coalesce_window = 10s;
    TrackerFixture fx("reach-coalesce", options);
    fx.add_peer(1);
    fx.transport.set_path_table({make_peer_id(1)});

    CHECK(fx.tracker.request_eager_recompute() == 1);
    CHECK_FALSE(fx.tracker.request_eager_recompute().has_value());
    CHECK(fx.transport.snapshot_calls() == 1);

    fx.tracker.set_coalesce_window(0ms);
    CHECK(fx.tracker.request_eager_recompute() == 1);
    CHECK(fx.transport.snapshot_calls() == 2);
}

TEST_CASE("periodic recompute runs from the scheduler without duplicates")
{
    TrackerFixture fx("reach-periodic");
    fx.add_peer(1);
    fx.transport.set_path_table({make_peer_id(1)});

    auto const t0 = mp::engine::SchedulerService::Clock::now();
    fx.tracker.start(30s);
    fx.tracker.start(30s);
    CHECK(fx.tracker.is_periodic());
    CHECK(fx.scheduler.task_count() == 1);

    CHECK(fx.scheduler.tick(t0 + 31s) == 1);
    CHECK(fx.tracker.current() == 1);
    CHECK(fx.transport.snapshot_calls() == 1);

    fx.tracker.restart(60s);
    CHECK(fx.scheduler.task_count() == 1);

    fx.tracker.stop();
    CHECK_FALSE(fx.tracker.is_periodic());
    CHECK(fx.scheduler.tick(t0 + 10min) == 0);

    fx.tracker.start(0ms);
    CHECK_FALSE(fx.tracker.is_periodic());
}
