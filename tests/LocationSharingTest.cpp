#include "engine/EventBus.hpp"
#include "engine/Events.hpp"
#include "engine/LocationSharingManager.hpp"
#include "engine/LocationTelemetry.hpp"
#include "engine/PresenceStore.hpp"
#include "engine/PresenceUtils.hpp"
#include "utils/Hex.hpp"
#include "utils/Json.hpp"
#include "PresenceTestUtils.hpp"

#include <chrono>
#include <cmath>
#include <format>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using mp::engine::LocationSharingManager;
using mp::engine::PeerId;
using mp::engine::Relationship;
using mp::test::make_peer_id;

namespace
{

struct SharingFixture
{
    explicit SharingFixture(std::string_view tag)
        : root(tag), store(root.db()),
          manager(store, store, &bus, clock.wall())
    {
        REQUIRE(store.is_valid());
        manager.set_telemetry_sink(
            [this](PeerId const &peer, std::string const &payload)
            {
                sent.emplace_back(peer, payload);
                return true;
            });
    }

    mp::test::TempRoot root;
    mp::test::ManualClock clock;
    mp::engine::EventBus bus;
    mp::engine::PresenceStore store;
    LocationSharingManager manager;
    std::vector<std::pair<PeerId, std::string>> sent;
};

std::string location_payload(PeerId const &sender, double lat, double lng,
                             mp::engine::TimePoint ts)
{
    return std::format(
        R"({{"source_hash":"{}","lat":{},"lng":{},"acc":5.0,"ts":{},)"
        R"("expires":null,"approxRadius":0,"cease":false}})",
        sender, lat, lng, mp::engine::to_unix_millis(ts));
}

std::string cease_payload(PeerId const &sender, mp::engine::TimePoint ts)
{
    return std::format(
        R"({{"source_hash":"{}","lat":0,"lng":0,"acc":0,"ts":{},"cease":true}})",
        sender, mp::engine::to_unix_millis(ts));
}

} // namespace

TEST_CASE("relationship_with follows the sharing truth table")
{
    SharingFixture fx("sharing-truth-table");
    auto const none = make_peer_id(1);
    auto const outbound = make_peer_id(2);
    auto const inbound = make_peer_id(3);
    auto const mutual = make_peer_id(4);

    fx.manager.start_sharing({outbound, mutual}, {}, std::nullopt);
    REQUIRE(fx.store.set_sharing_with_me(inbound, true));
    REQUIRE(fx.store.set_sharing_with_me(mutual, true));

    CHECK(fx.manager.relationship_with(none) == Relationship::None);
    CHECK(fx.manager.relationship_with(outbound) ==
          Relationship::SharingWithThem);
    CHECK(fx.manager.relationship_with(inbound) ==
          Relationship::TheyShareWithMe);
    CHECK(fx.manager.relationship_with(mutual) == Relationship::Mutual);
}

TEST_CASE("a timed session lapses on its own")
{
    SharingFixture fx("sharing-expiry");
    auto const bob = make_peer_id(2);

    auto created = fx.manager.start_sharing({bob}, {{bob, "Bob"}}, 10min);
    CHECK(created == 1);

    fx.clock.advance(5min);
    CHECK(fx.manager.relationship_with(bob) == Relationship::SharingWithThem);
    auto sessions = fx.manager.active_sessions();
    REQUIRE(sessions.size() == 1);
    CHECK(sessions.front().display_name == "Bob");

    fx.clock.advance(6min);
    CHECK(fx.manager.relationship_with(bob) == Relationship::None);
    CHECK(fx.manager.active_sessions().empty());
    CHECK_FALSE(fx.manager.is_sharing());

    // The expired entry is only tidied up by the periodic check.
    CHECK(fx.manager.check_expired_sessions() == 1);
    CHECK(fx.manager.check_expired_sessions() == 0);
}

TEST_CASE("stop_sharing twice is a no-op the second time")
{
    SharingFixture fx("sharing-stop-twice");
    int stopped_events = 0;
    fx.bus.subscribe<mp::engine::SharingStoppedEvent>(
        [&](mp::engine::SharingStoppedEvent const &) { ++stopped_events; });

    fx.manager.start_sharing({make_peer_id(1), make_peer_id(2)}, {},
                             std::nullopt);
    CHECK(fx.manager.stop_sharing() == 2);
    auto const sent_after_first = fx.sent.size();
    CHECK(sent_after_first == 2);

    CHECK(fx.manager.stop_sharing() == 0);
    CHECK(fx.sent.size() == sent_after_first);
    CHECK(stopped_events == 1);
    CHECK(fx.manager.active_sessions().empty());
}

TEST_CASE("stopping one peer sends it a cease and keeps the rest")
{
    SharingFixture fx("sharing-stop-one");
    auto const alice = make_peer_id(1);
    auto const bob = make_peer_id(2);
    fx.manager.start_sharing({alice, bob}, {}, std::nullopt);

    CHECK(fx.manager.stop_sharing(alice) == 1);
    REQUIRE(fx.sent.size() == 1);
    CHECK(fx.sent.front().first == alice);

    auto doc = mp::json::Document::parse(fx.sent.front().second);
    REQUIRE(doc.is_valid());
    auto cease = mp::json::bool_field(doc.root(), "cease");
    REQUIRE(cease);
    CHECK(*cease);

    auto sessions = fx.manager.active_sessions();
    REQUIRE(sessions.size() == 1);
    CHECK(sessions.front().peer_id == bob);
    CHECK(sessions.front().display_name == "Unknown");
}

TEST_CASE("start_sharing replaces an existing session and skips bad ids")
{
    SharingFixture fx("sharing-replace");
    auto const bob = make_peer_id(2);
    fx.manager.start_sharing({bob}, {{bob, "Bob"}}, 10min);

    fx.clock.advance(1min);
    auto upper = mp::utils::to_upper_ascii(bob);
    auto created = fx.manager.start_sharing({upper, "not-a-peer"},
                                            {{upper, "Robert"}},
                                            mp::engine::SharingDuration::Indefinite);
    CHECK(created == 1);

    auto sessions = fx.manager.active_sessions();
    REQUIRE(sessions.size() == 1);
    CHECK(sessions.front().peer_id == bob);
    CHECK(sessions.front().display_name == "Robert");
    CHECK_FALSE(sessions.front().expires_at.has_value());
    CHECK(sessions.front().started_at == fx.clock.now());
}

TEST_CASE("share_location sends a coarsened fix to every active session")
{
    SharingFixture fx("sharing-send");
    auto const alice = make_peer_id(1);
    auto const bob = make_peer_id(2);
    fx.manager.start_sharing({alice}, {}, 30min);
    fx.manager.start_sharing({bob}, {}, 15min);
    fx.manager.set_precision_radius(1000);

    auto delivered = fx.manager.share_location(52.520008, 13.404954, 12.0F);
    CHECK(delivered == 2);
    REQUIRE(fx.sent.size() == 2);

    auto doc = mp::json::Document::parse(fx.sent.front().second);
    REQUIRE(doc.is_valid());
    auto *root = doc.root();
    auto lat = mp::json::number_field(root, "lat");
    auto lng = mp::json::number_field(root, "lng");
    REQUIRE(lat);
    REQUIRE(lng);
    auto const grid = 1000.0 / mp::engine::kMetersPerDegree;
    CHECK(*lat == doctest::Approx(std::round(52.520008 / grid) * grid));
    CHECK(*lng == doctest::Approx(std::round(13.404954 / grid) * grid));
    CHECK(mp::json::int_field(root, "approxRadius") == 1000);
    // Earliest session expiry bounds the shared fix.
    CHECK(mp::json::int_field(root, "expires") ==
          mp::engine::to_unix_millis(fx.clock.now() + 15min));
    CHECK(mp::json::int_field(root, "ts") ==
          mp::engine::to_unix_millis(fx.clock.now()));
}

TEST_CASE("share_location without sessions or sink sends nothing")
{
    SharingFixture fx("sharing-idle");
    CHECK(fx.manager.share_location(1.0, 2.0, 3.0F) == 0);

    fx.manager.start_sharing({make_peer_id(1)}, {}, std::nullopt);
    fx.manager.set_telemetry_sink({});
    CHECK(fx.manager.share_location(1.0, 2.0, 3.0F) == 0);
    CHECK(fx.sent.empty());
}

TEST_CASE("a failing sink does not stop delivery to other peers")
{
    SharingFixture fx("sharing-sink-failure");
    auto const alice = make_peer_id(1);
    auto const bob = make_peer_id(2);
    fx.manager.start_sharing({alice, bob}, {}, std::nullopt);
    fx.manager.set_telemetry_sink(
        [&](PeerId const &peer, std::string const &) -> bool
        {
            if (peer == alice)
            {
                throw std::runtime_error("link down");
            }
            return true;
        });
    CHECK(fx.manager.share_location(1.0, 2.0, 3.0F) == 1);
}

TEST_CASE("received locations are stored and announced on the bus")
{
    SharingFixture fx("sharing-receive");
    std::vector<PeerId> stored;
    fx.bus.subscribe<mp::engine::LocationStoredEvent>(
        [&](mp::engine::LocationStoredEvent const &event)
        { stored.push_back(event.sender_id); });

    auto const sender = make_peer_id(6);
    auto const ts = fx.clock.now() - 3s;
    CHECK(fx.manager.handle_received_location(
        location_payload(mp::utils::to_upper_ascii(sender), 48.2, 16.37, ts)));

    auto latest = fx.store.latest_location_for(sender);
    REQUIRE(latest);
    CHECK(latest->latitude == doctest::Approx(48.2));
    CHECK(latest->captured_at == ts);
    CHECK(latest->received_at == fx.clock.now());
    REQUIRE(stored.size() == 1);
    CHECK(stored.front() == sender);

    CHECK_FALSE(fx.manager.handle_received_location("{not json"));
    CHECK_FALSE(fx.manager.handle_received_location(
        R"({"lat":1,"lng":2,"acc":3,"ts":4})"));
}

TEST_CASE("a cease older than the stored location is ignored")
{
    SharingFixture fx("sharing-cease-order");
    auto const sender = make_peer_id(7);
    int ceased = 0;
    fx.bus.subscribe<mp::engine::LocationCeasedEvent>(
        [&](mp::engine::LocationCeasedEvent const &) { ++ceased; });

    REQUIRE(fx.manager.handle_received_location(
        location_payload(sender, 10.0, 20.0, fx.clock.now())));

    // Sent before the update we already hold arrived.
    CHECK(fx.manager.handle_received_location(
        cease_payload(sender, fx.clock.now() - 1min)));
    CHECK(fx.store.latest_location_for(sender).has_value());
    CHECK(ceased == 0);

    fx.clock.advance(2min);
    CHECK(fx.manager.handle_received_location(
        cease_payload(sender, fx.clock.now())));
    CHECK_FALSE(fx.store.latest_location_for(sender).has_value());
    CHECK(ceased == 1);
}

TEST_CASE("cleanup removes locations whose grace period ended")
{
    SharingFixture fx("sharing-cleanup");
    mp::engine::LocationUpdate update;
    update.sender_id = make_peer_id(9);
    update.captured_at = fx.clock.now();
    update.received_at = fx.clock.now();
    update.expires_at = fx.clock.now() + 10min;
    REQUIRE(fx.store.insert_location(update));

    fx.clock.advance(30min);
    auto removed = fx.manager.cleanup_expired_locations();
    REQUIRE(removed);
    CHECK(*removed == 0);

    fx.clock.advance(45min);
    removed = fx.manager.cleanup_expired_locations();
    REQUIRE(removed);
    CHECK(*removed == 1);
}

TEST_CASE("cleanup keeps only the newest open-ended update per sender")
{
    SharingFixture fx("sharing-cleanup-open");
    auto const sender = make_peer_id(12);
    for (int i = 0; i < 3; ++i)
    {
        CHECK(fx.manager.handle_received_location(
            location_payload(sender, 40.0 + i, 9.0, fx.clock.now())));
        fx.clock.advance(1min);
    }
    CHECK(fx.store.location_count() == 3);

    auto removed = fx.manager.cleanup_expired_locations();
    REQUIRE(removed);
    CHECK(*removed == 2);
    CHECK(fx.store.location_count() == 1);
    auto latest = fx.store.latest_location_for(sender);
    REQUIRE(latest);
    CHECK(latest->latitude == doctest::Approx(42.0));
}
