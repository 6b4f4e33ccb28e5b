#include "engine/PresenceStore.hpp"
#include "engine/AnnounceIngestionPipeline.hpp"
#include "utils/StateStore.hpp"
#include "PresenceTestUtils.hpp"

#include <algorithm>
#include <chrono>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using mp::engine::AnnounceFilter;
using mp::engine::LocationUpdate;
using mp::engine::NodeType;
using mp::engine::PeerAnnounce;
using mp::engine::PresenceStore;
using mp::test::epoch_plus;
using mp::test::make_peer_id;

namespace
{

PeerAnnounce stored_announce(unsigned n, mp::engine::TimePoint at,
                             std::string name, NodeType type = NodeType::Peer)
{
    auto raw = mp::test::make_announce(n, at, 2, std::move(name));
    raw.node_type = type;
    auto announce = mp::engine::normalize_announce(raw);
    REQUIRE(announce);
    return *announce;
}

LocationUpdate location(unsigned sender, mp::engine::TimePoint received,
                        double lat,
                        std::optional<mp::engine::TimePoint> expires = {})
{
    LocationUpdate update;
    update.sender_id = make_peer_id(sender);
    update.latitude = lat;
    update.longitude = 13.4;
    update.accuracy_meters = 8.5F;
    update.captured_at = received - 2s;
    update.received_at = received;
    update.expires_at = expires;
    return update;
}

} // namespace

TEST_CASE("PresenceStore keeps one announce row per peer")
{
    mp::test::TempRoot root("store-upsert");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    REQUIRE(store.upsert(stored_announce(1, epoch_plus(0ms), "Alice")));
    auto second = stored_announce(1, epoch_plus(5s), "Alice B.");
    second.hop_count = 4;
    REQUIRE(store.upsert(second));

    auto count = store.announce_count();
    REQUIRE(count);
    CHECK(*count == 1);

    auto found = store.find(make_peer_id(1));
    REQUIRE(found);
    CHECK(found->display_name == "Alice B.");
    CHECK(found->hop_count == 4);
    CHECK(found->last_seen_at == epoch_plus(5s));
    CHECK(found->aspect == mp::engine::kAspectDelivery);
    CHECK(found->receiving_interface == "test0");
}

TEST_CASE("PresenceStore never replaces a known public key")
{
    mp::test::TempRoot root("store-public-key");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    auto first = stored_announce(7, epoch_plus(0ms), "Key");
    REQUIRE(store.upsert(first));

    auto rotated = stored_announce(7, epoch_plus(1s), "Key");
    rotated.public_key = std::vector<std::uint8_t>(32, 0xee);
    REQUIRE(store.upsert(rotated));

    auto found = store.find(make_peer_id(7));
    REQUIRE(found);
    CHECK(found->public_key == first.public_key);
    CHECK(found->last_seen_at == epoch_plus(1s));
}

TEST_CASE("PresenceStore favorites survive later announces")
{
    mp::test::TempRoot root("store-favorite");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    REQUIRE(store.upsert(stored_announce(3, epoch_plus(0ms), "Fav")));
    CHECK(store.set_favorite(make_peer_id(3), true, epoch_plus(1s)));
    CHECK_FALSE(store.set_favorite(make_peer_id(99), true, epoch_plus(1s)));

    REQUIRE(store.upsert(stored_announce(3, epoch_plus(2s), "Fav")));
    auto found = store.find(make_peer_id(3));
    REQUIRE(found);
    CHECK(found->favorite);
    REQUIRE(found->favorited_at);
    CHECK(*found->favorited_at == epoch_plus(1s));

    CHECK(store.set_favorite(make_peer_id(3), false, epoch_plus(3s)));
    found = store.find(make_peer_id(3));
    REQUIRE(found);
    CHECK_FALSE(found->favorite);
    CHECK_FALSE(found->favorited_at.has_value());
}

TEST_CASE("PresenceStore lists peers newest first with filters")
{
    mp::test::TempRoot root("store-list");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    REQUIRE(store.upsert(stored_announce(1, epoch_plus(1s), "Alice")));
    REQUIRE(store.upsert(stored_announce(2, epoch_plus(3s), "Bob")));
    REQUIRE(store.upsert(
        stored_announce(3, epoch_plus(2s), "Relay", NodeType::PropagationNode)));
    auto caller = stored_announce(4, epoch_plus(4s), "Phone");
    caller.aspect = mp::engine::kAspectAudioCall;
    REQUIRE(store.upsert(caller));

    auto all = store.list_recent({});
    REQUIRE(all);
    REQUIRE(all->size() == 4);
    CHECK(all->at(0).peer_id == make_peer_id(4));
    CHECK(all->at(1).peer_id == make_peer_id(2));
    CHECK(all->at(2).peer_id == make_peer_id(3));
    CHECK(all->at(3).peer_id == make_peer_id(1));

    AnnounceFilter peers_only;
    peers_only.node_types = {NodeType::Peer};
    peers_only.include_audio = false;
    auto peers = store.list_recent(peers_only);
    REQUIRE(peers);
    REQUIRE(peers->size() == 2);
    CHECK(peers->at(0).display_name == "Bob");
    CHECK(peers->at(1).display_name == "Alice");

    AnnounceFilter search;
    search.search = "ALI";
    auto alice = store.list_recent(search);
    REQUIRE(alice);
    REQUIRE(alice->size() == 1);
    CHECK(alice->front().peer_id == make_peer_id(1));

    AnnounceFilter limited;
    limited.limit = 2;
    auto first_two = store.list_recent(limited);
    REQUIRE(first_two);
    CHECK(first_two->size() == 2);

    auto ids = store.peer_ids_by_node_types({NodeType::Peer, NodeType::Node});
    REQUIRE(ids);
    CHECK(ids->size() == 3);
    CHECK_FALSE(ids->contains(make_peer_id(3)));
}

TEST_CASE("PresenceStore removes announces and finds by identity")
{
    mp::test::TempRoot root("store-remove");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    auto announce = stored_announce(5, epoch_plus(0ms), "Eve");
    REQUIRE(store.upsert(announce));

    auto by_identity = store.find_by_identity(announce.identity_hash);
    REQUIRE(by_identity);
    CHECK(by_identity->peer_id == make_peer_id(5));
    CHECK_FALSE(store.find_by_identity("").has_value());

    CHECK(store.remove(make_peer_id(5)));
    CHECK_FALSE(store.remove(make_peer_id(5)));
    CHECK_FALSE(store.find(make_peer_id(5)).has_value());
}

TEST_CASE("PresenceStore returns the latest location per sender")
{
    mp::test::TempRoot root("store-locations");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    REQUIRE(store.insert_location(location(1, epoch_plus(1s), 52.0)));
    REQUIRE(store.insert_location(location(1, epoch_plus(5s), 52.5)));
    REQUIRE(store.insert_location(location(2, epoch_plus(3s), 48.1)));

    auto latest = store.latest_location_for(make_peer_id(1));
    REQUIRE(latest);
    CHECK(latest->latitude == doctest::Approx(52.5));
    CHECK(latest->received_at == epoch_plus(5s));
    CHECK(latest->captured_at == epoch_plus(3s));
    CHECK(latest->accuracy_meters == doctest::Approx(8.5));

    auto per_sender = store.latest_location_per_sender();
    REQUIRE(per_sender);
    REQUIRE(per_sender->size() == 2);
    auto first = std::find_if(per_sender->begin(), per_sender->end(),
                              [](LocationUpdate const &update)
                              { return update.sender_id == make_peer_id(1); });
    REQUIRE(first != per_sender->end());
    CHECK(first->latitude == doctest::Approx(52.5));

    auto deleted = store.delete_locations_for(make_peer_id(1));
    REQUIRE(deleted);
    CHECK(*deleted == 2);
    CHECK_FALSE(store.latest_location_for(make_peer_id(1)).has_value());
}

TEST_CASE("PresenceStore deletes locations past expiry plus grace")
{
    mp::test::TempRoot root("store-expiry");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    auto const now = epoch_plus(10h);
    REQUIRE(store.insert_location(
        location(1, now - 3h, 50.0, now - 2h))); // grace long over
    REQUIRE(store.insert_location(
        location(2, now - 1h, 51.0, now - 30min))); // still in grace
    REQUIRE(store.insert_location(location(3, now - 5h, 52.0))); // no expiry

    auto removed = store.delete_expired_locations(now, 1h);
    REQUIRE(removed);
    CHECK(*removed == 1);
    CHECK_FALSE(store.latest_location_for(make_peer_id(1)).has_value());
    CHECK(store.latest_location_for(make_peer_id(2)).has_value());
    CHECK(store.latest_location_for(make_peer_id(3)).has_value());
}

TEST_CASE("PresenceStore prunes superseded open-ended locations")
{
    mp::test::TempRoot root("store-superseded");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    for (int i = 1; i <= 4; ++i)
    {
        REQUIRE(store.insert_location(
            location(1, epoch_plus(std::chrono::seconds(i)), 50.0 + i)));
    }
    REQUIRE(store.insert_location(location(2, epoch_plus(2s), 48.0)));
    CHECK(store.location_count() == 5);

    auto removed = store.delete_superseded_locations();
    REQUIRE(removed);
    CHECK(*removed == 3);
    CHECK(store.location_count() == 2);

    auto latest = store.latest_location_for(make_peer_id(1));
    REQUIRE(latest);
    CHECK(latest->latitude == doctest::Approx(54.0));
    CHECK(latest->received_at == epoch_plus(4s));
    CHECK(store.latest_location_for(make_peer_id(2)).has_value());

    removed = store.delete_superseded_locations();
    REQUIRE(removed);
    CHECK(*removed == 0);
}

TEST_CASE("PresenceStore keeps appearance data with a location")
{
    mp::test::TempRoot root("store-appearance");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    auto update = location(4, epoch_plus(1s), 40.0);
    update.appearance_json = R"({"icon":"bike"})";
    REQUIRE(store.insert_location(update));

    auto latest = store.latest_location_for(make_peer_id(4));
    REQUIRE(latest);
    REQUIRE(latest->appearance_json);
    CHECK(*latest->appearance_json == R"({"icon":"bike"})");
}

TEST_CASE("PresenceStore contact directory defaults and updates")
{
    mp::test::TempRoot root("store-contacts");
    PresenceStore store(root.db());
    REQUIRE(store.is_valid());

    auto const peer = make_peer_id(8);
    CHECK_FALSE(store.nickname(peer).has_value());
    CHECK_FALSE(store.is_sharing_with_me(peer));

    REQUIRE(store.set_nickname(peer, std::string("Grandma")));
    REQUIRE(store.set_sharing_with_me(peer, true));
    REQUIRE(store.nickname(peer));
    CHECK(*store.nickname(peer) == "Grandma");
    CHECK(store.is_sharing_with_me(peer));

    REQUIRE(store.set_nickname(peer, std::nullopt));
    CHECK_FALSE(store.nickname(peer).has_value());
    CHECK(store.is_sharing_with_me(peer));
}

TEST_CASE("Database reopens an existing state file")
{
    mp::test::TempRoot root("store-reopen");
    {
        PresenceStore store(root.db());
        REQUIRE(store.is_valid());
        REQUIRE(store.upsert(stored_announce(9, epoch_plus(0ms), "Persist")));
        REQUIRE(store.set_setting("answer", "42"));
    }

    mp::storage::Database reader(root.db());
    REQUIRE(reader.is_valid());
    auto row = reader.load_announce(make_peer_id(9));
    REQUIRE(row);
    CHECK(row->display_name == "Persist");
    auto value = reader.get_setting("answer");
    REQUIRE(value);
    CHECK(*value == "42");
}

TEST_CASE("string lists round trip through JSON")
{
    std::vector<std::string> values{"PEER", "NODE"};
    auto encoded = mp::storage::serialize_string_list(values);
    CHECK(mp::storage::deserialize_string_list(encoded) == values);
    CHECK(mp::storage::deserialize_string_list("not json").empty());
}
