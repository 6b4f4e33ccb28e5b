#include "engine/LocationTelemetry.hpp"
#include "engine/PresenceUtils.hpp"
#include "utils/Json.hpp"
#include "PresenceTestUtils.hpp"

#include <chrono>
#include <cmath>
#include <string>

#include <doctest/doctest.h>

using namespace std::chrono_literals;
using mp::engine::coarsen_location;
using mp::engine::parse_location_telemetry;
using mp::test::epoch_plus;
using mp::test::make_peer_id;

TEST_CASE("encode_location_telemetry writes the wire fields")
{
    mp::engine::OutboundLocation location;
    location.latitude = 47.5;
    location.longitude = 8.25;
    location.accuracy_meters = 4.0F;
    location.captured_at = epoch_plus(1500ms);
    location.approximate_radius_meters = 500;

    auto payload = mp::engine::encode_location_telemetry(location);
    auto doc = mp::json::Document::parse(payload);
    REQUIRE(doc.is_valid());
    auto *root = doc.root();
    auto lat = mp::json::number_field(root, "lat");
    auto lng = mp::json::number_field(root, "lng");
    auto acc = mp::json::number_field(root, "acc");
    REQUIRE(lat);
    REQUIRE(lng);
    REQUIRE(acc);
    CHECK(*lat == doctest::Approx(47.5));
    CHECK(*lng == doctest::Approx(8.25));
    CHECK(*acc == doctest::Approx(4.0));
    CHECK(mp::json::int_field(root, "ts") ==
          mp::engine::to_unix_millis(epoch_plus(1500ms)));
    CHECK_FALSE(mp::json::int_field(root, "expires").has_value());
    CHECK(mp::json::int_field(root, "approxRadius") == 500);
    CHECK(mp::json::bool_field(root, "cease") == false);
}

TEST_CASE("encode_cease_telemetry marks the payload as a cease")
{
    auto payload = mp::engine::encode_cease_telemetry(epoch_plus(2s));
    auto doc = mp::json::Document::parse(payload);
    REQUIRE(doc.is_valid());
    CHECK(mp::json::bool_field(doc.root(), "cease") == true);
    CHECK(mp::json::int_field(doc.root(), "ts") ==
          mp::engine::to_unix_millis(epoch_plus(2s)));
}

TEST_CASE("parse_location_telemetry reads a full update")
{
    auto const sender = make_peer_id(42);
    auto const received = epoch_plus(10s);
    std::string payload =
        R"({"source_hash":")" + sender +
        R"(","lat":-33.86,"lng":151.21,"acc":12.5,"ts":1700000005000,)"
        R"("expires":1700000905000,"approxRadius":250,)"
        R"("appearance":{"icon":"hiker","color":"#ff0000"}})";

    auto parsed = parse_location_telemetry(payload, received);
    REQUIRE(parsed);
    CHECK_FALSE(parsed->cease);
    auto const &location = parsed->location;
    CHECK(location.sender_id == sender);
    CHECK(location.latitude == doctest::Approx(-33.86));
    CHECK(location.longitude == doctest::Approx(151.21));
    CHECK(location.accuracy_meters == doctest::Approx(12.5));
    CHECK(location.captured_at == epoch_plus(5s));
    CHECK(location.received_at == received);
    REQUIRE(location.expires_at);
    CHECK(*location.expires_at == epoch_plus(905s));
    CHECK(location.approximate_radius_meters == 250);
    REQUIRE(location.appearance_json);
    auto appearance = mp::json::Document::parse(*location.appearance_json);
    REQUIRE(appearance.is_valid());
    CHECK(mp::json::string_field(appearance.root(), "icon") ==
          std::string("hiker"));
}

TEST_CASE("parse_location_telemetry accepts a bare cease")
{
    std::string payload = R"({"source_hash":")" + make_peer_id(1) +
                          R"(","cease":true,"ts":1700000001000})";
    auto parsed = parse_location_telemetry(payload, epoch_plus(2s));
    REQUIRE(parsed);
    CHECK(parsed->cease);
    CHECK(parsed->timestamp == epoch_plus(1s));
}

TEST_CASE("parse_location_telemetry rejects malformed payloads")
{
    auto const received = epoch_plus(0ms);
    auto const sender = make_peer_id(1);
    CHECK_FALSE(parse_location_telemetry("", received));
    CHECK_FALSE(parse_location_telemetry("[1,2,3]", received));
    CHECK_FALSE(parse_location_telemetry(
        R"({"lat":1,"lng":2,"acc":3,"ts":4})", received));
    CHECK_FALSE(parse_location_telemetry(
        R"({"source_hash":"abc","lat":1,"lng":2,"acc":3,"ts":4})", received));
    CHECK_FALSE(parse_location_telemetry(
        R"({"source_hash":")" + sender + R"(","lat":1,"acc":3,"ts":4})",
        received));
    CHECK_FALSE(parse_location_telemetry(
        R"({"source_hash":")" + sender + R"(","lat":91,"lng":2,"acc":3,"ts":4})",
        received));
    CHECK_FALSE(parse_location_telemetry(
        R"({"source_hash":")" + sender +
            R"(","lat":1,"lng":-181,"acc":3,"ts":4})",
        received));
}

TEST_CASE("coarsen_location snaps to the grid")
{
    auto [lat, lng] = coarsen_location(52.520008, 13.404954, 0);
    CHECK(lat == 52.520008);
    CHECK(lng == 13.404954);

    auto const grid = 5000.0 / mp::engine::kMetersPerDegree;
    auto [coarse_lat, coarse_lng] = coarsen_location(52.520008, 13.404954, 5000);
    CHECK(coarse_lat == doctest::Approx(std::round(52.520008 / grid) * grid));
    CHECK(coarse_lng == doctest::Approx(std::round(13.404954 / grid) * grid));
    CHECK(std::abs(coarse_lat - 52.520008) <= grid / 2 + 1e-12);

    // Nearby fixes inside one cell collapse onto the same point.
    auto [a_lat, a_lng] = coarsen_location(10.0001, 20.0001, 5000);
    auto [b_lat, b_lng] = coarsen_location(10.0002, 20.0002, 5000);
    CHECK(a_lat == b_lat);
    CHECK(a_lng == b_lng);
}
