#include "engine/AppDataParser.hpp"

#include <cstdint>
#include <string>
#include <vector>

#include <doctest/doctest.h>

using mp::engine::MsgpackValue;

namespace
{

std::vector<std::uint8_t> bytes(std::initializer_list<int> values)
{
    std::vector<std::uint8_t> result;
    for (int value : values)
    {
        result.push_back(static_cast<std::uint8_t>(value));
    }
    return result;
}

void append_fixstr(std::vector<std::uint8_t> &out, std::string const &text)
{
    out.push_back(static_cast<std::uint8_t>(0xa0 | text.size()));
    out.insert(out.end(), text.begin(), text.end());
}

// [false, 1700000000, true, 256, 10240, [16, 40], {"n": <name>}]
std::vector<std::uint8_t> propagation_app_data(std::string const &name)
{
    std::vector<std::uint8_t> out{0x97, 0xc2, 0xce, 0x65, 0x53, 0xf1, 0x00,
                                  0xc3, 0xcd, 0x01, 0x00, 0xcd, 0x28, 0x00,
                                  0x92, 0x10, 0x28, 0x81};
    append_fixstr(out, "n");
    append_fixstr(out, name);
    return out;
}

} // namespace

TEST_CASE("decode_msgpack reads scalars and containers")
{
    auto value = mp::engine::decode_msgpack(
        bytes({0x93, 0x01, 0xa2, 'h', 'i', 0x81, 0xa1, 'k', 0xcb, 0x3f, 0xf8,
               0, 0, 0, 0, 0, 0}));
    REQUIRE(value);
    REQUIRE(value->kind == MsgpackValue::Kind::Array);
    REQUIRE(value->items.size() == 3);
    CHECK(value->items[0].integer == 1);
    CHECK(value->items[1].bytes == "hi");
    REQUIRE(value->items[2].kind == MsgpackValue::Kind::Map);
    REQUIRE(value->items[2].entries.size() == 1);
    CHECK(value->items[2].entries[0].first.bytes == "k");
    CHECK(value->items[2].entries[0].second.real == doctest::Approx(1.5));

    auto negative = mp::engine::decode_msgpack(bytes({0xd0, 0xfe}));
    REQUIRE(negative);
    CHECK(negative->integer == -2);
}

TEST_CASE("decode_msgpack rejects truncated and trailing input")
{
    CHECK_FALSE(mp::engine::decode_msgpack(bytes({})));
    CHECK_FALSE(mp::engine::decode_msgpack(bytes({0x92, 0x01})));
    CHECK_FALSE(mp::engine::decode_msgpack(bytes({0xa5, 'a', 'b'})));
    CHECK_FALSE(mp::engine::decode_msgpack(bytes({0x01, 0x02})));
    CHECK_FALSE(mp::engine::decode_msgpack(bytes({0xd4, 0x01, 0x00})));
}

TEST_CASE("extract_propagation_metadata reads the node name and limit")
{
    auto metadata =
        mp::engine::extract_propagation_metadata(propagation_app_data("Hub"));
    REQUIRE(metadata.name);
    CHECK(*metadata.name == "Hub");
    REQUIRE(metadata.transfer_limit_kb);
    CHECK(*metadata.transfer_limit_kb == 256);

    auto blank =
        mp::engine::extract_propagation_metadata(propagation_app_data("   "));
    CHECK_FALSE(blank.name.has_value());

    auto too_short = mp::engine::extract_propagation_metadata(
        bytes({0x93, 0x01, 0x02, 0x03}));
    CHECK(too_short == mp::engine::PropagationNodeMetadata{});
}

TEST_CASE("name_from_app_data understands delivery and propagation layouts")
{
    std::vector<std::uint8_t> delivery{0x92};
    append_fixstr(delivery, "Mara");
    delivery.push_back(0x08);
    auto name = mp::engine::name_from_app_data(delivery);
    REQUIRE(name);
    CHECK(*name == "Mara");

    auto node = mp::engine::name_from_app_data(propagation_app_data("Relay 7"));
    REQUIRE(node);
    CHECK(*node == "Relay 7");

    std::string text = "  Plain Name\n";
    auto plain = mp::engine::name_from_app_data(
        std::vector<std::uint8_t>(text.begin(), text.end()));
    REQUIRE(plain);
    CHECK(*plain == "Plain Name");

    CHECK_FALSE(mp::engine::name_from_app_data(bytes({})));
    CHECK_FALSE(mp::engine::name_from_app_data(bytes({0x80, 0x81})));
}

TEST_CASE("is_printable_utf8 rejects control bytes and bad sequences")
{
    CHECK(mp::engine::is_printable_utf8("Grüße"));
    CHECK(mp::engine::is_printable_utf8("tab\tok"));
    CHECK_FALSE(mp::engine::is_printable_utf8(std::string("nul\0", 4)));
    CHECK_FALSE(mp::engine::is_printable_utf8("\xc0\xaf"));
    CHECK_FALSE(mp::engine::is_printable_utf8("\xed\xa0\x80"));
    CHECK_FALSE(mp::engine::is_printable_utf8("\xe2\x82"));
}
