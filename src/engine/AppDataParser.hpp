#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mp::engine
{

// Subset of MessagePack needed to read announce app data.
struct MsgpackValue
{
    enum class Kind
    {
        Nil,
        Bool,
        Int,
        Float,
        Str,
        Bin,
        Array,
        Map,
    };

    Kind kind = Kind::Nil;
    bool boolean = false;
    std::int64_t integer = 0;
    double real = 0.0;
    // Payload of Str and Bin.
    std::string bytes;
    std::vector<MsgpackValue> items;
    std::vector<std::pair<MsgpackValue, MsgpackValue>> entries;

    bool is_text() const noexcept
    {
        return kind == Kind::Str || kind == Kind::Bin;
    }
};

// Decodes exactly one value spanning the whole input.
std::optional<MsgpackValue> decode_msgpack(std::span<std::uint8_t const> data);

struct PropagationNodeMetadata
{
    std::optional<std::string> name;
    std::optional<int> transfer_limit_kb;

    bool operator==(PropagationNodeMetadata const &) const = default;
};

// Reads the LXMF propagation node announce layout:
// [legacy, timebase, state, transfer_limit, sync_limit, stamp_costs, meta].
PropagationNodeMetadata
extract_propagation_metadata(std::span<std::uint8_t const> app_data);

bool is_printable_utf8(std::string_view text);
std::string trim_copy(std::string_view text);

// Best-effort name from app data: structured payloads first, then the raw
// bytes as text.
std::optional<std::string>
name_from_app_data(std::span<std::uint8_t const> app_data);

// Never fails: falls back to "Peer XXXXXXXX" or "Unknown Peer".
std::string extract_peer_name(std::optional<std::string> const &display_name,
                              std::span<std::uint8_t const> app_data,
                              std::string_view peer_id);

} // namespace mp::engine
