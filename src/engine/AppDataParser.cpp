#include "engine/AppDataParser.hpp"

#include "utils/Hex.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace mp::engine
{

namespace
{

constexpr int kMaxDepth = 16;
constexpr std::size_t kMaxContainerItems = 4096;

class MsgpackReader
{
  public:
    explicit MsgpackReader(std::span<std::uint8_t const> data) : data_(data) {}

    bool at_end() const noexcept { return offset_ == data_.size(); }

    std::optional<MsgpackValue> read(int depth = 0)
    {
        if (depth > kMaxDepth)
        {
            return std::nullopt;
        }
        auto tag = byte();
        if (!tag)
        {
            return std::nullopt;
        }
        auto const t = *tag;
        MsgpackValue value;
        if (t <= 0x7f)
        {
            value.kind = MsgpackValue::Kind::Int;
            value.integer = t;
            return value;
        }
        if (t >= 0xe0)
        {
            value.kind = MsgpackValue::Kind::Int;
            value.integer = static_cast<std::int8_t>(t);
            return value;
        }
        if ((t & 0xe0) == 0xa0)
        {
            return text(MsgpackValue::Kind::Str, t & 0x1f);
        }
        if ((t & 0xf0) == 0x90)
        {
            return array(t & 0x0f, depth);
        }
        if ((t & 0xf0) == 0x80)
        {
            return map(t & 0x0f, depth);
        }
        switch (t)
        {
        case 0xc0:
            return value;
        case 0xc2:
        case 0xc3:
            value.kind = MsgpackValue::Kind::Bool;
            value.boolean = t == 0xc3;
            return value;
        case 0xc4:
            return sized_text(MsgpackValue::Kind::Bin, 1);
        case 0xc5:
            return sized_text(MsgpackValue::Kind::Bin, 2);
        case 0xc6:
            return sized_text(MsgpackValue::Kind::Bin, 4);
        case 0xca:
        {
            auto bits = unsigned_be(4);
            if (!bits)
            {
                return std::nullopt;
            }
            auto raw = static_cast<std::uint32_t>(*bits);
            float f = 0.0F;
            std::memcpy(&f, &raw, sizeof(f));
            value.kind = MsgpackValue::Kind::Float;
            value.real = f;
            return value;
        }
        case 0xcb:
        {
            auto bits = unsigned_be(8);
            if (!bits)
            {
                return std::nullopt;
            }
            double d = 0.0;
            std::memcpy(&d, &*bits, sizeof(d));
            value.kind = MsgpackValue::Kind::Float;
            value.real = d;
            return value;
        }
        case 0xcc:
        case 0xcd:
        case 0xce:
        case 0xcf:
        {
            auto bits = unsigned_be(std::size_t{1} << (t - 0xcc));
            if (!bits ||
                *bits > static_cast<std::uint64_t>(
                            std::numeric_limits<std::int64_t>::max()))
            {
                return std::nullopt;
            }
            value.kind = MsgpackValue::Kind::Int;
            value.integer = static_cast<std::int64_t>(*bits);
            return value;
        }
        case 0xd0:
        case 0xd1:
        case 0xd2:
        case 0xd3:
        {
            auto width = std::size_t{1} << (t - 0xd0);
            auto bits = unsigned_be(width);
            if (!bits)
            {
                return std::nullopt;
            }
            value.kind = MsgpackValue::Kind::Int;
            value.integer = sign_extend(*bits, width);
            return value;
        }
        case 0xd9:
            return sized_text(MsgpackValue::Kind::Str, 1);
        case 0xda:
            return sized_text(MsgpackValue::Kind::Str, 2);
        case 0xdb:
            return sized_text(MsgpackValue::Kind::Str, 4);
        case 0xdc:
        case 0xdd:
        {
            auto count = unsigned_be(t == 0xdc ? 2 : 4);
            if (!count)
            {
                return std::nullopt;
            }
            return array(*count, depth);
        }
        case 0xde:
        case 0xdf:
        {
            auto count = unsigned_be(t == 0xde ? 2 : 4);
            if (!count)
            {
                return std::nullopt;
            }
            return map(*count, depth);
        }
        default:
            // ext types and the reserved tag are not expected in app data
            return std::nullopt;
        }
    }

  private:
    std::optional<std::uint8_t> byte()
    {
        if (offset_ >= data_.size())
        {
            return std::nullopt;
        }
        return data_[offset_++];
    }

    std::optional<std::uint64_t> unsigned_be(std::size_t width)
    {
        if (data_.size() - offset_ < width)
        {
            return std::nullopt;
        }
        std::uint64_t result = 0;
        for (std::size_t i = 0; i < width; ++i)
        {
            result = (result << 8) | data_[offset_++];
        }
        return result;
    }

    static std::int64_t sign_extend(std::uint64_t bits, std::size_t width)
    {
        if (width >= 8)
        {
            return static_cast<std::int64_t>(bits);
        }
        auto const shift = 64 - static_cast<int>(width * 8);
        return static_cast<std::int64_t>(bits << shift) >> shift;
    }

    std::optional<MsgpackValue> text(MsgpackValue::Kind kind,
                                     std::uint64_t length)
    {
        if (data_.size() - offset_ < length)
        {
            return std::nullopt;
        }
        MsgpackValue value;
        value.kind = kind;
        value.bytes.assign(
            reinterpret_cast<char const *>(data_.data() + offset_),
            static_cast<std::size_t>(length));
        offset_ += static_cast<std::size_t>(length);
        return value;
    }

    std::optional<MsgpackValue> sized_text(MsgpackValue::Kind kind,
                                           std::size_t width)
    {
        auto length = unsigned_be(width);
        if (!length)
        {
            return std::nullopt;
        }
        return text(kind, *length);
    }

    std::optional<MsgpackValue> array(std::uint64_t count, int depth)
    {
        if (count > kMaxContainerItems)
        {
            return std::nullopt;
        }
        MsgpackValue value;
        value.kind = MsgpackValue::Kind::Array;
        value.items.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; ++i)
        {
            auto item = read(depth + 1);
            if (!item)
            {
                return std::nullopt;
            }
            value.items.push_back(std::move(*item));
        }
        return value;
    }

    std::optional<MsgpackValue> map(std::uint64_t count, int depth)
    {
        if (count > kMaxContainerItems)
        {
            return std::nullopt;
        }
        MsgpackValue value;
        value.kind = MsgpackValue::Kind::Map;
        for (std::uint64_t i = 0; i < count; ++i)
        {
            auto key = read(depth + 1);
            if (!key)
            {
                return std::nullopt;
            }
            auto entry = read(depth + 1);
            if (!entry)
            {
                return std::nullopt;
            }
            value.entries.emplace_back(std::move(*key), std::move(*entry));
        }
        return value;
    }

    std::span<std::uint8_t const> data_;
    std::size_t offset_ = 0;
};

std::optional<std::string> usable_name(MsgpackValue const &value)
{
    if (!value.is_text() || !is_printable_utf8(value.bytes))
    {
        return std::nullopt;
    }
    auto trimmed = trim_copy(value.bytes);
    if (trimmed.empty())
    {
        return std::nullopt;
    }
    return trimmed;
}

std::optional<std::string> name_from_metadata_map(MsgpackValue const &map)
{
    if (map.kind != MsgpackValue::Kind::Map)
    {
        return std::nullopt;
    }
    for (auto const &[key, value] : map.entries)
    {
        if (key.is_text() && (key.bytes == "n" || key.bytes == "name"))
        {
            if (auto name = usable_name(value))
            {
                return name;
            }
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<MsgpackValue> decode_msgpack(std::span<std::uint8_t const> data)
{
    if (data.empty())
    {
        return std::nullopt;
    }
    MsgpackReader reader(data);
    auto value = reader.read();
    if (!value || !reader.at_end())
    {
        return std::nullopt;
    }
    return value;
}

PropagationNodeMetadata
extract_propagation_metadata(std::span<std::uint8_t const> app_data)
{
    PropagationNodeMetadata metadata;
    auto decoded = decode_msgpack(app_data);
    if (!decoded || decoded->kind != MsgpackValue::Kind::Array ||
        decoded->items.size() < 7)
    {
        return metadata;
    }
    auto const &limit = decoded->items[3];
    if (limit.kind == MsgpackValue::Kind::Int &&
        limit.integer >= 0 && limit.integer <= std::numeric_limits<int>::max())
    {
        metadata.transfer_limit_kb = static_cast<int>(limit.integer);
    }
    else if (limit.kind == MsgpackValue::Kind::Float &&
             std::isfinite(limit.real) && limit.real >= 0.0 &&
             limit.real <= static_cast<double>(std::numeric_limits<int>::max()))
    {
        metadata.transfer_limit_kb = static_cast<int>(limit.real);
    }
    metadata.name = name_from_metadata_map(decoded->items[6]);
    return metadata;
}

bool is_printable_utf8(std::string_view text)
{
    std::size_t i = 0;
    while (i < text.size())
    {
        auto const lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t code = 0;
        if (lead < 0x80)
        {
            if (lead < 0x20 && lead != '\t' && lead != '\n' && lead != '\r')
            {
                return false;
            }
            if (lead == 0x7f)
            {
                return false;
            }
            ++i;
            continue;
        }
        if ((lead & 0xe0) == 0xc0)
        {
            extra = 1;
            code = lead & 0x1f;
        }
        else if ((lead & 0xf0) == 0xe0)
        {
            extra = 2;
            code = lead & 0x0f;
        }
        else if ((lead & 0xf8) == 0xf0)
        {
            extra = 3;
            code = lead & 0x07;
        }
        else
        {
            return false;
        }
        if (text.size() - i <= extra)
        {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k)
        {
            auto const cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xc0) != 0x80)
            {
                return false;
            }
            code = (code << 6) | (cont & 0x3f);
        }
        // overlong forms, surrogates and out-of-range scalars
        static constexpr std::uint32_t kMinimum[] = {0, 0x80, 0x800, 0x10000};
        if (code < kMinimum[extra] || code > 0x10ffff ||
            (code >= 0xd800 && code <= 0xdfff))
        {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string trim_copy(std::string_view text)
{
    auto is_space = [](char ch)
    { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; };
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin]))
    {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1]))
    {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

std::optional<std::string>
name_from_app_data(std::span<std::uint8_t const> app_data)
{
    if (app_data.empty())
    {
        return std::nullopt;
    }
    if (auto decoded = decode_msgpack(app_data);
        decoded && decoded->kind == MsgpackValue::Kind::Array &&
        !decoded->items.empty())
    {
        // LXMF delivery announces carry [display_name, stamp_cost].
        if (auto name = usable_name(decoded->items.front()))
        {
            return name;
        }
        if (auto name = name_from_metadata_map(decoded->items.back()))
        {
            return name;
        }
        return std::nullopt;
    }
    std::string_view raw(reinterpret_cast<char const *>(app_data.data()),
                         app_data.size());
    if (!is_printable_utf8(raw))
    {
        return std::nullopt;
    }
    auto trimmed = trim_copy(raw);
    if (trimmed.empty())
    {
        return std::nullopt;
    }
    return trimmed;
}

std::string extract_peer_name(std::optional<std::string> const &display_name,
                              std::span<std::uint8_t const> app_data,
                              std::string_view peer_id)
{
    if (display_name)
    {
        auto trimmed = trim_copy(*display_name);
        if (!trimmed.empty())
        {
            return trimmed;
        }
    }
    if (auto name = name_from_app_data(app_data))
    {
        return *name;
    }
    if (peer_id.size() >= 8)
    {
        return "Peer " + utils::to_upper_ascii(peer_id.substr(0, 8));
    }
    return "Unknown Peer";
}

} // namespace mp::engine
