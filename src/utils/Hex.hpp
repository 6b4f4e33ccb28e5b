#pragma once

#include <cctype>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mp::utils
{

inline std::string encode_hex(std::span<std::uint8_t const> bytes)
{
    static constexpr char const *kDigits = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes)
    {
        result.push_back(kDigits[(byte >> 4) & 0x0F]);
        result.push_back(kDigits[byte & 0x0F]);
    }
    return result;
}

inline int hex_value(char ch)
{
    if (ch >= '0' && ch <= '9')
    {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f')
    {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F')
    {
        return ch - 'A' + 10;
    }
    return -1;
}

// Accepts separators (space, ':') between byte pairs.
inline std::optional<std::vector<std::uint8_t>>
decode_hex(std::string_view input)
{
    std::vector<std::uint8_t> result;
    result.reserve(input.size() / 2);
    int high = -1;
    for (char ch : input)
    {
        if (ch == ':' || std::isspace(static_cast<unsigned char>(ch)))
        {
            continue;
        }
        int value = hex_value(ch);
        if (value < 0)
        {
            return std::nullopt;
        }
        if (high < 0)
        {
            high = value;
            continue;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | value));
        high = -1;
    }
    if (high >= 0)
    {
        return std::nullopt;
    }
    return result;
}

inline std::string to_lower_ascii(std::string_view value)
{
    std::string result(value);
    for (auto &ch : result)
    {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return result;
}

inline std::string to_upper_ascii(std::string_view value)
{
    std::string result(value);
    for (auto &ch : result)
    {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return result;
}

} // namespace mp::utils
