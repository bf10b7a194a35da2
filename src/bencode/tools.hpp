#pragma once

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bencode/types.hpp"

namespace bencode {

inline auto to_integer(std::string_view s) -> std::optional<Integer>
{
    Integer value{};
    auto result = std::from_chars(s.data(), s.data() + s.size(), value);

    if (result.ec != std::errc{} or result.ptr != s.end()) {
        return std::nullopt;
    }

    return value;
};

inline auto is_valid_utf8(std::string_view s) -> bool
{
    std::size_t i = 0;

    while (i < s.size()) {
        const auto lead = static_cast<std::uint8_t>(s[i]);

        std::size_t continuation = 0;
        if (lead < 0x80) {
            continuation = 0;
        }
        else if ((lead & 0xE0) == 0xC0 and lead >= 0xC2) {
            continuation = 1;
        }
        else if ((lead & 0xF0) == 0xE0) {
            continuation = 2;
        }
        else if ((lead & 0xF8) == 0xF0 and lead <= 0xF4) {
            continuation = 3;
        }
        else {
            return false;
        }

        if (continuation > 0 and i + continuation >= s.size()) {
            return false;
        }

        for (std::size_t k = 1; k <= continuation; k++) {
            if ((static_cast<std::uint8_t>(s[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }

        i += continuation + 1;
    }

    return true;
}

/**
 * @brief Bytes of a decoded bencode string
 *
 * The decoder keeps UTF-8 strings as Json strings and everything else as
 * Json binary, so both have to be accepted wherever raw bytes are expected.
 */
inline auto as_bytes(const Json& value) -> std::optional<std::vector<uint8_t>>
{
    if (value.is_binary()) {
        const auto& bin = value.get_binary();
        return std::vector<uint8_t>(bin.begin(), bin.end());
    }

    if (value.is_string()) {
        const auto& str = value.get_ref<const std::string&>();
        return std::vector<uint8_t>(str.begin(), str.end());
    }

    return std::nullopt;
}

inline auto as_string(const Json& value) -> std::optional<std::string>
{
    auto bytes = as_bytes(value);
    if (not bytes) {
        return std::nullopt;
    }

    return std::string(bytes->begin(), bytes->end());
}

inline auto as_integer(const Json& value) -> std::optional<Integer>
{
    if (not value.is_number_integer()) {
        return std::nullopt;
    }

    return value.get<Integer>();
}

}  // namespace bencode
