#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <sha1.hpp>

namespace utils {

constexpr const std::size_t SHA1_LENGTH = 20;

using Sha1Digest = std::array<std::uint8_t, SHA1_LENGTH>;

inline auto to_hex(std::span<const std::uint8_t> bytes) -> std::string
{
    return fmt::format("{:02x}", fmt::join(bytes, ""));
}

inline auto hex_to_bytes(std::string_view hex)
  -> std::optional<std::vector<std::uint8_t>>
{
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' and c <= '9') {
            return c - '0';
        }
        if (c >= 'a' and c <= 'f') {
            return c - 'a' + 10;
        }
        if (c >= 'A' and c <= 'F') {
            return c - 'A' + 10;
        }
        return -1;
    };

    std::vector<std::uint8_t> bytes;
    bytes.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        const auto high = nibble(hex[i]);
        const auto low = nibble(hex[i + 1]);

        if (high < 0 or low < 0) {
            return std::nullopt;
        }

        bytes.push_back(static_cast<std::uint8_t>(high << 4 | low));
    }

    return bytes;
}

/**
 * @brief SHA1 of a byte range as lowercase hex
 */
inline auto sha1_hex(std::span<const std::uint8_t> data) -> std::string
{
    SHA1 checksum;
    checksum.update(std::string(data.begin(), data.end()));
    return checksum.final();
}

inline auto sha1_hex(std::string_view data) -> std::string
{
    SHA1 checksum;
    checksum.update(std::string(data));
    return checksum.final();
}

inline auto sha1_digest(std::string_view data) -> Sha1Digest
{
    const auto bytes = hex_to_bytes(sha1_hex(data));

    Sha1Digest digest{};
    std::copy_n(bytes->begin(), SHA1_LENGTH, digest.begin());
    return digest;
}

inline auto sha1_matches(
  std::span<const std::uint8_t> data, const Sha1Digest& expected
) -> bool
{
    return sha1_hex(data) == to_hex(expected);
}

}  // namespace utils
