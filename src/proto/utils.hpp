#pragma once

#include <cstdint>
#include <span>
#include <vector>

namespace swarmget::proto::utils {

// Network byte order regardless of host endianness

inline auto append_u32(std::vector<uint8_t>& out, uint32_t value) -> void
{
    out.push_back((value >> 24) & 0xFF);  // Most significant byte
    out.push_back((value >> 16) & 0xFF);
    out.push_back((value >> 8) & 0xFF);
    out.push_back(value & 0xFF);          // Least significant byte
}

inline auto pack_u32(uint32_t value) -> std::vector<uint8_t>
{
    std::vector<uint8_t> packed;
    packed.reserve(4);
    append_u32(packed, value);
    return packed;
}

inline auto unpack_u32(std::span<const uint8_t> msg) -> uint32_t
{
    return (uint32_t)msg[0] << 24 | ((uint32_t)msg[1] << 16) |
           ((uint32_t)msg[2] << 8) | ((uint32_t)msg[3]);
}

inline auto unpack_u16(std::span<const uint8_t> msg) -> uint16_t
{
    return static_cast<uint16_t>((uint16_t)msg[0] << 8 | (uint16_t)msg[1]);
}

}  // namespace swarmget::proto::utils
