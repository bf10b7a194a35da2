#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "proto/types.hpp"

namespace swarmget::proto {

auto pack_keepalive_msg() -> std::vector<uint8_t>;
auto pack_choke_msg() -> std::vector<uint8_t>;
auto pack_unchoke_msg() -> std::vector<uint8_t>;
auto pack_interested_msg() -> std::vector<uint8_t>;
auto pack_not_interested_msg() -> std::vector<uint8_t>;
auto pack_have_msg(uint32_t piece_idx) -> std::vector<uint8_t>;
auto pack_bitfield_msg(std::span<const uint8_t> bits) -> std::vector<uint8_t>;
auto pack_request_msg(uint32_t piece_idx, uint32_t begin, uint32_t length)
  -> std::vector<uint8_t>;
auto pack_piece_msg(
  uint32_t piece_idx, uint32_t begin, std::span<const uint8_t> block
) -> std::vector<uint8_t>;
auto pack_extended_msg(uint8_t extended_id, std::span<const uint8_t> payload)
  -> std::vector<uint8_t>;

auto pack_handshake(const PeerHandshakeMsg& msg) -> std::vector<uint8_t>;


namespace internal {

/**
 * @brief Length prefix and id; `length` counts the id byte and the payload
 */
auto pack_msg_header(MsgId msg_id, size_t length) -> std::vector<uint8_t>;

}

}  // namespace swarmget::proto
