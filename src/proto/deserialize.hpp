#pragma once

#include <cstdint>
#include <span>

#include <tl/expected.hpp>

#include "proto/types.hpp"

namespace swarmget::proto {

/**
 * @brief Decode and bound-check the 4-byte length prefix of a frame
 */
auto unpack_length_prefix(std::span<const uint8_t> prefix)
  -> tl::expected<uint32_t, Error>;

/**
 * @brief Decode a frame body (message id followed by payload)
 *
 * An empty body is a keep-alive. Payload sizes are checked against the
 * message id; anything inconsistent is MALFORMED_MESSAGE.
 */
auto unpack_message(std::span<const uint8_t> body)
  -> tl::expected<Message, Error>;

auto unpack_piece_msg(std::span<const uint8_t> payload)
  -> tl::expected<PieceMsg, Error>;

auto unpack_have_msg(std::span<const uint8_t> payload)
  -> tl::expected<HaveMsg, Error>;

auto unpack_request_msg(std::span<const uint8_t> payload)
  -> tl::expected<RequestMsg, Error>;

auto unpack_handshake(std::span<const uint8_t> msg)
  -> tl::expected<PeerHandshakeMsg, Error>;

}  // namespace swarmget::proto
