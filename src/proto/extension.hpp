#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "proto/types.hpp"

namespace swarmget::proto {

// BEP 10: sub-id 0 of the extended message is the extension handshake
constexpr const uint8_t EXTENDED_HANDSHAKE_ID = 0;

// Id under which we ask peers to address ut_metadata messages to us
constexpr const uint8_t LOCAL_UT_METADATA_ID = 1;

constexpr const char* UT_METADATA = "ut_metadata";

// BEP 9 metadata is exchanged in 16 KiB pieces
constexpr const std::size_t METADATA_PIECE_SIZE = 16 * 1024;

// Refuse to assemble absurd info dictionaries
constexpr const std::size_t MAX_METADATA_SIZE = 16 * 1024 * 1024;

struct ExtendedHandshake
{
    // Extension name -> id the sender wants to receive it under (0 = disabled)
    std::map<std::string, uint8_t> extensions;
    std::optional<std::size_t> metadata_size;
    std::string client;

    auto extension_id(const std::string& name) const -> std::optional<uint8_t>;
};

enum class MetadataMsgType : uint8_t
{
    Request = 0,
    Data = 1,
    Reject = 2,
};

struct MetadataMsg
{
    MetadataMsgType type;
    std::size_t piece;
    std::optional<std::size_t> total_size;
    std::vector<uint8_t> data;
};

/**
 * @brief Bencoded extension handshake payload (without frame header)
 */
auto pack_extended_handshake(const ExtendedHandshake& handshake)
  -> std::vector<uint8_t>;

auto unpack_extended_handshake(std::span<const uint8_t> payload)
  -> tl::expected<ExtendedHandshake, Error>;

/**
 * @brief Bencoded ut_metadata header followed by the data for Data messages
 */
auto pack_metadata_msg(const MetadataMsg& msg) -> std::vector<uint8_t>;

auto unpack_metadata_msg(std::span<const uint8_t> payload)
  -> tl::expected<MetadataMsg, Error>;

}  // namespace swarmget::proto
