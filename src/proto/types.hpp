#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include <magic_enum.hpp>

namespace swarmget::proto {

enum class MsgId : uint8_t
{
    Choke = 0,
    Unchoke = 1,
    Interested = 2,
    NotInterested = 3,
    Have = 4,
    Bitfield = 5,
    Request = 6,
    Piece = 7,
    Cancel = 8,
    Port = 9,
    Extended = 20,
};

enum class Error
{
    INCOMPLETE_MESSAGE,
    MALFORMED_MESSAGE,
    UNKNOWN_MESSAGE_ID,
    MESSAGE_TOO_LONG,
    BAD_PROTOCOL_STRING,
};

constexpr const std::size_t LENGTH_PREFIX_SIZE = 4;

// Largest frame accepted from a peer: a 16 KiB block plus headers fits many
// times over, a bitfield for ~16M pieces still fits.
constexpr const std::size_t MAX_FRAME_LENGTH = 2 * 1024 * 1024;

struct PeerHandshakeMsg
{
    constexpr static std::size_t HEADER_SIZE = 20;
    constexpr static std::size_t RESERVED_SIZE = 8;
    constexpr static std::size_t HASH_SIZE = 20;
    constexpr static std::size_t PEER_ID_SIZE = 20;

    constexpr static std::string_view PROTOCOL = "BitTorrent protocol";

    // BEP 10: reserved byte 5, bit 0x10
    constexpr static std::size_t EXTENSION_BYTE = 5;
    constexpr static std::uint8_t EXTENSION_BIT = 0x10;

    std::array<uint8_t, RESERVED_SIZE> reserved{0};
    std::array<uint8_t, HASH_SIZE> info_hash{};
    std::array<uint8_t, PEER_ID_SIZE> peer_id{};

    constexpr static size_t SIZE =
      HEADER_SIZE + RESERVED_SIZE + HASH_SIZE + PEER_ID_SIZE;

    auto supports_extensions() const -> bool
    {
        return (reserved[EXTENSION_BYTE] & EXTENSION_BIT) != 0;
    }
};

struct KeepAliveMsg
{
};

template<MsgId ID>
struct StateMsg
{
    static constexpr MsgId id = ID;
};

using ChokeMsg = StateMsg<MsgId::Choke>;
using UnchokeMsg = StateMsg<MsgId::Unchoke>;
using InterestedMsg = StateMsg<MsgId::Interested>;
using NotInterestedMsg = StateMsg<MsgId::NotInterested>;

struct HaveMsg
{
    constexpr static std::size_t SIZE = 4;

    uint32_t index;
};

struct BitfieldMsg
{
    std::vector<uint8_t> bits;
};

struct RequestMsg
{
    constexpr static std::size_t SIZE = 12;

    uint32_t index;
    uint32_t begin;
    uint32_t length;
};

struct CancelMsg
{
    uint32_t index;
    uint32_t begin;
    uint32_t length;
};

struct PieceMsg
{
    constexpr static std::size_t INDEX_SIZE = 4;
    constexpr static std::size_t BEGIN_SIZE = 4;

    constexpr static size_t MIN_SIZE = INDEX_SIZE + BEGIN_SIZE;

    uint32_t index;
    uint32_t begin;
    std::vector<uint8_t> block;
};

struct PortMsg
{
    constexpr static std::size_t SIZE = 2;

    uint16_t port;
};

struct ExtendedMsg
{
    uint8_t extended_id;
    std::vector<uint8_t> payload;
};

using Message = std::variant<
  KeepAliveMsg,
  ChokeMsg,
  UnchokeMsg,
  InterestedMsg,
  NotInterestedMsg,
  HaveMsg,
  BitfieldMsg,
  RequestMsg,
  PieceMsg,
  CancelMsg,
  PortMsg,
  ExtendedMsg>;

}  // namespace swarmget::proto
