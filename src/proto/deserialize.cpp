#include "proto/deserialize.hpp"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <span>
#include <vector>

#include <magic_enum.hpp>
#include <tl/expected.hpp>

#include "proto/types.hpp"
#include "proto/utils.hpp"


namespace swarmget::proto {

namespace {

auto expect_empty(std::span<const uint8_t> payload, Message msg)
  -> tl::expected<Message, Error>
{
    if (not payload.empty()) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }
    return msg;
}

}  // namespace

auto unpack_length_prefix(std::span<const uint8_t> prefix)
  -> tl::expected<uint32_t, Error>
{
    if (prefix.size() < LENGTH_PREFIX_SIZE) {
        return tl::make_unexpected(Error::INCOMPLETE_MESSAGE);
    }

    const auto length = utils::unpack_u32(prefix);

    if (length > MAX_FRAME_LENGTH) {
        return tl::make_unexpected(Error::MESSAGE_TOO_LONG);
    }

    return length;
}

auto unpack_message(std::span<const uint8_t> body)
  -> tl::expected<Message, Error>
{
    if (body.empty()) {
        return KeepAliveMsg{};
    }

    const auto msg_id = magic_enum::enum_cast<MsgId>(body[0]);
    if (not msg_id) {
        return tl::make_unexpected(Error::UNKNOWN_MESSAGE_ID);
    }

    const auto payload = body.subspan(1);

    switch (*msg_id) {
        case MsgId::Choke:
            return expect_empty(payload, ChokeMsg{});
        case MsgId::Unchoke:
            return expect_empty(payload, UnchokeMsg{});
        case MsgId::Interested:
            return expect_empty(payload, InterestedMsg{});
        case MsgId::NotInterested:
            return expect_empty(payload, NotInterestedMsg{});

        case MsgId::Have:
            return unpack_have_msg(payload).map([](auto msg) {
                return Message{msg};
            });

        case MsgId::Bitfield:
            return BitfieldMsg{{payload.begin(), payload.end()}};

        case MsgId::Request:
            return unpack_request_msg(payload).map([](auto msg) {
                return Message{msg};
            });

        case MsgId::Cancel:
            return unpack_request_msg(payload).map([](auto msg) {
                return Message{CancelMsg{msg.index, msg.begin, msg.length}};
            });

        case MsgId::Piece:
            return unpack_piece_msg(payload).map([](auto msg) {
                return Message{std::move(msg)};
            });

        case MsgId::Port:
            if (payload.size() != PortMsg::SIZE) {
                return tl::make_unexpected(Error::MALFORMED_MESSAGE);
            }
            return PortMsg{utils::unpack_u16(payload)};

        case MsgId::Extended:
            if (payload.empty()) {
                return tl::make_unexpected(Error::MALFORMED_MESSAGE);
            }
            return ExtendedMsg{
              payload[0], {std::next(payload.begin()), payload.end()}
            };
    }

    return tl::make_unexpected(Error::UNKNOWN_MESSAGE_ID);
}

auto unpack_piece_msg(std::span<const uint8_t> payload)
  -> tl::expected<PieceMsg, Error>
{
    if (payload.size() < PieceMsg::MIN_SIZE) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    auto iter = payload.begin();

    const auto index =
      utils::unpack_u32({iter, std::next(iter, PieceMsg::INDEX_SIZE)});

    std::advance(iter, PieceMsg::INDEX_SIZE);

    const auto begin =
      utils::unpack_u32({iter, std::next(iter, PieceMsg::BEGIN_SIZE)});

    std::advance(iter, PieceMsg::BEGIN_SIZE);

    return PieceMsg{index, begin, std::vector<uint8_t>(iter, payload.end())};
}

auto unpack_have_msg(std::span<const uint8_t> payload)
  -> tl::expected<HaveMsg, Error>
{
    if (payload.size() != HaveMsg::SIZE) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    return HaveMsg{.index = utils::unpack_u32(payload)};
}

auto unpack_request_msg(std::span<const uint8_t> payload)
  -> tl::expected<RequestMsg, Error>
{
    if (payload.size() != RequestMsg::SIZE) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    return RequestMsg{
      .index = utils::unpack_u32(payload.subspan(0, 4)),
      .begin = utils::unpack_u32(payload.subspan(4, 4)),
      .length = utils::unpack_u32(payload.subspan(8, 4)),
    };
}

auto unpack_handshake(std::span<const uint8_t> msg)
  -> tl::expected<PeerHandshakeMsg, Error>
{
    if (msg.size() < PeerHandshakeMsg::SIZE) {
        return tl::make_unexpected(Error::INCOMPLETE_MESSAGE);
    }

    const auto header_len = static_cast<size_t>(msg[0]);
    const auto header = msg.subspan(1, PeerHandshakeMsg::PROTOCOL.size());

    if (header_len != PeerHandshakeMsg::PROTOCOL.size() or
        not std::ranges::equal(header, PeerHandshakeMsg::PROTOCOL)) {
        return tl::make_unexpected(Error::BAD_PROTOCOL_STRING);
    }

    auto iter = std::next(msg.begin(), 1 + header_len);

    PeerHandshakeMsg handshake;

    std::copy_n(iter, PeerHandshakeMsg::RESERVED_SIZE, handshake.reserved.begin());
    std::advance(iter, PeerHandshakeMsg::RESERVED_SIZE);

    std::copy_n(iter, PeerHandshakeMsg::HASH_SIZE, handshake.info_hash.begin());
    std::advance(iter, PeerHandshakeMsg::HASH_SIZE);

    std::copy_n(iter, PeerHandshakeMsg::PEER_ID_SIZE, handshake.peer_id.begin());

    return handshake;
}

}  // namespace swarmget::proto
