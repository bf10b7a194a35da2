#include "proto/serialize.hpp"

#include <cstdint>
#include <vector>

#include "proto/types.hpp"
#include "proto/utils.hpp"

namespace swarmget::proto {

using namespace internal;

namespace {

auto pack_triplet_msg(MsgId id, uint32_t index, uint32_t begin, uint32_t length)
  -> std::vector<uint8_t>
{
    auto msg = pack_msg_header(id, RequestMsg::SIZE + 1);
    utils::append_u32(msg, index);
    utils::append_u32(msg, begin);
    utils::append_u32(msg, length);
    return msg;
}

}  // namespace

auto pack_keepalive_msg() -> std::vector<uint8_t>
{
    return utils::pack_u32(0);
}

auto pack_choke_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgId::Choke, 1);
}

auto pack_unchoke_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgId::Unchoke, 1);
}

auto pack_interested_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgId::Interested, 1);
}

auto pack_not_interested_msg() -> std::vector<uint8_t>
{
    return pack_msg_header(MsgId::NotInterested, 1);
}

auto pack_have_msg(uint32_t piece_idx) -> std::vector<uint8_t>
{
    auto msg = pack_msg_header(MsgId::Have, HaveMsg::SIZE + 1);
    utils::append_u32(msg, piece_idx);
    return msg;
}

auto pack_bitfield_msg(std::span<const uint8_t> bits) -> std::vector<uint8_t>
{
    auto msg = pack_msg_header(MsgId::Bitfield, bits.size() + 1);
    msg.insert(msg.end(), bits.begin(), bits.end());
    return msg;
}

auto pack_request_msg(uint32_t piece_idx, uint32_t begin, uint32_t length)
  -> std::vector<uint8_t>
{
    return pack_triplet_msg(MsgId::Request, piece_idx, begin, length);
}

auto pack_piece_msg(
  uint32_t piece_idx, uint32_t begin, std::span<const uint8_t> block
) -> std::vector<uint8_t>
{
    auto msg =
      pack_msg_header(MsgId::Piece, PieceMsg::MIN_SIZE + block.size() + 1);
    utils::append_u32(msg, piece_idx);
    utils::append_u32(msg, begin);
    msg.insert(msg.end(), block.begin(), block.end());
    return msg;
}

auto pack_extended_msg(uint8_t extended_id, std::span<const uint8_t> payload)
  -> std::vector<uint8_t>
{
    auto msg = pack_msg_header(MsgId::Extended, payload.size() + 2);
    msg.push_back(extended_id);
    msg.insert(msg.end(), payload.begin(), payload.end());
    return msg;
}

auto pack_handshake(const PeerHandshakeMsg& msg) -> std::vector<uint8_t>
{
    std::vector<uint8_t> packed;
    packed.reserve(PeerHandshakeMsg::SIZE);

    packed.push_back(PeerHandshakeMsg::PROTOCOL.size());
    packed.insert(
      packed.end(), PeerHandshakeMsg::PROTOCOL.begin(),
      PeerHandshakeMsg::PROTOCOL.end()
    );
    packed.insert(packed.end(), msg.reserved.begin(), msg.reserved.end());
    packed.insert(packed.end(), msg.info_hash.begin(), msg.info_hash.end());
    packed.insert(packed.end(), msg.peer_id.begin(), msg.peer_id.end());

    return packed;
}

}  // namespace swarmget::proto


namespace swarmget::proto::internal {

auto pack_msg_header(MsgId msg_id, size_t length) -> std::vector<uint8_t>
{
    auto packed = utils::pack_u32(uint32_t(length));
    packed.push_back(uint8_t(msg_id));
    return packed;
}

}  // namespace swarmget::proto::internal
