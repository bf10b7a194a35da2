#include <cassert>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <magic_enum.hpp>

#include "proto/bitfield.hpp"
#include "proto/deserialize.hpp"
#include "proto/extension.hpp"
#include "proto/serialize.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

using namespace swarmget;

namespace {

// Frame without its length prefix, as the reader hands it to unpack_message
auto body_of(const std::vector<uint8_t>& frame) -> std::span<const uint8_t>
{
    return std::span(frame).subspan(proto::LENGTH_PREFIX_SIZE);
}

}  // namespace

void test_pack_u32()
{
    uint32_t a = 32768;
    auto packed = proto::utils::pack_u32(a);
    auto unpacked = proto::utils::unpack_u32(packed);
    assert(unpacked == a);
    assert(packed == (std::vector<uint8_t>{0, 0, 0x80, 0}));
}

void test_pack_msg_id()
{
    using namespace proto;

    auto packed = internal::pack_msg_header(MsgId::Piece, 9);
    assert(packed == (std::vector<uint8_t>{0, 0, 0, 9, 7}));

    auto prefix = unpack_length_prefix(packed);
    assert(prefix.has_value() and *prefix == 9);
    assert(magic_enum::enum_cast<MsgId>(packed[4]) == MsgId::Piece);
}

void test_message_roundtrip()
{
    using namespace proto;

    {
        auto frame = pack_request_msg(3, 16384, 16384);
        auto message = unpack_message(body_of(frame));
        assert(message.has_value());

        auto* request = std::get_if<RequestMsg>(&*message);
        assert(request != nullptr);
        assert(request->index == 3);
        assert(request->begin == 16384);
        assert(request->length == 16384);
    }

    {
        const std::vector<uint8_t> block{1, 2, 3, 4, 5};
        auto frame = pack_piece_msg(7, 32, block);
        auto message = unpack_message(body_of(frame));
        assert(message.has_value());

        auto* piece = std::get_if<PieceMsg>(&*message);
        assert(piece != nullptr);
        assert(piece->index == 7);
        assert(piece->begin == 32);
        assert(piece->block == block);
    }

    {
        auto frame = pack_have_msg(42);
        auto message = unpack_message(body_of(frame));
        assert(message.has_value());
        assert(std::get<HaveMsg>(*message).index == 42);
    }

    {
        auto frame = pack_keepalive_msg();
        assert(frame.size() == LENGTH_PREFIX_SIZE);
        assert(std::holds_alternative<KeepAliveMsg>(*unpack_message(body_of(frame))));
    }

    {
        const std::vector<uint8_t> payload{'d', 'e'};
        auto frame = pack_extended_msg(5, payload);
        auto message = unpack_message(body_of(frame));
        assert(message.has_value());

        auto& extended = std::get<ExtendedMsg>(*message);
        assert(extended.extended_id == 5);
        assert(extended.payload == payload);
    }
}

void test_framing_violations()
{
    using namespace proto;

    // Oversized frames are refused before anything is allocated
    {
        auto prefix = utils::pack_u32(MAX_FRAME_LENGTH + 1);
        assert(unpack_length_prefix(prefix).error() == Error::MESSAGE_TOO_LONG);
        assert(*unpack_length_prefix(utils::pack_u32(16)) == 16);
    }

    {
        const std::vector<uint8_t> body{99};
        assert(unpack_message(body).error() == Error::UNKNOWN_MESSAGE_ID);
    }

    // Payload sizes must match the message id
    {
        const std::vector<uint8_t> choke_with_payload{0, 1};
        assert(unpack_message(choke_with_payload).error() == Error::MALFORMED_MESSAGE);

        const std::vector<uint8_t> short_have{4, 0, 0, 1};
        assert(unpack_message(short_have).error() == Error::MALFORMED_MESSAGE);

        const std::vector<uint8_t> short_request{6, 0, 0, 0, 1, 0, 0, 0, 0};
        assert(unpack_message(short_request).error() == Error::MALFORMED_MESSAGE);

        const std::vector<uint8_t> short_piece{7, 0, 0, 0, 1};
        assert(unpack_message(short_piece).error() == Error::MALFORMED_MESSAGE);

        const std::vector<uint8_t> empty_extended{20};
        assert(unpack_message(empty_extended).error() == Error::MALFORMED_MESSAGE);
    }
}

void test_handshake()
{
    using namespace proto;

    PeerHandshakeMsg handshake;
    handshake.info_hash.fill(0xAB);
    handshake.peer_id.fill('p');
    handshake.reserved[PeerHandshakeMsg::EXTENSION_BYTE] |= PeerHandshakeMsg::EXTENSION_BIT;

    auto packed = pack_handshake(handshake);
    assert(packed.size() == PeerHandshakeMsg::SIZE);

    auto unpacked = unpack_handshake(packed);
    assert(unpacked.has_value());
    assert(unpacked->info_hash == handshake.info_hash);
    assert(unpacked->peer_id == handshake.peer_id);
    assert(unpacked->supports_extensions());

    packed[1] = 'X';
    assert(unpack_handshake(packed).error() == Error::BAD_PROTOCOL_STRING);

    packed.resize(20);
    assert(unpack_handshake(packed).error() == Error::INCOMPLETE_MESSAGE);
}

void test_bitfield()
{
    using namespace proto;

    {
        Bitfield bits(10);
        bits.set(0);
        bits.set(9);
        assert(bits.count() == 2);
        assert(bits.to_bytes() == (std::vector<uint8_t>{0x80, 0x40}));

        bits.set(9, false);
        assert(bits.count() == 1);
        assert(not bits.all());
        assert(not bits.none());
    }

    {
        const std::vector<uint8_t> bytes{0xFF, 0xC0};
        auto bits = Bitfield::from_bytes(bytes, 10);
        assert(bits.has_value());
        assert(bits->all());
        assert(bits->size() == 10);
    }

    // Wrong length or spare bits set
    {
        const std::vector<uint8_t> too_long{0xFF, 0x00, 0x00};
        assert(not Bitfield::from_bytes(too_long, 10).has_value());

        const std::vector<uint8_t> spare_bit{0xFF, 0xE0};
        assert(not Bitfield::from_bytes(spare_bit, 10).has_value());
    }

    {
        Bitfield bits(3);
        bool thrown = false;
        try {
            bits.test(3);
        } catch (const std::out_of_range&) {
            thrown = true;
        }
        assert(thrown);
    }
}

void test_extension_messages()
{
    using namespace proto;

    {
        ExtendedHandshake handshake;
        handshake.extensions[UT_METADATA] = 3;
        handshake.extensions["ut_pex"] = 0;
        handshake.metadata_size = 31235;
        handshake.client = "test 1.0";

        auto unpacked = unpack_extended_handshake(pack_extended_handshake(handshake));
        assert(unpacked.has_value());
        assert(unpacked->extension_id(UT_METADATA) == 3);
        assert(not unpacked->extension_id("ut_pex").has_value());
        assert(unpacked->metadata_size == 31235);
        assert(unpacked->client == "test 1.0");
    }

    {
        const std::string bad = "d13:metadata_sizei-5ee";
        const std::vector<uint8_t> payload(bad.begin(), bad.end());
        assert(not unpack_extended_handshake(payload).has_value());
    }

    // Data messages carry raw bytes after the bencoded header
    {
        MetadataMsg data{MetadataMsgType::Data, 1, 20000, {'e', 'x', 'y'}};
        auto unpacked = unpack_metadata_msg(pack_metadata_msg(data));
        assert(unpacked.has_value());
        assert(unpacked->type == MetadataMsgType::Data);
        assert(unpacked->piece == 1);
        assert(unpacked->total_size == 20000);
        assert(unpacked->data == data.data);
    }

    {
        MetadataMsg request{MetadataMsgType::Request, 2, std::nullopt, {}};
        auto packed = pack_metadata_msg(request);

        auto unpacked = unpack_metadata_msg(packed);
        assert(unpacked.has_value());
        assert(unpacked->type == MetadataMsgType::Request);
        assert(unpacked->data.empty());

        // Only data messages may have a tail
        packed.push_back('x');
        assert(not unpack_metadata_msg(packed).has_value());
    }

    {
        const std::string unknown_type = "d8:msg_typei7e5:piecei0ee";
        const std::vector<uint8_t> payload(unknown_type.begin(), unknown_type.end());
        assert(not unpack_metadata_msg(payload).has_value());
    }
}
