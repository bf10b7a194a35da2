#include "proto/extension.hpp"

#include <string_view>

#include <magic_enum.hpp>

#include "bencode/decoders.hpp"
#include "bencode/encoders.hpp"
#include "bencode/tools.hpp"
#include "bencode/types.hpp"

namespace swarmget::proto {

namespace {

auto as_view(std::span<const uint8_t> bytes) -> std::string_view
{
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

auto to_bytes(const std::string& str) -> std::vector<uint8_t>
{
    return {str.begin(), str.end()};
}

}  // namespace

auto ExtendedHandshake::extension_id(const std::string& name) const
  -> std::optional<uint8_t>
{
    auto found = extensions.find(name);
    if (found == extensions.end() or found->second == 0) {
        return std::nullopt;
    }
    return found->second;
}

auto pack_extended_handshake(const ExtendedHandshake& handshake)
  -> std::vector<uint8_t>
{
    bencode::Json m = bencode::Json::object();
    for (const auto& [name, id] : handshake.extensions) {
        m[name] = bencode::Integer(id);
    }

    bencode::Json dict = bencode::Json::object();
    dict["m"] = m;

    if (handshake.metadata_size) {
        dict["metadata_size"] = bencode::Integer(*handshake.metadata_size);
    }
    if (not handshake.client.empty()) {
        dict["v"] = handshake.client;
    }

    return to_bytes(*bencode::encode(dict));
}

auto unpack_extended_handshake(std::span<const uint8_t> payload)
  -> tl::expected<ExtendedHandshake, Error>
{
    auto decoded = bencode::decode_all(as_view(payload));
    if (not decoded) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    auto& [_, dict] = *decoded;
    if (not dict.is_object()) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    ExtendedHandshake handshake;

    if (auto m = dict.find("m"); m != dict.end() and m->is_object()) {
        for (const auto& [name, id] : m->items()) {
            auto value = bencode::as_integer(id);
            if (value and *value >= 0 and *value <= 255) {
                handshake.extensions[name] = static_cast<uint8_t>(*value);
            }
        }
    }

    if (auto size = dict.find("metadata_size"); size != dict.end()) {
        auto value = bencode::as_integer(*size);
        if (not value or *value <= 0) {
            return tl::make_unexpected(Error::MALFORMED_MESSAGE);
        }
        handshake.metadata_size = static_cast<std::size_t>(*value);
    }

    if (auto client = dict.find("v"); client != dict.end()) {
        handshake.client = bencode::as_string(*client).value_or("");
    }

    return handshake;
}

auto pack_metadata_msg(const MetadataMsg& msg) -> std::vector<uint8_t>
{
    bencode::Json dict = bencode::Json::object();
    dict["msg_type"] = bencode::Integer(magic_enum::enum_integer(msg.type));
    dict["piece"] = bencode::Integer(msg.piece);

    if (msg.total_size) {
        dict["total_size"] = bencode::Integer(*msg.total_size);
    }

    auto packed = to_bytes(*bencode::encode(dict));

    if (msg.type == MetadataMsgType::Data) {
        packed.insert(packed.end(), msg.data.begin(), msg.data.end());
    }

    return packed;
}

auto unpack_metadata_msg(std::span<const uint8_t> payload)
  -> tl::expected<MetadataMsg, Error>
{
    const auto text = as_view(payload);

    auto decoded = bencode::decode(text);
    if (not decoded) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    auto& [header, dict] = *decoded;
    if (not dict.is_object() or not dict.contains("msg_type") or
        not dict.contains("piece")) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    const auto msg_type = bencode::as_integer(dict["msg_type"]);
    const auto piece = bencode::as_integer(dict["piece"]);

    if (not msg_type or not piece or *piece < 0) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    auto type = magic_enum::enum_cast<MetadataMsgType>(*msg_type);
    if (not type) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    MetadataMsg msg{*type, static_cast<std::size_t>(*piece), std::nullopt, {}};

    if (dict.contains("total_size")) {
        const auto total_size = bencode::as_integer(dict["total_size"]);
        if (not total_size or *total_size <= 0) {
            return tl::make_unexpected(Error::MALFORMED_MESSAGE);
        }
        msg.total_size = static_cast<std::size_t>(*total_size);
    }

    const auto trailing = payload.subspan(header.value.size());

    if (msg.type == MetadataMsgType::Data) {
        msg.data.assign(trailing.begin(), trailing.end());
    }
    else if (not trailing.empty()) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    return msg;
}

}  // namespace swarmget::proto
