#include "torrent/descriptor.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

#include <magic_enum.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/view/split.hpp>
#include <range/v3/range/conversion.hpp>
#include <spdlog/spdlog.h>

#include "bencode/decoders.hpp"
#include "bencode/tools.hpp"

namespace swarmget::torrent {

namespace {

constexpr const std::string_view MAGNET_PREFIX = "magnet:?";
constexpr const std::string_view BTIH_PREFIX = "urn:btih:";

constexpr const std::size_t HEX_HASH_LENGTH = 40;
constexpr const std::size_t BASE32_HASH_LENGTH = 32;

auto parse_info_hash(std::string_view text) -> std::optional<InfoHash>
{
    std::optional<std::vector<std::uint8_t>> bytes;

    if (text.size() == HEX_HASH_LENGTH) {
        bytes = utils::hex_to_bytes(text);
    }
    else if (text.size() == BASE32_HASH_LENGTH) {
        bytes = base32_decode(text);
    }

    if (not bytes or bytes->size() != utils::SHA1_LENGTH) {
        return std::nullopt;
    }

    InfoHash hash{};
    std::copy(bytes->begin(), bytes->end(), hash.begin());
    return hash;
}

void add_tracker(std::vector<std::string>& trackers, std::string url)
{
    if (not url.empty() and ranges::find(trackers, url) == trackers.end()) {
        trackers.push_back(std::move(url));
    }
}

}  // namespace

auto url_decode(std::string_view encoded) -> std::optional<std::string>
{
    std::string decoded;
    decoded.reserve(encoded.size());

    for (std::size_t i = 0; i < encoded.size(); i++) {
        const char c = encoded[i];

        if (c == '+') {
            decoded.push_back(' ');
        }
        else if (c == '%') {
            if (i + 2 >= encoded.size()) {
                return std::nullopt;
            }

            auto byte = utils::hex_to_bytes(encoded.substr(i + 1, 2));
            if (not byte) {
                return std::nullopt;
            }

            decoded.push_back(static_cast<char>(byte->front()));
            i += 2;
        }
        else {
            decoded.push_back(c);
        }
    }

    return decoded;
}

auto base32_decode(std::string_view encoded)
  -> std::optional<std::vector<std::uint8_t>>
{
    std::vector<std::uint8_t> decoded;

    std::uint32_t buffer = 0;
    int bits = 0;

    for (unsigned char c : encoded) {
        const auto upper = static_cast<char>(std::toupper(c));

        int value = -1;
        if (upper >= 'A' and upper <= 'Z') {
            value = upper - 'A';
        }
        else if (upper >= '2' and upper <= '7') {
            value = upper - '2' + 26;
        }
        else {
            return std::nullopt;
        }

        buffer = (buffer << 5) | std::uint32_t(value);
        bits += 5;

        if (bits >= 8) {
            bits -= 8;
            decoded.push_back(static_cast<std::uint8_t>(buffer >> bits));
            buffer &= (1u << bits) - 1;
        }
    }

    return decoded;
}

auto ContentDescriptor::from_magnet(std::string_view uri)
  -> tl::expected<ContentDescriptor, DescriptorError>
{
    if (not uri.starts_with(MAGNET_PREFIX)) {
        return tl::make_unexpected(DescriptorError::INVALID_MAGNET);
    }

    ContentDescriptor descriptor;
    descriptor.dht = true;

    bool has_hash = false;

    const auto query = std::string(uri.substr(MAGNET_PREFIX.size()));

    for (auto&& part : query | ranges::views::split('&')) {
        const auto param = part | ranges::to<std::string>();

        const auto eq = param.find('=');
        if (eq == std::string::npos) {
            continue;
        }

        const auto key = param.substr(0, eq);
        auto value = url_decode(std::string_view(param).substr(eq + 1));
        if (not value) {
            return tl::make_unexpected(DescriptorError::INVALID_MAGNET);
        }

        if (key == "xt") {
            if (has_hash or not value->starts_with(BTIH_PREFIX)) {
                continue;
            }

            auto hash = parse_info_hash(
              std::string_view(*value).substr(BTIH_PREFIX.size())
            );
            if (not hash) {
                return tl::make_unexpected(DescriptorError::BAD_INFO_HASH);
            }

            descriptor.info_hash = *hash;
            has_hash = true;
        }
        else if (key == "dn") {
            descriptor.display_name = *value;
        }
        else if (key == "tr") {
            add_tracker(descriptor.trackers, *value);
        }
        else if (key == "x.pe") {
            if (auto peer = utils::parse_ip_port(*value)) {
                descriptor.peer_hints.push_back(*peer);
            }
            else {
                spdlog::warn("Ignoring malformed peer hint \"{}\"", *value);
            }
        }
    }

    if (not has_hash) {
        return tl::make_unexpected(DescriptorError::INVALID_MAGNET);
    }

    return descriptor;
}

auto ContentDescriptor::from_torrent(std::string_view content)
  -> tl::expected<ContentDescriptor, DescriptorError>
{
    auto decoded = bencode::decode_all(content);
    if (not decoded) {
        return tl::make_unexpected(DescriptorError::BAD_TORRENT_FILE);
    }

    auto [_, meta] = *decoded;
    if (not meta.is_object() or not meta.contains("info")) {
        return tl::make_unexpected(DescriptorError::BAD_TORRENT_FILE);
    }

    // The hash must cover the info dictionary exactly as it was stored
    auto raw_info = bencode::find_raw_value(content, "info");
    if (not raw_info) {
        return tl::make_unexpected(DescriptorError::BAD_TORRENT_FILE);
    }

    auto manifest = Manifest::from_info(meta["info"]);
    if (not manifest) {
        spdlog::error(
          "Bad info dictionary: {}", magic_enum::enum_name(manifest.error())
        );
        return tl::make_unexpected(DescriptorError::BAD_MANIFEST);
    }

    ContentDescriptor descriptor;
    descriptor.info_hash = utils::sha1_digest(*raw_info);
    descriptor.display_name = manifest->name;
    descriptor.dht = not manifest->is_private;

    if (meta.contains("announce")) {
        add_tracker(
          descriptor.trackers, bencode::as_string(meta["announce"]).value_or("")
        );
    }

    if (meta.contains("announce-list") and meta["announce-list"].is_array()) {
        for (const auto& tier : meta["announce-list"]) {
            if (not tier.is_array()) {
                continue;
            }
            for (const auto& url : tier) {
                add_tracker(
                  descriptor.trackers, bencode::as_string(url).value_or("")
                );
            }
        }
    }

    descriptor.manifest = std::move(*manifest);

    return descriptor;
}

auto ContentDescriptor::from_torrent_file(const std::filesystem::path& path)
  -> tl::expected<ContentDescriptor, DescriptorError>
{
    if (not std::filesystem::exists(path)) {
        return tl::make_unexpected(DescriptorError::FILE_NOT_FOUND);
    }

    auto content = [&]() {
        std::ifstream torrent_file;
        torrent_file.open(path, std::ios::in | std::ios::binary);

        return std::string(
          (std::istreambuf_iterator<char>(torrent_file)),
          (std::istreambuf_iterator<char>())
        );
    }();

    return from_torrent(content);
}

auto ContentDescriptor::from_source(const std::string& source)
  -> tl::expected<ContentDescriptor, DescriptorError>
{
    if (source.starts_with("magnet:")) {
        return from_magnet(source);
    }

    return from_torrent_file(source);
}

auto ContentDescriptor::name() const -> std::string
{
    if (manifest) {
        return manifest->name;
    }

    return display_name.value_or(info_hash_hex());
}

}  // namespace swarmget::torrent
