#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

#include "misc/address.hpp"
#include "misc/hash.hpp"
#include "torrent/manifest.hpp"

namespace swarmget::torrent {

using InfoHash = utils::Sha1Digest;

enum class DescriptorError
{
    INVALID_MAGNET,
    BAD_INFO_HASH,
    FILE_NOT_FOUND,
    BAD_TORRENT_FILE,
    BAD_MANIFEST,
};

/**
 * @brief What to download: content hash plus optional hints
 *
 * Built once before the swarm starts and never modified afterwards.
 */
struct ContentDescriptor
{
    InfoHash info_hash{};
    std::optional<std::string> display_name;
    std::vector<std::string> trackers;
    std::vector<utils::PeerAddress> peer_hints;
    bool dht = false;
    std::optional<Manifest> manifest;

    /**
     * @brief Parse "magnet:?xt=urn:btih:<hash>&dn=..&tr=..&x.pe=.."
     *
     * The hash may be 40 hex or 32 base32 characters.
     */
    static auto from_magnet(std::string_view uri)
      -> tl::expected<ContentDescriptor, DescriptorError>;

    /**
     * @brief Parse bencoded .torrent content; the manifest is embedded
     */
    static auto from_torrent(std::string_view content)
      -> tl::expected<ContentDescriptor, DescriptorError>;

    static auto from_torrent_file(const std::filesystem::path& path)
      -> tl::expected<ContentDescriptor, DescriptorError>;

    /**
     * @brief Magnet URI if `source` starts with "magnet:", otherwise a path
     */
    static auto from_source(const std::string& source)
      -> tl::expected<ContentDescriptor, DescriptorError>;

    auto info_hash_hex() const -> std::string
    {
        return utils::to_hex(info_hash);
    }

    /**
     * @brief Manifest name, display name or the hash, whichever is known
     */
    auto name() const -> std::string;
};

auto url_decode(std::string_view encoded) -> std::optional<std::string>;

auto base32_decode(std::string_view encoded)
  -> std::optional<std::vector<std::uint8_t>>;

}  // namespace swarmget::torrent
