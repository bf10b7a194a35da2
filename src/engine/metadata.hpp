#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "engine/types.hpp"
#include "proto/extension.hpp"
#include "torrent/descriptor.hpp"

namespace swarmget::engine {

enum class MetadataStatus
{
    Pending,
    Complete,
    // Assembled bytes did not hash to the info hash, pieces were reset
    Corrupt,
    // Too many corrupt assemblies
    Exhausted,
};

/**
 * @brief Collects the info dictionary from peers in 16 KiB pieces
 *
 * One request per peer is outstanding at a time. Peers that reject a
 * request are not asked again.
 */
class MetadataAssembler
{
 public:
    MetadataAssembler(torrent::InfoHash info_hash, std::size_t retry_limit);

    /**
     * @brief Learn the size from a peer's extension handshake
     *
     * The first plausible size wins; returns false when the peer's size is
     * unusable or contradicts the known one.
     */
    auto on_size(PeerKey peer, std::size_t metadata_size) -> bool;

    auto next_request(PeerKey peer) -> std::optional<std::size_t>;

    auto on_data(PeerKey peer, const proto::MetadataMsg& msg)
      -> MetadataStatus;

    void on_reject(PeerKey peer, std::size_t piece);
    void remove_peer(PeerKey peer);

    auto is_complete() const -> bool { return _complete; }
    auto failures() const -> std::size_t { return _failures; }
    auto size() const -> std::optional<std::size_t> { return _size; }
    auto piece_count() const -> std::size_t { return _pieces.size(); }

    /**
     * @brief Raw bencoded info dictionary, valid once complete
     */
    auto info_bytes() const -> const std::string& { return _info; }

 private:
    auto _piece_length(std::size_t piece) const -> std::size_t;
    auto _assemble() -> MetadataStatus;

    const torrent::InfoHash _info_hash;
    const std::size_t _retry_limit;

    std::optional<std::size_t> _size;
    std::vector<std::optional<std::vector<std::uint8_t>>> _pieces;
    std::map<PeerKey, std::size_t> _requests;
    std::set<PeerKey> _refused;
    std::size_t _failures = 0;
    bool _complete = false;
    std::string _info;
};

}  // namespace swarmget::engine
