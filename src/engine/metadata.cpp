#include "engine/metadata.hpp"

#include <algorithm>

#include "misc/hash.hpp"
#include "misc/logger.hpp"

namespace swarmget::engine {

MetadataAssembler::MetadataAssembler(
  torrent::InfoHash info_hash, std::size_t retry_limit
) :
  _info_hash(info_hash), _retry_limit(std::max<std::size_t>(retry_limit, 1))
{
}

auto MetadataAssembler::on_size(PeerKey peer, std::size_t metadata_size)
  -> bool
{
    if (metadata_size == 0 or metadata_size > proto::MAX_METADATA_SIZE) {
        _refused.insert(peer);
        return false;
    }

    if (_size) {
        if (*_size != metadata_size) {
            utils::internal_logger()->debug(
              "Peer {} reports metadata size {}, expected {}", peer,
              metadata_size, *_size
            );
            _refused.insert(peer);
            return false;
        }
        return true;
    }

    _size = metadata_size;
    _pieces.assign(
      (metadata_size + proto::METADATA_PIECE_SIZE - 1) /
        proto::METADATA_PIECE_SIZE,
      std::nullopt
    );

    return true;
}

auto MetadataAssembler::next_request(PeerKey peer)
  -> std::optional<std::size_t>
{
    if (_complete or not _size or _refused.contains(peer) or
        _requests.contains(peer)) {
        return std::nullopt;
    }

    std::set<std::size_t> requested;
    for (const auto& [_, piece] : _requests) {
        requested.insert(piece);
    }

    // Prefer a piece nobody is working on, fall back to a duplicate request
    std::optional<std::size_t> fallback;

    for (std::size_t i = 0; i < _pieces.size(); i++) {
        if (_pieces[i]) {
            continue;
        }
        if (not requested.contains(i)) {
            _requests[peer] = i;
            return i;
        }
        if (not fallback) {
            fallback = i;
        }
    }

    if (fallback) {
        _requests[peer] = *fallback;
    }

    return fallback;
}

auto MetadataAssembler::on_data(PeerKey peer, const proto::MetadataMsg& msg)
  -> MetadataStatus
{
    if (_complete) {
        return MetadataStatus::Complete;
    }

    if (_failures >= _retry_limit) {
        return MetadataStatus::Exhausted;
    }

    auto request = _requests.find(peer);
    if (request == _requests.end() or request->second != msg.piece) {
        utils::internal_logger()->debug(
          "Unsolicited metadata piece {} from peer {}", msg.piece, peer
        );
        return MetadataStatus::Pending;
    }
    _requests.erase(request);

    if (not _size or msg.piece >= _pieces.size() or
        (msg.total_size and *msg.total_size != *_size) or
        msg.data.size() != _piece_length(msg.piece)) {
        utils::internal_logger()->debug(
          "Malformed metadata piece {} from peer {}", msg.piece, peer
        );
        _refused.insert(peer);
        return MetadataStatus::Pending;
    }

    _pieces[msg.piece] = msg.data;

    const bool all_received = std::ranges::all_of(_pieces, [](const auto& p) {
        return p.has_value();
    });

    return all_received ? _assemble() : MetadataStatus::Pending;
}

void MetadataAssembler::on_reject(PeerKey peer, std::size_t piece)
{
    auto request = _requests.find(peer);
    if (request != _requests.end() and request->second == piece) {
        _requests.erase(request);
    }

    _refused.insert(peer);
}

void MetadataAssembler::remove_peer(PeerKey peer)
{
    _requests.erase(peer);
    _refused.erase(peer);
}

auto MetadataAssembler::_piece_length(std::size_t piece) const -> std::size_t
{
    const auto begin = piece * proto::METADATA_PIECE_SIZE;
    return std::min(proto::METADATA_PIECE_SIZE, *_size - begin);
}

auto MetadataAssembler::_assemble() -> MetadataStatus
{
    std::string info;
    info.reserve(*_size);

    for (const auto& piece : _pieces) {
        info.append(piece->begin(), piece->end());
    }

    if (utils::sha1_digest(info) != _info_hash) {
        _failures++;
        _pieces.assign(_pieces.size(), std::nullopt);

        return _failures >= _retry_limit ? MetadataStatus::Exhausted
                                         : MetadataStatus::Corrupt;
    }

    _info = std::move(info);
    _complete = true;
    _pieces.clear();

    return MetadataStatus::Complete;
}

}  // namespace swarmget::engine
