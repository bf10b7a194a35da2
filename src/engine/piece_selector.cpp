#include "engine/piece_selector.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace swarmget::engine {

PieceSelector::PieceSelector(
  const torrent::Manifest& manifest,
  std::uint32_t block_size,
  std::size_t max_in_flight_per_peer
) :
  _manifest(manifest),
  _block_size(block_size),
  _max_in_flight(max_in_flight_per_peer),
  _pieces(manifest.piece_count()),
  _availability(manifest.piece_count(), 0),
  _verified(manifest.piece_count())
{
    for (std::size_t i = 0; i < _pieces.size(); i++) {
        _pieces[i].blocks.resize(manifest.block_count(i, block_size));
    }
}

void PieceSelector::on_bitfield(PeerKey peer, const proto::Bitfield& bitfield)
{
    if (bitfield.size() != _pieces.size()) {
        throw std::invalid_argument(fmt::format(
          "Bitfield of {} pieces for a torrent of {}", bitfield.size(),
          _pieces.size()
        ));
    }

    auto& pieces = _peer_pieces[peer];
    if (pieces.size() != _pieces.size()) {
        pieces = proto::Bitfield(_pieces.size());
    }

    for (std::size_t i = 0; i < _pieces.size(); i++) {
        if (bitfield.test(i) and not pieces.test(i)) {
            pieces.set(i);
            _availability[i]++;
        }
    }
}

void PieceSelector::on_have(PeerKey peer, std::size_t piece)
{
    if (piece >= _pieces.size()) {
        throw std::out_of_range(fmt::format("Bad piece index {}", piece));
    }

    auto& pieces = _peer_pieces[peer];
    if (pieces.size() != _pieces.size()) {
        pieces = proto::Bitfield(_pieces.size());
    }

    if (not pieces.test(piece)) {
        pieces.set(piece);
        _availability[piece]++;
    }
}

auto PieceSelector::remove_peer(PeerKey peer) -> std::vector<BlockRef>
{
    auto released = release_all(peer);

    auto found = _peer_pieces.find(peer);
    if (found != _peer_pieces.end()) {
        for (std::size_t i = 0; i < _pieces.size(); i++) {
            if (found->second.test(i)) {
                _availability[i]--;
            }
        }
        _peer_pieces.erase(found);
    }

    _peer_blocks.erase(peer);

    return released;
}

auto PieceSelector::next_block(PeerKey peer) -> std::optional<BlockRef>
{
    auto pieces = _peer_pieces.find(peer);
    if (pieces == _peer_pieces.end() or in_flight(peer) >= _max_in_flight) {
        return std::nullopt;
    }

    auto index = _pick_piece(pieces->second);
    if (not index) {
        return std::nullopt;
    }

    auto& piece = _pieces[*index];

    for (std::size_t i = 0; i < piece.blocks.size(); i++) {
        auto& block = piece.blocks[i];
        if (block.state != BlockState::Missing) {
            continue;
        }

        block.state = BlockState::InFlight;
        block.owner = peer;

        BlockRef ref{
          .piece = static_cast<std::uint32_t>(*index),
          .offset = static_cast<std::uint32_t>(i * _block_size),
          .length = _manifest.block_length(*index, i, _block_size),
        };

        _peer_blocks[peer].insert(ref);
        return ref;
    }

    return std::nullopt;
}

void PieceSelector::release(PeerKey peer, const BlockRef& block)
{
    auto* state = _block(block);
    if (state == nullptr or state->state != BlockState::InFlight or
        state->owner != peer) {
        return;
    }

    _reset_block(*state);
    _peer_blocks[peer].erase(block);
}

auto PieceSelector::release_all(PeerKey peer) -> std::vector<BlockRef>
{
    std::vector<BlockRef> released;

    auto owned = _peer_blocks.find(peer);
    if (owned == _peer_blocks.end()) {
        return released;
    }

    for (const auto& block : owned->second) {
        auto* state = _block(block);
        if (state != nullptr and state->state == BlockState::InFlight and
            state->owner == peer) {
            _reset_block(*state);
            released.push_back(block);
        }
    }

    owned->second.clear();

    return released;
}

auto PieceSelector::on_block(PeerKey peer, const BlockRef& block) -> bool
{
    auto* state = _block(block);
    if (state == nullptr or state->state != BlockState::InFlight or
        state->owner != peer) {
        return false;
    }

    const auto index = (block.offset / _block_size);
    if (_manifest.block_length(block.piece, index, _block_size) !=
        block.length) {
        return false;
    }

    state->state = BlockState::Received;

    auto& piece = _pieces[block.piece];
    piece.received++;
    piece.contributors.insert(peer);

    _peer_blocks[peer].erase(block);

    return true;
}

auto PieceSelector::is_piece_complete(std::size_t piece) const -> bool
{
    return _pieces.at(piece).received == _pieces[piece].blocks.size();
}

void PieceSelector::mark_corrupt(std::size_t piece)
{
    auto& entry = _pieces.at(piece);

    for (std::size_t i = 0; i < entry.blocks.size(); i++) {
        auto& block = entry.blocks[i];

        if (block.state == BlockState::InFlight) {
            _peer_blocks[block.owner].erase(BlockRef{
              .piece = static_cast<std::uint32_t>(piece),
              .offset = static_cast<std::uint32_t>(i * _block_size),
              .length = _manifest.block_length(piece, i, _block_size),
            });
        }

        _reset_block(block);
    }

    entry.received = 0;
    entry.contributors.clear();
}

void PieceSelector::mark_verified(std::size_t piece)
{
    auto& entry = _pieces.at(piece);

    for (std::size_t i = 0; i < entry.blocks.size(); i++) {
        auto& block = entry.blocks[i];

        if (block.state == BlockState::InFlight) {
            _peer_blocks[block.owner].erase(BlockRef{
              .piece = static_cast<std::uint32_t>(piece),
              .offset = static_cast<std::uint32_t>(i * _block_size),
              .length = _manifest.block_length(piece, i, _block_size),
            });
        }

        block.state = BlockState::Received;
        block.owner = 0;
    }

    entry.received = entry.blocks.size();
    _verified.set(piece);
}

auto PieceSelector::contributors(std::size_t piece) const -> std::set<PeerKey>
{
    return _pieces.at(piece).contributors;
}

auto PieceSelector::availability(std::size_t piece) const -> std::size_t
{
    return _availability.at(piece);
}

auto PieceSelector::owner(const BlockRef& block) const
  -> std::optional<PeerKey>
{
    const auto* state = _block(block);
    if (state == nullptr or state->state != BlockState::InFlight) {
        return std::nullopt;
    }
    return state->owner;
}

auto PieceSelector::in_flight(PeerKey peer) const -> std::size_t
{
    auto owned = _peer_blocks.find(peer);
    return owned == _peer_blocks.end() ? 0 : owned->second.size();
}

auto PieceSelector::block_state(const BlockRef& block) const -> BlockState
{
    const auto* state = _block(block);
    if (state == nullptr) {
        throw std::out_of_range(fmt::format(
          "Bad block {}:{} of length {}", block.piece, block.offset,
          block.length
        ));
    }
    return state->state;
}

auto PieceSelector::is_interesting(PeerKey peer) const -> bool
{
    auto pieces = _peer_pieces.find(peer);
    if (pieces == _peer_pieces.end()) {
        return false;
    }

    for (std::size_t i = 0; i < _pieces.size(); i++) {
        if (pieces->second.test(i) and not _verified.test(i)) {
            return true;
        }
    }

    return false;
}

auto PieceSelector::_block(const BlockRef& block) -> Block*
{
    return const_cast<Block*>(std::as_const(*this)._block(block));
}

auto PieceSelector::_block(const BlockRef& block) const -> const Block*
{
    if (block.piece >= _pieces.size() or block.offset % _block_size != 0) {
        return nullptr;
    }

    const auto& blocks = _pieces[block.piece].blocks;
    const auto index = block.offset / _block_size;

    return index < blocks.size() ? &blocks[index] : nullptr;
}

auto PieceSelector::_has_missing_block(std::size_t piece) const -> bool
{
    for (const auto& block : _pieces[piece].blocks) {
        if (block.state == BlockState::Missing) {
            return true;
        }
    }
    return false;
}

auto PieceSelector::_pick_piece(const proto::Bitfield& peer_pieces) const
  -> std::optional<std::size_t>
{
    std::optional<std::size_t> best;

    // Strict "<" keeps the lowest index among equally rare pieces
    for (std::size_t i = 0; i < _pieces.size(); i++) {
        if (_verified.test(i) or not peer_pieces.test(i) or
            not _has_missing_block(i)) {
            continue;
        }

        if (not best or _availability[i] < _availability[*best]) {
            best = i;
        }
    }

    return best;
}

void PieceSelector::_reset_block(Block& block)
{
    block.state = BlockState::Missing;
    block.owner = 0;
}

}  // namespace swarmget::engine
