#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "engine/types.hpp"
#include "proto/bitfield.hpp"
#include "torrent/manifest.hpp"

namespace swarmget::engine {

/**
 * @brief Rarest-first block scheduler
 *
 * Tracks which peers advertise which pieces and which blocks are in flight
 * to whom. A block is owned by at most one peer at a time; blocks of a peer
 * that goes away become requestable again.
 */
class PieceSelector
{
 public:
    enum class BlockState : std::uint8_t
    {
        Missing,
        InFlight,
        Received,
    };

    PieceSelector(
      const torrent::Manifest& manifest,
      std::uint32_t block_size,
      std::size_t max_in_flight_per_peer
    );

    void on_bitfield(PeerKey peer, const proto::Bitfield& bitfield);
    void on_have(PeerKey peer, std::size_t piece);

    /**
     * @brief Forget a peer, returning its in-flight blocks to Missing
     */
    auto remove_peer(PeerKey peer) -> std::vector<BlockRef>;

    /**
     * @brief Assign the next block for `peer`, or nullopt if there is none
     * or the peer is at its in-flight cap
     */
    auto next_block(PeerKey peer) -> std::optional<BlockRef>;

    /**
     * @brief Give a single in-flight block back (choke, refused request)
     */
    void release(PeerKey peer, const BlockRef& block);

    auto release_all(PeerKey peer) -> std::vector<BlockRef>;

    /**
     * @brief Accept a delivered block
     *
     * Returns false for blocks that were not in flight to this peer
     * (unsolicited, duplicate or already reassigned).
     */
    auto on_block(PeerKey peer, const BlockRef& block) -> bool;

    auto is_piece_complete(std::size_t piece) const -> bool;

    /**
     * @brief Revert every block of the piece to Missing
     */
    void mark_corrupt(std::size_t piece);
    void mark_verified(std::size_t piece);

    /**
     * @brief Peers that delivered at least one block of the piece
     */
    auto contributors(std::size_t piece) const -> std::set<PeerKey>;

    auto availability(std::size_t piece) const -> std::size_t;
    auto owner(const BlockRef& block) const -> std::optional<PeerKey>;
    auto in_flight(PeerKey peer) const -> std::size_t;
    auto block_state(const BlockRef& block) const -> BlockState;

    /**
     * @brief Peer has at least one piece we still need
     */
    auto is_interesting(PeerKey peer) const -> bool;

    auto verified() const -> const proto::Bitfield& { return _verified; }
    auto all_verified() const -> bool { return _verified.all(); }

 private:
    struct Block
    {
        BlockState state = BlockState::Missing;
        PeerKey owner = 0;
    };

    struct Piece
    {
        std::vector<Block> blocks;
        std::size_t received = 0;
        std::set<PeerKey> contributors;
    };

    auto _block(const BlockRef& block) -> Block*;
    auto _block(const BlockRef& block) const -> const Block*;
    auto _has_missing_block(std::size_t piece) const -> bool;
    auto _pick_piece(const proto::Bitfield& peer_pieces) const
      -> std::optional<std::size_t>;
    void _reset_block(Block& block);

    const torrent::Manifest& _manifest;
    const std::uint32_t _block_size;
    const std::size_t _max_in_flight;

    std::vector<Piece> _pieces;
    std::vector<std::size_t> _availability;
    proto::Bitfield _verified;

    std::map<PeerKey, proto::Bitfield> _peer_pieces;
    std::map<PeerKey, std::set<BlockRef>> _peer_blocks;
};

}  // namespace swarmget::engine
