#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <span>
#include <stop_token>
#include <vector>

#include <tl/expected.hpp>

#include "misc/file.hpp"
#include "proto/bitfield.hpp"
#include "torrent/manifest.hpp"

namespace swarmget::storage {

enum class StoreError
{
    STORAGE_IO_ERROR,
    BAD_BLOCK,
    DUPLICATE_BLOCK,
    INCOMPLETE_PIECE,
    ALREADY_VERIFIED,
    CANCELLED,
};

enum class VerifyResult
{
    Verified,
    Corrupt,
};

/**
 * @brief Block buffer and file writer for one manifest
 *
 * Blocks are kept in memory until their piece is complete. Only pieces whose
 * SHA1 was computed here from the buffered bytes ever reach the files, so
 * nothing on disk is trusted without verification.
 *
 * All methods are thread safe. Hashing and file I/O never hold the lock
 * that guards block buffering.
 */
class PieceStore
{
 public:
    /**
     * @brief Create (or reuse) the file set under `destination`
     *
     * `destination` must already exist. Missing files and parent directories
     * inside it are created and every file is sized to its manifest length.
     */
    static auto open(
      const std::filesystem::path& destination,
      const torrent::Manifest& manifest,
      std::uint32_t block_size = torrent::DEFAULT_BLOCK_SIZE
    ) -> tl::expected<std::unique_ptr<PieceStore>, StoreError>;

    PieceStore(const PieceStore&) = delete;
    PieceStore& operator=(const PieceStore&) = delete;

    auto write_block(
      std::size_t piece, std::uint32_t offset, std::span<const std::uint8_t> data
    ) -> tl::expected<void, StoreError>;

    /**
     * @brief Hash a complete piece and write it out on success
     *
     * Corrupt discards every buffered block of the piece. A STORAGE_IO_ERROR
     * keeps the buffer so the call can be retried.
     */
    auto verify_piece(std::size_t piece) -> tl::expected<VerifyResult, StoreError>;

    /**
     * @brief Drop buffered blocks of an unverified piece
     */
    void discard(std::size_t piece);

    /**
     * @brief fsync every touched file and release all handles
     */
    auto flush() -> tl::expected<void, StoreError>;

    /**
     * @brief Mark pieces already present and correct on disk as verified
     *
     * Returns the number of pieces found.
     */
    auto recheck(std::stop_token stop = {}) -> tl::expected<std::size_t, StoreError>;

    auto has_piece(std::size_t piece) const -> bool;
    auto is_complete(std::size_t piece) const -> bool;
    auto verified() const -> proto::Bitfield;
    auto verified_bytes() const -> std::uint64_t;

    auto destination() const -> const std::filesystem::path& { return _destination; }
    auto manifest() const -> const torrent::Manifest& { return _manifest; }

 private:
    struct PieceBuffer
    {
        std::vector<std::uint8_t> data;
        std::vector<bool> received;
        std::size_t received_count = 0;
    };

    PieceStore(
      std::filesystem::path destination,
      const torrent::Manifest& manifest,
      std::uint32_t block_size
    );

    auto _create_files() -> tl::expected<void, StoreError>;
    auto _file(std::size_t index) -> tl::expected<utils::File*, StoreError>;
    auto _write_piece(std::size_t piece, std::span<const std::uint8_t> data)
      -> tl::expected<void, StoreError>;
    auto _read_piece(std::size_t piece, std::vector<std::uint8_t>& data)
      -> bool;

    const std::filesystem::path _destination;
    const torrent::Manifest _manifest;
    const std::uint32_t _block_size;

    mutable std::mutex _mutex;
    std::map<std::size_t, PieceBuffer> _buffers;
    std::set<std::size_t> _verifying;
    proto::Bitfield _verified;

    // File handles, taken only by the disk side
    std::mutex _io_mutex;
    std::map<std::size_t, utils::File> _handles;
};

}  // namespace swarmget::storage
