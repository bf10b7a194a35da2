#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <tl/expected.hpp>

#include "bencode/types.hpp"
#include "misc/hash.hpp"

namespace swarmget::torrent {

// Network request unit
constexpr const std::uint32_t DEFAULT_BLOCK_SIZE = 16 * 1024;
// Whole pieces are buffered in memory before verification
constexpr const std::uint64_t MAX_PIECE_LENGTH = 64 * 1024 * 1024;

enum class ManifestError
{
    NOT_A_DICT,
    MISSING_FIELD,
    BAD_NAME,
    BAD_PIECE_LENGTH,
    BAD_PIECES,
    PIECE_COUNT_MISMATCH,
    BAD_FILE_LENGTH,
    BAD_PATH,
};

struct FileEntry
{
    // Relative to the destination directory
    std::filesystem::path path;
    std::uint64_t length;
    // Position of the first byte in the concatenated stream
    std::uint64_t offset;
};

/**
 * @brief Part of a logical byte range that lives in one file
 */
struct FileSegment
{
    std::size_t file_index;
    std::uint64_t file_offset;
    std::uint64_t length;
    // Position of the segment inside the mapped range
    std::uint64_t range_offset;
};

struct Manifest
{
    std::string name;
    std::vector<FileEntry> files;
    std::uint64_t piece_length = 0;
    std::vector<utils::Sha1Digest> piece_hashes;
    std::uint64_t total_length = 0;
    bool is_private = false;

    /**
     * @brief Build and validate a manifest from a decoded "info" dictionary
     *
     * Accepts both the single-file ("length") and the multi-file ("files")
     * layouts. Paths with absolute, empty, "." or ".." components are
     * rejected so nothing is ever written outside the destination.
     */
    static auto from_info(const bencode::Json& info)
      -> tl::expected<Manifest, ManifestError>;

    /**
     * @brief Decode raw bencoded "info" text and build a manifest from it
     */
    static auto from_info_bytes(std::string_view raw_info)
      -> tl::expected<Manifest, ManifestError>;

    auto piece_count() const noexcept -> std::size_t
    {
        return piece_hashes.size();
    }

    auto piece_offset(std::size_t index) const -> std::uint64_t;

    /**
     * @brief Length of piece `index`; only the last one may be shorter
     */
    auto piece_size(std::size_t index) const -> std::uint32_t;

    auto block_count(std::size_t piece, std::uint32_t block_size) const
      -> std::size_t;

    auto block_length(
      std::size_t piece, std::size_t block, std::uint32_t block_size
    ) const -> std::uint32_t;

    /**
     * @brief Split [offset, offset + length) of the logical stream into
     * per-file segments, in stream order
     *
     * Zero-length files never produce segments.
     */
    auto map_range(std::uint64_t offset, std::uint64_t length) const
      -> std::vector<FileSegment>;
};

}  // namespace swarmget::torrent
