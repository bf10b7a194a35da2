#include "torrent/manifest.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string_view>

#include <fmt/core.h>
#include <range/v3/view/chunk.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/range/conversion.hpp>

#include "bencode/decoders.hpp"
#include "bencode/tools.hpp"

namespace swarmget::torrent {

namespace {

auto is_safe_component(const std::string& component) -> bool
{
    if (component.empty() or component == "." or component == "..") {
        return false;
    }

    return component.find('/') == std::string::npos and
           component.find('\\') == std::string::npos and
           component.find('\0') == std::string::npos;
}

auto parse_piece_hashes(const bencode::Json& pieces)
  -> tl::expected<std::vector<utils::Sha1Digest>, ManifestError>
{
    auto bytes = bencode::as_bytes(pieces);
    if (not bytes or bytes->empty() or bytes->size() % utils::SHA1_LENGTH != 0) {
        return tl::make_unexpected(ManifestError::BAD_PIECES);
    }

    // clang-format off
    return *bytes
      | ranges::views::chunk(utils::SHA1_LENGTH)
      | ranges::views::transform([](auto chunk) {
          utils::Sha1Digest digest{};
          std::copy(chunk.begin(), chunk.end(), digest.begin());
          return digest;
      })
      | ranges::to<std::vector<utils::Sha1Digest>>();
    // clang-format on
}

auto parse_length(const bencode::Json& dict)
  -> tl::expected<std::uint64_t, ManifestError>
{
    if (not dict.contains("length")) {
        return tl::make_unexpected(ManifestError::MISSING_FIELD);
    }

    auto length = bencode::as_integer(dict["length"]);
    if (not length or *length < 0) {
        return tl::make_unexpected(ManifestError::BAD_FILE_LENGTH);
    }

    return static_cast<std::uint64_t>(*length);
}

auto parse_files(const std::string& name, const bencode::Json& files)
  -> tl::expected<std::vector<FileEntry>, ManifestError>
{
    if (not files.is_array() or files.empty()) {
        return tl::make_unexpected(ManifestError::MISSING_FIELD);
    }

    std::vector<FileEntry> entries;
    std::uint64_t offset = 0;

    for (const auto& file : files) {
        if (not file.is_object() or not file.contains("path")) {
            return tl::make_unexpected(ManifestError::MISSING_FIELD);
        }

        auto length = parse_length(file);
        if (not length) {
            return tl::make_unexpected(length.error());
        }

        const auto& components = file["path"];
        if (not components.is_array() or components.empty()) {
            return tl::make_unexpected(ManifestError::BAD_PATH);
        }

        std::filesystem::path path{name};
        for (const auto& component : components) {
            auto part = bencode::as_string(component);
            if (not part or not is_safe_component(*part)) {
                return tl::make_unexpected(ManifestError::BAD_PATH);
            }
            path /= *part;
        }

        entries.push_back(FileEntry{path, *length, offset});
        offset += *length;
    }

    return entries;
}

}  // namespace

auto Manifest::from_info(const bencode::Json& info)
  -> tl::expected<Manifest, ManifestError>
{
    if (not info.is_object()) {
        return tl::make_unexpected(ManifestError::NOT_A_DICT);
    }

    if (not info.contains("name") or not info.contains("piece length") or
        not info.contains("pieces")) {
        return tl::make_unexpected(ManifestError::MISSING_FIELD);
    }

    Manifest manifest;

    auto name = bencode::as_string(info["name"]);
    if (not name or not is_safe_component(*name)) {
        return tl::make_unexpected(ManifestError::BAD_NAME);
    }
    manifest.name = *name;

    auto piece_length = bencode::as_integer(info["piece length"]);
    if (not piece_length or *piece_length <= 0 or
        static_cast<std::uint64_t>(*piece_length) > MAX_PIECE_LENGTH) {
        return tl::make_unexpected(ManifestError::BAD_PIECE_LENGTH);
    }
    manifest.piece_length = static_cast<std::uint64_t>(*piece_length);

    auto hashes = parse_piece_hashes(info["pieces"]);
    if (not hashes) {
        return tl::make_unexpected(hashes.error());
    }
    manifest.piece_hashes = std::move(*hashes);

    if (info.contains("files")) {
        auto files = parse_files(manifest.name, info["files"]);
        if (not files) {
            return tl::make_unexpected(files.error());
        }
        manifest.files = std::move(*files);
    }
    else {
        auto length = parse_length(info);
        if (not length) {
            return tl::make_unexpected(length.error());
        }
        manifest.files.push_back(FileEntry{manifest.name, *length, 0});
    }

    for (const auto& file : manifest.files) {
        manifest.total_length += file.length;
    }

    const auto expected_pieces =
      (manifest.total_length + manifest.piece_length - 1) /
      manifest.piece_length;

    if (manifest.total_length == 0 or
        expected_pieces != manifest.piece_hashes.size()) {
        return tl::make_unexpected(ManifestError::PIECE_COUNT_MISMATCH);
    }

    if (info.contains("private")) {
        manifest.is_private = bencode::as_integer(info["private"]) == 1;
    }

    return manifest;
}

auto Manifest::from_info_bytes(std::string_view raw_info)
  -> tl::expected<Manifest, ManifestError>
{
    auto decoded = bencode::decode_all(raw_info);
    if (not decoded) {
        return tl::make_unexpected(ManifestError::NOT_A_DICT);
    }

    auto [_, info] = *decoded;
    return from_info(info);
}

auto Manifest::piece_offset(std::size_t index) const -> std::uint64_t
{
    if (index >= piece_count()) {
        throw std::out_of_range(fmt::format("Bad piece index {}", index));
    }

    return std::uint64_t(index) * piece_length;
}

auto Manifest::piece_size(std::size_t index) const -> std::uint32_t
{
    const auto offset = piece_offset(index);
    return static_cast<std::uint32_t>(
      std::min(piece_length, total_length - offset)
    );
}

auto Manifest::block_count(std::size_t piece, std::uint32_t block_size) const
  -> std::size_t
{
    return static_cast<std::size_t>(
      (std::uint64_t(piece_size(piece)) + block_size - 1) / block_size
    );
}

auto Manifest::block_length(
  std::size_t piece, std::size_t block, std::uint32_t block_size
) const -> std::uint32_t
{
    const auto size = piece_size(piece);
    const auto begin = std::uint64_t(block) * block_size;

    if (begin >= size) {
        throw std::out_of_range(
          fmt::format("Bad block {} of piece {}", block, piece)
        );
    }

    return static_cast<std::uint32_t>(
      std::min<std::uint64_t>(block_size, size - begin)
    );
}

auto Manifest::map_range(std::uint64_t offset, std::uint64_t length) const
  -> std::vector<FileSegment>
{
    if (offset + length > total_length) {
        throw std::out_of_range(fmt::format(
          "Range {}+{} is outside of {} bytes", offset, length, total_length
        ));
    }

    std::vector<FileSegment> segments;

    // First file whose end lies past `offset`
    auto file = std::upper_bound(
      files.begin(), files.end(), offset,
      [](std::uint64_t value, const FileEntry& entry) {
          return value < entry.offset + entry.length;
      }
    );

    std::uint64_t mapped = 0;

    for (; file != files.end() and mapped < length; ++file) {
        if (file->length == 0) {
            continue;
        }

        const auto position = offset + mapped;
        const auto in_file = position - file->offset;
        const auto chunk = std::min(file->length - in_file, length - mapped);

        segments.push_back(FileSegment{
          .file_index = std::size_t(std::distance(files.begin(), file)),
          .file_offset = in_file,
          .length = chunk,
          .range_offset = mapped,
        });

        mapped += chunk;
    }

    return segments;
}

}  // namespace swarmget::torrent
