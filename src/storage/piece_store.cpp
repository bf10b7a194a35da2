#include "storage/piece_store.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "misc/hash.hpp"
#include "misc/logger.hpp"

namespace swarmget::storage {

namespace fs = std::filesystem;

PieceStore::PieceStore(
  fs::path destination,
  const torrent::Manifest& manifest,
  std::uint32_t block_size
) :
  _destination(std::move(destination)),
  _manifest(manifest),
  _block_size(block_size),
  _verified(manifest.piece_count())
{
}

auto PieceStore::open(
  const fs::path& destination,
  const torrent::Manifest& manifest,
  std::uint32_t block_size
) -> tl::expected<std::unique_ptr<PieceStore>, StoreError>
{
    std::error_code ec;
    if (not fs::is_directory(destination, ec)) {
        spdlog::error("Destination {} is not a directory", destination.string());
        return tl::make_unexpected(StoreError::STORAGE_IO_ERROR);
    }

    if (block_size == 0) {
        return tl::make_unexpected(StoreError::BAD_BLOCK);
    }

    std::unique_ptr<PieceStore> store(
      new PieceStore(destination, manifest, block_size)
    );

    auto created = store->_create_files();
    if (not created) {
        return tl::make_unexpected(created.error());
    }

    return store;
}

auto PieceStore::_create_files() -> tl::expected<void, StoreError>
{
    for (const auto& entry : _manifest.files) {
        const auto path = _destination / entry.path;

        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            spdlog::error(
              "Can not create directory {}: {}", path.parent_path().string(),
              ec.message()
            );
            return tl::make_unexpected(StoreError::STORAGE_IO_ERROR);
        }

        auto file = utils::File::open(path, entry.length);
        if (not file) {
            spdlog::error(
              "Can not create file {}: {}", path.string(),
              file.error().message()
            );
            return tl::make_unexpected(StoreError::STORAGE_IO_ERROR);
        }
    }

    return {};
}

auto PieceStore::write_block(
  std::size_t piece, std::uint32_t offset, std::span<const std::uint8_t> data
) -> tl::expected<void, StoreError>
{
    if (piece >= _manifest.piece_count() or offset % _block_size != 0) {
        return tl::make_unexpected(StoreError::BAD_BLOCK);
    }

    const auto piece_size = _manifest.piece_size(piece);
    const auto block = offset / _block_size;

    if (offset >= piece_size or
        data.size() != _manifest.block_length(piece, block, _block_size)) {
        return tl::make_unexpected(StoreError::BAD_BLOCK);
    }

    std::scoped_lock lock(_mutex);

    if (_verified.test(piece)) {
        return tl::make_unexpected(StoreError::ALREADY_VERIFIED);
    }

    // Every block of a piece under verification is already buffered
    if (_verifying.contains(piece)) {
        return tl::make_unexpected(StoreError::DUPLICATE_BLOCK);
    }

    auto& buffer = _buffers[piece];
    if (buffer.data.empty()) {
        buffer.data.resize(piece_size);
        buffer.received.assign(
          _manifest.block_count(piece, _block_size), false
        );
    }

    if (buffer.received[block]) {
        return tl::make_unexpected(StoreError::DUPLICATE_BLOCK);
    }

    std::copy(data.begin(), data.end(), buffer.data.begin() + offset);
    buffer.received[block] = true;
    buffer.received_count++;

    return {};
}

auto PieceStore::verify_piece(std::size_t piece)
  -> tl::expected<VerifyResult, StoreError>
{
    if (piece >= _manifest.piece_count()) {
        return tl::make_unexpected(StoreError::BAD_BLOCK);
    }

    PieceBuffer buffer;

    {
        std::scoped_lock lock(_mutex);

        if (_verified.test(piece)) {
            return tl::make_unexpected(StoreError::ALREADY_VERIFIED);
        }

        auto found = _buffers.find(piece);
        if (found == _buffers.end() or
            found->second.received_count != found->second.received.size()) {
            return tl::make_unexpected(StoreError::INCOMPLETE_PIECE);
        }

        buffer = std::move(found->second);
        _buffers.erase(found);
        _verifying.insert(piece);
    }

    // Hash and write run unlocked, block writes to other pieces go on meanwhile
    if (not utils::sha1_matches(buffer.data, _manifest.piece_hashes[piece])) {
        utils::internal_logger()->debug("Piece {} hash mismatch", piece);

        std::scoped_lock lock(_mutex);
        _verifying.erase(piece);
        return VerifyResult::Corrupt;
    }

    auto written = [&] {
        std::scoped_lock lock(_io_mutex);
        return _write_piece(piece, buffer.data);
    }();

    std::scoped_lock lock(_mutex);
    _verifying.erase(piece);

    if (not written) {
        _buffers.insert_or_assign(piece, std::move(buffer));
        return tl::make_unexpected(written.error());
    }

    _verified.set(piece);

    return VerifyResult::Verified;
}

void PieceStore::discard(std::size_t piece)
{
    std::scoped_lock lock(_mutex);
    _buffers.erase(piece);
}

auto PieceStore::flush() -> tl::expected<void, StoreError>
{
    std::scoped_lock lock(_io_mutex);

    // Handles are released even when a sync fails
    auto handles = std::exchange(_handles, {});

    for (auto& [index, file] : handles) {
        auto synced = file.sync();
        if (not synced) {
            spdlog::error(
              "Can not sync {}: {}",
              (_destination / _manifest.files[index].path).string(),
              synced.error().message()
            );
            return tl::make_unexpected(StoreError::STORAGE_IO_ERROR);
        }
    }

    return {};
}

auto PieceStore::recheck(std::stop_token stop)
  -> tl::expected<std::size_t, StoreError>
{
    std::size_t found = 0;
    std::vector<std::uint8_t> data;

    for (std::size_t piece = 0; piece < _manifest.piece_count(); piece++) {
        if (stop.stop_requested()) {
            return tl::make_unexpected(StoreError::CANCELLED);
        }

        if (has_piece(piece)) {
            found++;
            continue;
        }

        const auto read = [&] {
            std::scoped_lock lock(_io_mutex);
            return _read_piece(piece, data);
        }();

        if (read and utils::sha1_matches(data, _manifest.piece_hashes[piece])) {
            std::scoped_lock lock(_mutex);
            _verified.set(piece);
            _buffers.erase(piece);
            found++;
        }
    }

    // Reading opened every file, nothing has to stay open
    std::scoped_lock lock(_io_mutex);
    _handles.clear();

    return found;
}

auto PieceStore::has_piece(std::size_t piece) const -> bool
{
    std::scoped_lock lock(_mutex);
    return _verified.test(piece);
}

auto PieceStore::is_complete(std::size_t piece) const -> bool
{
    std::scoped_lock lock(_mutex);

    auto buffer = _buffers.find(piece);
    return buffer != _buffers.end() and
           buffer->second.received_count == buffer->second.received.size();
}

auto PieceStore::verified() const -> proto::Bitfield
{
    std::scoped_lock lock(_mutex);
    return _verified;
}

auto PieceStore::verified_bytes() const -> std::uint64_t
{
    std::scoped_lock lock(_mutex);

    std::uint64_t bytes = 0;
    for (std::size_t piece = 0; piece < _manifest.piece_count(); piece++) {
        if (_verified.test(piece)) {
            bytes += _manifest.piece_size(piece);
        }
    }
    return bytes;
}

auto PieceStore::_file(std::size_t index)
  -> tl::expected<utils::File*, StoreError>
{
    auto found = _handles.find(index);
    if (found != _handles.end()) {
        return &found->second;
    }

    const auto& entry = _manifest.files[index];
    const auto path = _destination / entry.path;

    auto file = utils::File::open(path, entry.length);
    if (not file) {
        spdlog::error(
          "Can not open {}: {}", path.string(), file.error().message()
        );
        return tl::make_unexpected(StoreError::STORAGE_IO_ERROR);
    }

    auto [inserted, _] = _handles.emplace(index, std::move(*file));
    return &inserted->second;
}

auto PieceStore::_write_piece(
  std::size_t piece, std::span<const std::uint8_t> data
) -> tl::expected<void, StoreError>
{
    const auto segments =
      _manifest.map_range(_manifest.piece_offset(piece), data.size());

    for (const auto& segment : segments) {
        auto file = _file(segment.file_index);
        if (not file) {
            return tl::make_unexpected(file.error());
        }

        auto written = (*file)->write_at(
          segment.file_offset, data.subspan(segment.range_offset, segment.length)
        );

        if (not written) {
            spdlog::error(
              "Write of piece {} to {} failed: {}", piece,
              _manifest.files[segment.file_index].path.string(),
              written.error().message()
            );
            return tl::make_unexpected(StoreError::STORAGE_IO_ERROR);
        }
    }

    return {};
}

auto PieceStore::_read_piece(std::size_t piece, std::vector<std::uint8_t>& data)
  -> bool
{
    data.resize(_manifest.piece_size(piece));

    const auto segments =
      _manifest.map_range(_manifest.piece_offset(piece), data.size());

    for (const auto& segment : segments) {
        auto file = _file(segment.file_index);
        if (not file) {
            return false;
        }

        auto read = (*file)->read_at(
          segment.file_offset,
          std::span(data).subspan(segment.range_offset, segment.length)
        );

        if (not read or *read != segment.length) {
            return false;
        }
    }

    return true;
}

}  // namespace swarmget::storage
