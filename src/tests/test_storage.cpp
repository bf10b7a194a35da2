#include <cassert>
#include <cstdint>
#include <filesystem>
#include <span>
#include <stop_token>
#include <thread>
#include <vector>

#include "storage/piece_store.hpp"
#include "tests/helpers.hpp"

using namespace swarmget;
using namespace swarmget::storage;

namespace {

constexpr std::uint32_t BLOCK = 16 * 1024;

auto slice(const std::vector<std::uint8_t>& content, std::uint64_t offset, std::uint64_t length)
  -> std::span<const std::uint8_t>
{
    return std::span(content).subspan(offset, length);
}

// Write every block of a piece from `content`
void fill_piece(
  PieceStore& store, const torrent::Manifest& manifest,
  const std::vector<std::uint8_t>& content, std::size_t piece
)
{
    const auto base = manifest.piece_offset(piece);

    for (std::size_t block = 0; block < manifest.block_count(piece, BLOCK); block++) {
        const auto length = manifest.block_length(piece, block, BLOCK);
        auto written = store.write_block(
          piece, block * BLOCK, slice(content, base + block * BLOCK, length)
        );
        assert(written.has_value());
    }
}

}  // namespace

void test_piece_store_write_and_verify()
{
    // 3 pieces of 32 KiB, the last one short
    const auto content = testing::random_bytes(2 * 32768 + 10000, 11);
    const auto torrent = testing::make_torrent("payload.bin", content, 32768);
    const auto& manifest = torrent.manifest;

    testing::TempDir dir;

    auto opened = PieceStore::open(dir.path(), manifest, BLOCK);
    assert(opened.has_value());
    auto& store = **opened;

    // File exists at full size right after open
    assert(testing::read_file(dir.path() / "payload.bin").size() == content.size());

    assert(not store.is_complete(0));
    assert(store.verify_piece(0).error() == StoreError::INCOMPLETE_PIECE);

    {
        auto written = store.write_block(0, 0, slice(content, 0, BLOCK));
        assert(written.has_value());
        assert(not store.is_complete(0));

        auto duplicate = store.write_block(0, 0, slice(content, 0, BLOCK));
        assert(duplicate.error() == StoreError::DUPLICATE_BLOCK);
    }

    // Misaligned offset, wrong length, bad piece index
    assert(store.write_block(0, 100, slice(content, 100, BLOCK)).error() == StoreError::BAD_BLOCK);
    assert(store.write_block(0, BLOCK, slice(content, BLOCK, 10)).error() == StoreError::BAD_BLOCK);
    assert(store.write_block(0, 2 * BLOCK, slice(content, 0, BLOCK)).error() == StoreError::BAD_BLOCK);
    assert(store.write_block(3, 0, slice(content, 0, BLOCK)).error() == StoreError::BAD_BLOCK);
    assert(store.write_block(2, 0, slice(content, 0, BLOCK)).error() == StoreError::BAD_BLOCK);

    {
        auto written = store.write_block(0, BLOCK, slice(content, BLOCK, BLOCK));
        assert(written.has_value());
        assert(store.is_complete(0));

        auto result = store.verify_piece(0);
        assert(result.has_value());
        assert(*result == VerifyResult::Verified);
        assert(store.has_piece(0));
        assert(store.verified_bytes() == 32768);

        assert(store.verify_piece(0).error() == StoreError::ALREADY_VERIFIED);
        assert(
          store.write_block(0, 0, slice(content, 0, BLOCK)).error() ==
          StoreError::ALREADY_VERIFIED
        );
    }

    fill_piece(store, manifest, content, 2);
    assert(store.verify_piece(2).value() == VerifyResult::Verified);

    fill_piece(store, manifest, content, 1);
    assert(store.verify_piece(1).value() == VerifyResult::Verified);

    assert(store.verified().all());
    assert(store.verified_bytes() == content.size());
    assert(store.flush().has_value());

    assert(testing::read_file(dir.path() / "payload.bin") == content);
}

void test_piece_store_rejects_corruption()
{
    const auto content = testing::random_bytes(4 * 32768, 12);
    const auto torrent = testing::make_torrent("payload.bin", content, 32768);
    const auto& manifest = torrent.manifest;

    testing::TempDir dir;

    auto opened = PieceStore::open(dir.path(), manifest, BLOCK);
    assert(opened.has_value());
    auto& store = **opened;

    for (unsigned seed = 0; seed < 4; seed++) {
        const auto noise = testing::random_bytes(32768, 100 + seed);

        auto first = store.write_block(seed, 0, slice(noise, 0, BLOCK));
        auto second = store.write_block(seed, BLOCK, slice(noise, BLOCK, BLOCK));
        assert(first.has_value() and second.has_value());

        auto result = store.verify_piece(seed);
        assert(result.has_value());
        assert(*result == VerifyResult::Corrupt);
        assert(not store.has_piece(seed));

        // The buffer is gone, the piece can be downloaded again
        assert(not store.is_complete(seed));
        assert(store.verify_piece(seed).error() == StoreError::INCOMPLETE_PIECE);
    }

    // One flipped bit in an otherwise correct piece
    {
        auto tampered = content;
        tampered[32768 + 5] ^= 0x01;

        fill_piece(store, manifest, tampered, 1);
        assert(store.verify_piece(1).value() == VerifyResult::Corrupt);

        fill_piece(store, manifest, content, 1);
        assert(store.verify_piece(1).value() == VerifyResult::Verified);
    }

    {
        fill_piece(store, manifest, content, 2);
        store.discard(2);
        assert(not store.is_complete(2));
        assert(store.verify_piece(2).error() == StoreError::INCOMPLETE_PIECE);
    }

    assert(store.verified_bytes() == 32768);
    assert(store.flush().has_value());

    // Nothing unverified reached the file
    const auto on_disk = testing::read_file(dir.path() / "payload.bin");
    assert(on_disk.size() == content.size());
    for (std::size_t i = 0; i < 32768; i++) {
        assert(on_disk[i] == 0);
    }
}

void test_piece_store_multi_file()
{
    const auto torrent = testing::make_multi_file_torrent(
      "album",
      {
        {"one.dat", testing::random_bytes(20000, 21)},
        {"empty.dat", {}},
        {"two.dat", testing::random_bytes(30000, 22)},
        {"three.dat", testing::random_bytes(15000, 23)},
      },
      32768
    );
    const auto& manifest = torrent.manifest;
    const auto& content = torrent.content;

    testing::TempDir dir;

    auto opened = PieceStore::open(dir.path(), manifest, BLOCK);
    assert(opened.has_value());
    auto& store = **opened;

    for (std::size_t piece = 0; piece < manifest.piece_count(); piece++) {
        fill_piece(store, manifest, content, piece);
        assert(store.verify_piece(piece).value() == VerifyResult::Verified);
    }
    assert(store.flush().has_value());

    const auto one = testing::read_file(dir.path() / "album" / "one.dat");
    const auto empty = testing::read_file(dir.path() / "album" / "empty.dat");
    const auto two = testing::read_file(dir.path() / "album" / "two.dat");
    const auto three = testing::read_file(dir.path() / "album" / "three.dat");

    assert(one == std::vector(content.begin(), content.begin() + 20000));
    assert(empty.empty());
    assert(two == std::vector(content.begin() + 20000, content.begin() + 50000));
    assert(three == std::vector(content.begin() + 50000, content.end()));
}

void test_piece_store_recheck()
{
    const auto content = testing::random_bytes(3 * 32768 + 1, 31);
    const auto torrent = testing::make_torrent("payload.bin", content, 32768);
    const auto& manifest = torrent.manifest;

    testing::TempDir dir;

    {
        auto opened = PieceStore::open(dir.path(), manifest, BLOCK);
        assert(opened.has_value());

        // Fresh zero-filled file has nothing
        assert((*opened)->recheck().value() == 0);

        fill_piece(**opened, manifest, content, 0);
        fill_piece(**opened, manifest, content, 3);
        assert((*opened)->verify_piece(0).has_value());
        assert((*opened)->verify_piece(3).has_value());
        assert((*opened)->flush().has_value());
    }

    {
        auto reopened = PieceStore::open(dir.path(), manifest, BLOCK);
        assert(reopened.has_value());
        auto& store = **reopened;

        assert(not store.has_piece(0));
        assert(store.recheck().value() == 2);
        assert(store.has_piece(0));
        assert(not store.has_piece(1));
        assert(not store.has_piece(2));
        assert(store.has_piece(3));
        assert(store.verified_bytes() == 32768 + 1);

        // Only missing pieces are downloaded afterwards
        fill_piece(store, manifest, content, 1);
        fill_piece(store, manifest, content, 2);
        assert(store.verify_piece(1).value() == VerifyResult::Verified);
        assert(store.verify_piece(2).value() == VerifyResult::Verified);
        assert(store.verified().all());
        assert(store.flush().has_value());
    }

    assert(testing::read_file(dir.path() / "payload.bin") == content);

    {
        auto opened = PieceStore::open(dir.path(), manifest, BLOCK);
        assert(opened.has_value());

        std::stop_source stop;
        stop.request_stop();
        assert((*opened)->recheck(stop.get_token()).error() == StoreError::CANCELLED);
    }
}

void test_piece_store_open_errors()
{
    const auto torrent =
      testing::make_torrent("payload.bin", testing::random_bytes(1000, 41), 32768);

    testing::TempDir dir;

    auto missing = PieceStore::open(dir.path() / "missing", torrent.manifest, BLOCK);
    assert(missing.error() == StoreError::STORAGE_IO_ERROR);

    auto zero_block = PieceStore::open(dir.path(), torrent.manifest, 0);
    assert(zero_block.error() == StoreError::BAD_BLOCK);
}

void test_piece_store_write_failure_keeps_buffer()
{
    const auto content = testing::random_bytes(2 * 32768, 51);
    const auto torrent = testing::make_torrent("payload.bin", content, 32768);
    const auto& manifest = torrent.manifest;

    testing::TempDir dir;
    const auto target = dir.path() / "payload.bin";

    auto opened = PieceStore::open(dir.path(), manifest, BLOCK);
    assert(opened.has_value());
    auto& store = **opened;

    // A directory in place of the file makes the write fail
    std::filesystem::remove(target);
    std::filesystem::create_directory(target);

    fill_piece(store, manifest, content, 0);
    assert(store.verify_piece(0).error() == StoreError::STORAGE_IO_ERROR);
    assert(not store.has_piece(0));

    // The blocks are still buffered and nothing can be written twice
    assert(store.is_complete(0));
    assert(
      store.write_block(0, 0, slice(content, 0, BLOCK)).error() ==
      StoreError::DUPLICATE_BLOCK
    );

    std::filesystem::remove(target);

    assert(store.verify_piece(0).value() == VerifyResult::Verified);
    assert(store.verified_bytes() == 32768);
}

void test_piece_store_concurrent_verify()
{
    // 16 pieces of 256 KiB
    constexpr std::uint64_t PIECE = 256 * 1024;
    const auto content = testing::random_bytes(16 * PIECE, 52);
    const auto torrent = testing::make_torrent("payload.bin", content, PIECE);
    const auto& manifest = torrent.manifest;

    testing::TempDir dir;

    auto opened = PieceStore::open(dir.path(), manifest, BLOCK);
    assert(opened.has_value());
    auto& store = **opened;

    for (std::size_t piece = 0; piece < manifest.piece_count(); piece += 2) {
        fill_piece(store, manifest, content, piece);
    }

    // Even pieces are hashed and written while odd ones are being buffered
    std::thread disk([&] {
        for (std::size_t piece = 0; piece < manifest.piece_count(); piece += 2) {
            auto result = store.verify_piece(piece);
            assert(result.has_value() and *result == VerifyResult::Verified);
        }
    });

    for (std::size_t piece = 1; piece < manifest.piece_count(); piece += 2) {
        fill_piece(store, manifest, content, piece);
        assert(store.is_complete(piece));
    }

    disk.join();

    for (std::size_t piece = 1; piece < manifest.piece_count(); piece += 2) {
        assert(store.verify_piece(piece).value() == VerifyResult::Verified);
    }

    assert(store.verified().all());
    assert(store.flush().has_value());
    assert(testing::read_file(dir.path() / "payload.bin") == content);
}
