#include "tests/helpers.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "bencode/encoders.hpp"
#include "misc/hash.hpp"

namespace swarmget::testing {

namespace fs = std::filesystem;

namespace {

auto piece_hashes(const std::vector<std::uint8_t>& content, std::uint64_t piece_length)
  -> std::vector<std::uint8_t>
{
    std::vector<std::uint8_t> hashes;

    for (std::uint64_t offset = 0; offset < content.size(); offset += piece_length) {
        const auto end = std::min<std::uint64_t>(offset + piece_length, content.size());
        const std::string piece(content.begin() + offset, content.begin() + end);

        const auto digest = utils::sha1_digest(piece);
        hashes.insert(hashes.end(), digest.begin(), digest.end());
    }

    return hashes;
}

auto finish(bencode::Json info, std::vector<std::uint8_t> content) -> TestTorrent
{
    auto encoded = bencode::encode(info);
    if (not encoded) {
        throw std::runtime_error("Can not encode test info dictionary");
    }

    auto manifest = torrent::Manifest::from_info_bytes(*encoded);
    if (not manifest) {
        throw std::runtime_error("Test info dictionary is not a valid manifest");
    }

    TestTorrent result;
    result.content = std::move(content);
    result.info_bytes = *encoded;
    result.manifest = std::move(*manifest);
    result.info_hash = utils::sha1_digest(*encoded);
    return result;
}

}  // namespace

auto random_bytes(std::size_t size, unsigned seed) -> std::vector<std::uint8_t>
{
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> byte(0, 255);

    std::vector<std::uint8_t> bytes(size);
    std::generate(bytes.begin(), bytes.end(), [&] {
        return static_cast<std::uint8_t>(byte(gen));
    });

    return bytes;
}

auto make_torrent(
  const std::string& name,
  const std::vector<std::uint8_t>& content,
  std::uint64_t piece_length
) -> TestTorrent
{
    bencode::Json info = {
      {"name", name},
      {"length", content.size()},
      {"piece length", piece_length},
      {"pieces", bencode::Json::binary(piece_hashes(content, piece_length))},
    };

    return finish(std::move(info), content);
}

auto make_multi_file_torrent(
  const std::string& name,
  const std::vector<NamedContent>& files,
  std::uint64_t piece_length
) -> TestTorrent
{
    std::vector<std::uint8_t> content;
    auto entries = bencode::Json::array();

    for (const auto& [file_name, bytes] : files) {
        content.insert(content.end(), bytes.begin(), bytes.end());
        entries.push_back({
          {"length", bytes.size()},
          {"path", bencode::Json::array({file_name})},
        });
    }

    bencode::Json info = {
      {"name", name},
      {"files", entries},
      {"piece length", piece_length},
      {"pieces", bencode::Json::binary(piece_hashes(content, piece_length))},
    };

    return finish(std::move(info), std::move(content));
}

TempDir::TempDir()
{
    static std::atomic<unsigned> counter{0};
    std::random_device device;

    _path = fs::temp_directory_path() /
            fmt::format("swarmget-test-{}-{}", device(), counter++);

    fs::create_directories(_path);
}

TempDir::~TempDir()
{
    std::error_code ignored;
    fs::remove_all(_path, ignored);
}

auto read_file(const fs::path& path) -> std::vector<std::uint8_t>
{
    std::ifstream in(path, std::ios::binary);
    return std::vector<std::uint8_t>(
      std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()
    );
}

void RecordingSink::on_event(const engine::SwarmEvent& event)
{
    std::scoped_lock lock(_mutex);
    _events.push_back(event);
}

auto RecordingSink::events() const -> std::vector<engine::SwarmEvent>
{
    std::scoped_lock lock(_mutex);
    return _events;
}

auto RecordingSink::count(engine::EventStatus status) const -> std::size_t
{
    std::scoped_lock lock(_mutex);
    return std::ranges::count_if(_events, [status](const auto& event) {
        return event.status == status;
    });
}

}  // namespace swarmget::testing
