#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "engine/events.hpp"
#include "torrent/descriptor.hpp"
#include "torrent/manifest.hpp"

namespace swarmget::testing {

auto random_bytes(std::size_t size, unsigned seed) -> std::vector<std::uint8_t>;

struct TestTorrent
{
    std::vector<std::uint8_t> content;
    std::string info_bytes;
    torrent::Manifest manifest;
    torrent::InfoHash info_hash{};
};

using NamedContent = std::pair<std::string, std::vector<std::uint8_t>>;

auto make_torrent(
  const std::string& name,
  const std::vector<std::uint8_t>& content,
  std::uint64_t piece_length
) -> TestTorrent;

auto make_multi_file_torrent(
  const std::string& name,
  const std::vector<NamedContent>& files,
  std::uint64_t piece_length
) -> TestTorrent;

/**
 * @brief Fresh directory under the system temp dir, removed on destruction
 */
class TempDir
{
 public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    auto path() const -> const std::filesystem::path& { return _path; }

 private:
    std::filesystem::path _path;
};

auto read_file(const std::filesystem::path& path) -> std::vector<std::uint8_t>;

class RecordingSink : public engine::EventSink
{
 public:
    void on_event(const engine::SwarmEvent& event) override;

    auto events() const -> std::vector<engine::SwarmEvent>;
    auto count(engine::EventStatus status) const -> std::size_t;

 private:
    mutable std::mutex _mutex;
    std::vector<engine::SwarmEvent> _events;
};

}  // namespace swarmget::testing
