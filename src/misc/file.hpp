#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <system_error>

#include <tl/expected.hpp>

namespace utils {

/**
 * @brief Owned POSIX file descriptor with positional I/O
 *
 * Closed on destruction. Writes and reads loop until the whole range is
 * transferred or an error occurs.
 */
class File
{
 public:
    /**
     * @brief Open (create if missing) a file and size it to `length` bytes
     */
    static auto open(const std::filesystem::path& path, std::uint64_t length)
      -> tl::expected<File, std::error_code>;

    File(const File&) = delete;
    File& operator=(const File&) = delete;

    File(File&& other) noexcept;
    File& operator=(File&& other) noexcept;

    ~File();

    auto write_at(std::uint64_t offset, std::span<const std::uint8_t> data)
      -> tl::expected<void, std::error_code>;

    /**
     * @brief Read up to data.size() bytes, fewer only at end of file
     */
    auto read_at(std::uint64_t offset, std::span<std::uint8_t> data)
      -> tl::expected<std::size_t, std::error_code>;

    auto sync() -> tl::expected<void, std::error_code>;

    auto is_open() const noexcept -> bool { return _fd >= 0; }

 private:
    explicit File(int fd) noexcept : _fd(fd) {}

    void _close() noexcept;

    int _fd = -1;
};

}  // namespace utils
