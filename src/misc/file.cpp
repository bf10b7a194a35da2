#include "misc/file.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace utils {

namespace {

auto last_error() -> std::error_code
{
    return {errno, std::generic_category()};
}

}  // namespace

auto File::open(const std::filesystem::path& path, std::uint64_t length)
  -> tl::expected<File, std::error_code>
{
    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        return tl::make_unexpected(last_error());
    }

    File file(fd);

    struct stat info{};
    if (::fstat(fd, &info) != 0) {
        return tl::make_unexpected(last_error());
    }

    if (static_cast<std::uint64_t>(info.st_size) != length and
        ::ftruncate(fd, static_cast<off_t>(length)) != 0) {
        return tl::make_unexpected(last_error());
    }

    return std::move(file);
}

File::File(File&& other) noexcept : _fd(std::exchange(other._fd, -1)) {}

File& File::operator=(File&& other) noexcept
{
    if (this != &other) {
        _close();
        _fd = std::exchange(other._fd, -1);
    }
    return *this;
}

File::~File()
{
    _close();
}

auto File::write_at(std::uint64_t offset, std::span<const std::uint8_t> data)
  -> tl::expected<void, std::error_code>
{
    std::size_t written = 0;

    while (written < data.size()) {
        const auto result = ::pwrite(
          _fd, data.data() + written, data.size() - written,
          static_cast<off_t>(offset + written)
        );

        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return tl::make_unexpected(last_error());
        }

        written += static_cast<std::size_t>(result);
    }

    return {};
}

auto File::read_at(std::uint64_t offset, std::span<std::uint8_t> data)
  -> tl::expected<std::size_t, std::error_code>
{
    std::size_t read = 0;

    while (read < data.size()) {
        const auto result = ::pread(
          _fd, data.data() + read, data.size() - read,
          static_cast<off_t>(offset + read)
        );

        if (result < 0) {
            if (errno == EINTR) {
                continue;
            }
            return tl::make_unexpected(last_error());
        }

        if (result == 0) {
            break;  // end of file
        }

        read += static_cast<std::size_t>(result);
    }

    return read;
}

auto File::sync() -> tl::expected<void, std::error_code>
{
    if (::fsync(_fd) != 0) {
        return tl::make_unexpected(last_error());
    }
    return {};
}

void File::_close() noexcept
{
    if (_fd >= 0) {
        ::close(_fd);
        _fd = -1;
    }
}

}  // namespace utils
