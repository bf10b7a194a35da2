#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <utility>

namespace utils {

/**
 * @brief Bytes per second over a rolling time window
 */
class RateMeter
{
 public:
    using Clock = std::chrono::steady_clock;

    inline explicit RateMeter(
      std::chrono::milliseconds window = std::chrono::seconds(5)
    ) :
      _window(window)
    {
    }

    inline void add(std::size_t bytes, Clock::time_point now = Clock::now())
    {
        _samples.emplace_back(now, bytes);
        _bytes_in_window += bytes;
        _expire(now);
    }

    inline auto rate(Clock::time_point now = Clock::now()) -> double
    {
        _expire(now);

        const auto seconds =
          std::chrono::duration<double>(_window).count();

        return seconds > 0 ? double(_bytes_in_window) / seconds : 0.0;
    }

 private:
    inline void _expire(Clock::time_point now)
    {
        while (not _samples.empty() and
               now - _samples.front().first > _window) {
            _bytes_in_window -= _samples.front().second;
            _samples.pop_front();
        }
    }

    std::chrono::milliseconds _window;
    std::deque<std::pair<Clock::time_point, std::size_t>> _samples;
    std::size_t _bytes_in_window = 0;
};

}  // namespace utils
