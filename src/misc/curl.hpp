#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

#include <curl/curl.h>

namespace curl {

/**
 * @brief Scoped curl_global_init/curl_global_cleanup, reference counted
 */
struct InitContext
{
    inline InitContext()
    {
        std::scoped_lock lock(_mutex);
        if (_users++ == 0) {
            curl_global_init(CURL_GLOBAL_DEFAULT);
        }
    }

    inline ~InitContext()
    {
        std::scoped_lock lock(_mutex);
        if (--_users == 0) {
            curl_global_cleanup();
        }
    }

    InitContext(const InitContext&) = delete;
    InitContext& operator=(const InitContext&) = delete;

    inline static auto initialized() -> bool
    {
        std::scoped_lock lock(_mutex);
        return _users > 0;
    }

 private:
    inline static std::mutex _mutex;
    inline static std::size_t _users = 0;
};


struct Curl
{
    using Buffer = std::vector<uint8_t>;

    struct Response
    {
        CURLcode code;
        long http_status;
        Buffer body;
    };

    Curl();
    inline ~Curl() { curl_easy_cleanup(_handle); }

    Curl(const Curl&) = delete;
    Curl& operator=(const Curl&) = delete;

    /**
     * @brief Blocking GET, aborted early when `stop` is requested
     */
    auto get(
      const std::string& url,
      std::chrono::milliseconds timeout,
      std::stop_token stop = {}
    ) -> Response;

 private:
    CURL* _handle;
};


}  // namespace curl
