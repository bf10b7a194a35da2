#include "misc/curl.hpp"

#include <span>
#include <stdexcept>
#include <vector>

#include <curl/curl.h>
#include <fmt/core.h>

namespace curl {

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto data = static_cast<Curl::Buffer*>(userdata);

    std::span<Curl::Buffer::value_type> new_bytes{
      reinterpret_cast<Curl::Buffer::value_type*>(ptr), size * nmemb
    };

    data->insert(data->end(), new_bytes.begin(), new_bytes.end());

    return new_bytes.size();
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(
  void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t
)
{
    auto stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

}  // namespace

Curl::Curl() : _handle(nullptr)
{
    if (not InitContext::initialized()) {
        throw std::runtime_error("curl::InitContext must outlive Curl handles");
    }

    _handle = curl_easy_init();

    if (_handle == nullptr) {
        throw std::runtime_error("curl_easy_init failed");
    }
}

auto Curl::get(
  const std::string& url, std::chrono::milliseconds timeout, std::stop_token stop
) -> Response
{
    Response response{CURLE_OK, 0, {}};

    curl_easy_setopt(_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(_handle, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(_handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(_handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(_handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(_handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(_handle, CURLOPT_NOPROXY, "127.0.0.1,localhost");
    curl_easy_setopt(_handle, CURLOPT_TIMEOUT_MS, long(timeout.count()));
    curl_easy_setopt(_handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(_handle, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(_handle, CURLOPT_NOPROGRESS, 0L);

    response.code = curl_easy_perform(_handle);

    curl_easy_getinfo(_handle, CURLINFO_RESPONSE_CODE, &response.http_status);

    return response;
}

}  // namespace curl
