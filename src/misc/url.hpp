#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

#include <curl/curl.h>
#include <fmt/core.h>
#include <magic_enum.hpp>

namespace curl {

/**
 * @brief Builder over the curl URL API
 */
struct Url
{
    inline Url() : _handle(curl_url())
    {
        if (_handle == nullptr) {
            throw std::runtime_error("curl_url failed");
        }
    }

    inline ~Url() { curl_url_cleanup(_handle); }

    Url(const Url&) = delete;
    Url& operator=(const Url&) = delete;

    inline Url& base(std::string_view base)
    {
        _set(CURLUPART_URL, std::string(base), 0);
        return *this;
    }

    template<typename ParamT>
    inline Url& query(std::string_view name, ParamT param)
    {
        _set(
          CURLUPart::CURLUPART_QUERY, fmt::format("{0}={1}", name, param),
          CURLU_APPENDQUERY
        );

        return *this;
    }

    /**
     * @brief Append a query parameter holding raw bytes, percent-encoded
     */
    inline Url& query_bytes(
      std::string_view name, std::span<const std::uint8_t> bytes
    )
    {
        std::string bytes_str{bytes.begin(), bytes.end()};

        _set(
          CURLUPART_QUERY, fmt::format("{0}={1}", name, bytes_str),
          CURLU_APPENDQUERY | CURLU_URLENCODE
        );

        return *this;
    }

    inline auto to_string() -> std::string
    {
        return _get(CURLUPart::CURLUPART_URL, CURLU_NO_DEFAULT_PORT);
    }

 private:
    inline auto _set(CURLUPart what, const std::string& part, unsigned int flags)
      -> void
    {
        auto code = curl_url_set(_handle, what, part.c_str(), flags);

        if (code != CURLUcode::CURLUE_OK) {
            throw std::invalid_argument(fmt::format(
              "Can not set URL part {0} with provided argument {1}. Error "
              "code: {2}",
              magic_enum::enum_name(what), part, magic_enum::enum_name(code)
            ));
        }
    }

    inline auto _get(CURLUPart what, unsigned int flags) -> std::string
    {
        char* part_c_str = nullptr;

        auto code = curl_url_get(_handle, what, &part_c_str, flags);

        if (code != CURLUcode::CURLUE_OK) {
            curl_free(part_c_str);

            throw std::invalid_argument(fmt::format(
              "Can not get URL part {0}. Error code: {1}",
              magic_enum::enum_name(what), magic_enum::enum_name(code)
            ));
        }

        std::string part_str{part_c_str};
        curl_free(part_c_str);

        return part_str;
    }

    CURLU* _handle;
};

}  // namespace curl
