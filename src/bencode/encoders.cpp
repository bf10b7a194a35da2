#include "bencode/encoders.hpp"

#include <optional>
#include <string>

#include <fmt/core.h>

#include "bencode/consts.hpp"

namespace bencode {

auto encode(const Json& value) -> std::optional<std::string>
{
    using namespace internal;

    if (value.is_number_integer()) {
        return encode_integer(value);
    }
    if (value.is_string()) {
        return encode_string(value.get_ref<const std::string&>());
    }
    if (value.is_binary()) {
        return encode_binary(value);
    }
    if (value.is_object()) {
        return encode_dict(value);
    }
    if (value.is_array()) {
        return encode_list(value);
    }

    return std::nullopt;
}

namespace internal {

auto encode_integer(const Json& value) -> std::string
{
    return fmt::format(
      "{}{}{}", INTEGER_START_SYMBOL, value.get<Integer>(), END_SYMBOL
    );
}

auto encode_string(const std::string& str) -> std::string
{
    return fmt::format("{}{}{}", str.size(), STRING_DELIMITER_SYMBOL, str);
}

auto encode_binary(const Json& value) -> std::string
{
    const auto& bin = value.get_binary();
    return encode_string(std::string(bin.begin(), bin.end()));
}

auto encode_dict(const Json& dict) -> std::optional<std::string>
{
    std::string encoded(1, DICT_START_SYMBOL);

    for (const auto& [key, value] : dict.items()) {
        auto encoded_value = encode(value);
        if (not encoded_value) {
            return std::nullopt;
        }

        encoded += encode_string(key);
        encoded += *encoded_value;
    }

    encoded += END_SYMBOL;
    return encoded;
}

auto encode_list(const Json& list) -> std::optional<std::string>
{
    std::string encoded(1, LIST_START_SYMBOL);

    for (const auto& item : list) {
        auto encoded_item = encode(item);
        if (not encoded_item) {
            return std::nullopt;
        }

        encoded += *encoded_item;
    }

    encoded += END_SYMBOL;
    return encoded;
}

}  // namespace internal

}  // namespace bencode
