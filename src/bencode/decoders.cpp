#include "bencode/decoders.hpp"

#include <cctype>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "bencode/consts.hpp"
#include "bencode/tools.hpp"
#include "bencode/types.hpp"

namespace bencode {

auto decode(std::string_view encoded, std::size_t max_depth) -> DecodeResult
{
    return internal::decode_any(encoded, 0, max_depth);
}

auto decode_all(std::string_view encoded) -> DecodeResult
{
    auto decoded = decode(encoded);
    if (not decoded) {
        return decoded;
    }

    auto& [source, _] = *decoded;
    if (source.value.size() != encoded.size()) {
        return tl::make_unexpected(Error::TRAILING_DATA);
    }

    return decoded;
}

auto decode_bencoded_value(std::string_view encoded_value)
  -> std::optional<DecodedValue>
{
    auto decoded = decode(encoded_value);
    if (not decoded) {
        return std::nullopt;
    }

    return *decoded;
}

auto find_raw_value(std::string_view encoded_dict, std::string_view key)
  -> std::optional<std::string_view>
{
    using namespace internal;

    if (detect_bencoded_value_type(encoded_dict) !=
        EncodedValueType::Dictionary) {
        return std::nullopt;
    }

    auto remaining = encoded_dict.substr(1);

    while (not remaining.empty() and remaining.front() != END_SYMBOL) {
        auto decoded_key = decode_string(remaining);
        if (not decoded_key) {
            return std::nullopt;
        }

        auto& [encoded_key, key_json] = *decoded_key;
        remaining.remove_prefix(encoded_key.value.size());

        auto decoded_value = decode(remaining);
        if (not decoded_value) {
            return std::nullopt;
        }

        auto& [encoded_value, _] = *decoded_value;

        if (as_string(key_json) == std::string(key)) {
            return encoded_value.value;
        }

        remaining.remove_prefix(encoded_value.value.size());
    }

    return std::nullopt;
}

namespace internal {

auto detect_bencoded_value_type(std::string_view bencoded_value)
  -> EncodedValueType
{
    if (bencoded_value.empty()) {
        return EncodedValueType::Unknown;
    }

    const auto head = bencoded_value.front();

    if (head == INTEGER_START_SYMBOL) {
        return EncodedValueType::Integer;
    }
    if (std::isdigit(static_cast<unsigned char>(head))) {
        return EncodedValueType::String;
    }
    if (head == LIST_START_SYMBOL) {
        return EncodedValueType::List;
    }
    if (head == DICT_START_SYMBOL) {
        return EncodedValueType::Dictionary;
    }
    return EncodedValueType::Unknown;
}

/**
 * @brief Decode "<len>:<bytes>"
 *
 * Valid UTF-8 becomes a Json string, anything else a Json binary.
 *
 * "5:hello" -> "hello"
 * "3:\1\2\3" -> b"\1\2\3"
 */
auto decode_string(std::string_view encoded_string) -> DecodeResult
{
    const auto delimiter_index = encoded_string.find(STRING_DELIMITER_SYMBOL);

    if (delimiter_index == std::string_view::npos) {
        return tl::make_unexpected(Error::UNEXPECTED_END);
    }

    const auto len_str = encoded_string.substr(0, delimiter_index);

    // "03:abc" is not canonical
    if (len_str.size() > 1 and len_str.front() == '0') {
        return tl::make_unexpected(Error::BAD_STRING_LENGTH);
    }

    const auto len = to_integer(len_str);
    if (not len or *len < 0) {
        return tl::make_unexpected(Error::BAD_STRING_LENGTH);
    }

    const auto body_begin = delimiter_index + 1;
    if (static_cast<std::size_t>(*len) > encoded_string.size() - body_begin) {
        return tl::make_unexpected(Error::UNEXPECTED_END);
    }

    const auto body = encoded_string.substr(body_begin, *len);
    const EncodedValue source{
      .type = EncodedValueType::String,
      .value = encoded_string.substr(0, body_begin + *len),
    };

    if (is_valid_utf8(body)) {
        return DecodedValue{source, Json(std::string(body))};
    }

    return DecodedValue{
      source, Json::binary(std::vector<std::uint8_t>(body.begin(), body.end()))
    };
}

/**
 * @brief Decode "i<digits>e"
 *
 * "i-123e" -> -123, "i-0e" and "i012e" are rejected
 */
auto decode_integer(std::string_view encoded_value) -> DecodeResult
{
    const auto end_index = encoded_value.find(END_SYMBOL);
    if (end_index == std::string_view::npos) {
        return tl::make_unexpected(Error::UNEXPECTED_END);
    }

    const auto digits = encoded_value.substr(1, end_index - 1);
    const auto unsigned_digits =
      digits.starts_with('-') ? digits.substr(1) : digits;

    if (unsigned_digits.empty() or
        (unsigned_digits.size() > 1 and unsigned_digits.front() == '0') or
        digits == "-0") {
        return tl::make_unexpected(Error::BAD_INTEGER);
    }

    const auto decoded_int = to_integer(digits);
    if (not decoded_int) {
        return tl::make_unexpected(Error::BAD_INTEGER);
    }

    return DecodedValue{
      EncodedValue{
        .type = EncodedValueType::Integer,
        .value = encoded_value.substr(0, end_index + 1),
      },
      Json(*decoded_int)
    };
}

/**
 * @brief "l5:helloi52ee" -> ["hello", 52]
 */
auto decode_list(
  std::string_view encoded_list, std::size_t depth, std::size_t max_depth
) -> DecodeResult
{
    auto remaining = encoded_list.substr(1);  // rm "l" prefix

    std::vector<Json> list;

    while (not remaining.starts_with(END_SYMBOL)) {
        auto decoded = decode_any(remaining, depth + 1, max_depth);
        if (not decoded) {
            return decoded;
        }

        auto& [encoded, item] = *decoded;
        remaining.remove_prefix(encoded.value.size());
        list.push_back(std::move(item));
    }

    remaining.remove_prefix(1);  // rm list end symbol

    return DecodedValue{
      EncodedValue{
        .type = EncodedValueType::List,
        .value = encoded_list.substr(0, encoded_list.size() - remaining.size()),
      },
      Json(std::move(list))
    };
}

/**
 * @brief "d3:foo3:bar5:helloi52ee" -> {"foo": "bar", "hello": 52}
 */
auto decode_dict(
  std::string_view encoded_dict, std::size_t depth, std::size_t max_depth
) -> DecodeResult
{
    auto remaining = encoded_dict.substr(1);  // rm "d" prefix

    std::map<std::string, Json> dict;

    while (not remaining.starts_with(END_SYMBOL)) {
        if (detect_bencoded_value_type(remaining) != EncodedValueType::String) {
            return tl::make_unexpected(
              remaining.empty() ? Error::UNEXPECTED_END : Error::BAD_DICT_KEY
            );
        }

        auto decoded_key = decode_string(remaining);
        if (not decoded_key) {
            return decoded_key;
        }

        auto& [encoded_key, key] = *decoded_key;
        remaining.remove_prefix(encoded_key.value.size());

        auto decoded_value = decode_any(remaining, depth + 1, max_depth);
        if (not decoded_value) {
            return decoded_value;
        }

        auto& [encoded_value, value] = *decoded_value;
        remaining.remove_prefix(encoded_value.value.size());

        dict.insert_or_assign(*as_string(key), std::move(value));
    }

    remaining.remove_prefix(1);  // rm dict end symbol

    return DecodedValue{
      EncodedValue{
        .type = EncodedValueType::Dictionary,
        .value = encoded_dict.substr(0, encoded_dict.size() - remaining.size()),
      },
      Json(std::move(dict))
    };
}

auto decode_any(
  std::string_view encoded_value, std::size_t depth, std::size_t max_depth
) -> DecodeResult
{
    if (depth > max_depth) {
        return tl::make_unexpected(Error::TOO_DEEP);
    }

    switch (detect_bencoded_value_type(encoded_value)) {
        case EncodedValueType::String:
            return decode_string(encoded_value);

        case EncodedValueType::Integer:
            return decode_integer(encoded_value);

        case EncodedValueType::List:
            return decode_list(encoded_value, depth, max_depth);

        case EncodedValueType::Dictionary:
            return decode_dict(encoded_value, depth, max_depth);

        default:
            break;
    }

    if (encoded_value.empty()) {
        return tl::make_unexpected(Error::UNEXPECTED_END);
    }

    return tl::make_unexpected(Error::UNKNOWN_TOKEN);
}

}  // namespace internal

}  // namespace bencode
