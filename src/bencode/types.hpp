#pragma once

#include <string_view>
#include <tuple>

#include <nlohmann/json.hpp>

namespace bencode {

using Json = nlohmann::json;
using Integer = long long;

enum class EncodedValueType
{
    Integer,
    String,
    List,
    Dictionary,
    Unknown,
};

/**
 * @brief Slice of the source text a value was decoded from
 */
struct EncodedValue
{
    EncodedValueType type;
    std::string_view value;
};

using DecodedValue = std::tuple<EncodedValue, Json>;

enum class Error
{
    UNEXPECTED_END,
    UNKNOWN_TOKEN,
    BAD_INTEGER,
    BAD_STRING_LENGTH,
    BAD_DICT_KEY,
    TOO_DEEP,
    TRAILING_DATA,
};

}  // namespace bencode
