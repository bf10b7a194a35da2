#pragma once

#include <optional>
#include <string_view>

#include <tl/expected.hpp>

#include "bencode/consts.hpp"
#include "bencode/types.hpp"

namespace bencode {

using DecodeResult = tl::expected<DecodedValue, Error>;

/**
 * @brief Decode the first bencoded value of the source
 *
 * Trailing bytes are allowed: the returned EncodedValue tells how much of the
 * source was consumed. BEP 9 data messages rely on that because raw piece
 * bytes follow the bencoded header.
 */
auto decode(std::string_view encoded, std::size_t max_depth = MAX_NESTING_DEPTH)
  -> DecodeResult;

/**
 * @brief Decode a value that must span the whole source
 */
auto decode_all(std::string_view encoded) -> DecodeResult;

/**
 * @brief Shorthand kept for call sites that only care about success
 */
auto decode_bencoded_value(std::string_view encoded_value)
  -> std::optional<DecodedValue>;

/**
 * @brief Raw encoded text of a value stored under `key` in a top-level dict
 *
 * Used to hash the "info" dictionary exactly as it was received.
 */
auto find_raw_value(std::string_view encoded_dict, std::string_view key)
  -> std::optional<std::string_view>;

namespace internal {

auto detect_bencoded_value_type(std::string_view bencoded_value)
  -> EncodedValueType;

auto decode_string(std::string_view) -> DecodeResult;
auto decode_integer(std::string_view) -> DecodeResult;
auto decode_list(std::string_view, std::size_t depth, std::size_t max_depth)
  -> DecodeResult;
auto decode_dict(std::string_view, std::size_t depth, std::size_t max_depth)
  -> DecodeResult;
auto decode_any(std::string_view, std::size_t depth, std::size_t max_depth)
  -> DecodeResult;

}  // namespace internal

}  // namespace bencode
