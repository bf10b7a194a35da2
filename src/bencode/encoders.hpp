#pragma once

#include <optional>
#include <string>

#include "bencode/types.hpp"

namespace bencode {

/**
 * @brief Encode a Json value built from bencode types
 *
 * Objects are emitted with sorted keys (nlohmann::json keeps them sorted), so
 * decoding and encoding a canonical dictionary reproduces it byte for byte.
 * Floats, booleans and nulls have no bencode form and yield nullopt.
 */
auto encode(const Json&) -> std::optional<std::string>;

namespace internal {

auto encode_integer(const Json&) -> std::string;
auto encode_string(const std::string&) -> std::string;
auto encode_binary(const Json&) -> std::string;
auto encode_dict(const Json&) -> std::optional<std::string>;
auto encode_list(const Json&) -> std::optional<std::string>;

}  // namespace internal

}  // namespace bencode
