#pragma once

#include <cstddef>

namespace bencode {

constexpr const char END_SYMBOL = 'e';
constexpr const char LIST_START_SYMBOL = 'l';
constexpr const char DICT_START_SYMBOL = 'd';
constexpr const char INTEGER_START_SYMBOL = 'i';
constexpr const char STRING_DELIMITER_SYMBOL = ':';

// Nesting limit for untrusted input (tracker replies, peer extension messages)
constexpr const std::size_t MAX_NESTING_DEPTH = 64;

}  // namespace bencode
