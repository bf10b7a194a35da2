#include "proto/bitfield.hpp"

#include <stdexcept>

#include <fmt/core.h>

namespace swarmget::proto {

Bitfield::Bitfield(std::size_t size, bool value) :
  _bits(size, value), _count(value ? size : 0)
{
}

auto Bitfield::from_bytes(std::span<const uint8_t> bytes, std::size_t size)
  -> tl::expected<Bitfield, Error>
{
    if (bytes.size() != (size + 7) / 8) {
        return tl::make_unexpected(Error::MALFORMED_MESSAGE);
    }

    Bitfield bitfield(size);

    for (std::size_t byte = 0; byte < bytes.size(); byte++) {
        for (std::size_t bit = 0; bit < 8; bit++) {
            const bool is_set = (bytes[byte] >> (7 - bit)) & 1;
            const auto index = byte * 8 + bit;

            if (index >= size) {
                if (is_set) {
                    return tl::make_unexpected(Error::MALFORMED_MESSAGE);
                }
                continue;
            }

            if (is_set) {
                bitfield.set(index);
            }
        }
    }

    return bitfield;
}

auto Bitfield::to_bytes() const -> std::vector<uint8_t>
{
    std::vector<uint8_t> bytes((_bits.size() + 7) / 8, 0);

    for (std::size_t index = 0; index < _bits.size(); index++) {
        if (_bits[index]) {
            bytes[index / 8] |= uint8_t(0x80 >> (index % 8));
        }
    }

    return bytes;
}

auto Bitfield::test(std::size_t index) const -> bool
{
    if (index >= _bits.size()) {
        throw std::out_of_range(
          fmt::format("Bitfield index {} out of {}", index, _bits.size())
        );
    }
    return _bits[index];
}

void Bitfield::set(std::size_t index, bool value)
{
    if (index >= _bits.size()) {
        throw std::out_of_range(
          fmt::format("Bitfield index {} out of {}", index, _bits.size())
        );
    }

    if (_bits[index] != value) {
        _bits[index] = value;
        if (value) {
            _count++;
        }
        else {
            _count--;
        }
    }
}

}  // namespace swarmget::proto
