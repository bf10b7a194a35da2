#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <tl/expected.hpp>

#include "proto/types.hpp"

namespace swarmget::proto {

/**
 * @brief Set of piece indices, most significant bit of byte 0 is piece 0
 */
class Bitfield
{
 public:
    Bitfield() = default;
    explicit Bitfield(std::size_t size, bool value = false);

    /**
     * @brief Parse the wire form for a torrent of `size` pieces
     *
     * The byte count must be exactly ceil(size / 8) and the spare bits of the
     * last byte must be clear.
     */
    static auto from_bytes(std::span<const uint8_t> bytes, std::size_t size)
      -> tl::expected<Bitfield, Error>;

    auto to_bytes() const -> std::vector<uint8_t>;

    auto size() const noexcept -> std::size_t { return _bits.size(); }
    auto count() const noexcept -> std::size_t { return _count; }
    auto all() const noexcept -> bool { return _count == _bits.size(); }
    auto none() const noexcept -> bool { return _count == 0; }

    auto test(std::size_t index) const -> bool;
    void set(std::size_t index, bool value = true);

    auto operator==(const Bitfield&) const -> bool = default;

 private:
    std::vector<bool> _bits;
    std::size_t _count = 0;
};

}  // namespace swarmget::proto
