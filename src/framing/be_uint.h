#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace chunkio::framing {

// Big-endian integer with leading zero bytes stripped. Value 0 has size 0.
struct BeBytes {
  std::array<std::uint8_t, 8> bytes{};
  std::size_t size{0};

  std::span<const std::uint8_t> view() const { return {bytes.data(), size}; }
};

// Number of bytes needed to hold value (0 for value 0, at most 8).
std::size_t minimal_width(std::uint64_t value);

// Shortest big-endian representation of value.
BeBytes encode_be_minimal(std::uint64_t value);

// Reconstructs an unsigned value from 0..8 big-endian bytes. An empty slice is 0.
// Returns nullopt for slices wider than 8 bytes.
std::optional<std::uint64_t> decode_be(std::span<const std::uint8_t> bytes);

}  // namespace chunkio::framing
