#include "framing/be_uint.h"

namespace chunkio::framing {

std::size_t minimal_width(std::uint64_t value) {
  std::size_t width = 0;
  while (value != 0) {
    ++width;
    value >>= 8;
  }
  return width;
}

BeBytes encode_be_minimal(std::uint64_t value) {
  BeBytes out{};
  out.size = minimal_width(value);
  for (std::size_t i = 0; i < out.size; ++i) {
    const std::size_t shift = 8 * (out.size - 1 - i);
    out.bytes[i] = static_cast<std::uint8_t>((value >> shift) & 0xFF);
  }
  return out;
}

std::optional<std::uint64_t> decode_be(std::span<const std::uint8_t> bytes) {
  if (bytes.size() > 8) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (const auto byte : bytes) {
    value = (value << 8) | byte;
  }
  return value;
}

}  // namespace chunkio::framing
