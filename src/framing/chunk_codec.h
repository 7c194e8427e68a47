#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

namespace chunkio::framing {

using Chunk = std::vector<std::uint8_t>;

// Stateful encoder/decoder for the chunk wire format.
// Wire format, per chunk:
//   [header: 1 byte, high nibble = index width (0..8), low nibble = length width (1..8)]
//   [offset: index width bytes, big-endian, minimal width]
//   [length: length width bytes, big-endian, minimal width]
//   [payload: length bytes]
// The offset is the number of payload bytes sent before this chunk. It is
// checked against the receive cursor on decode and is not used for addressing.
//
// Send and receive cursors are independent. One codec instance serves one
// duplex connection whose peer codec also started from zero.
class ChunkCodec {
 public:
  static constexpr std::size_t kMinHeaderSize = 2;
  static constexpr std::size_t kMaxHeaderSize = 1 + 8 + 8;
  static constexpr std::size_t kMaxFieldWidth = 8;

  ChunkCodec() = default;

  // Decodes at most one chunk from the front of buffer.
  // Returns the chunk and removes its bytes from buffer when complete.
  // Returns nullopt with ec clear when more bytes are needed; buffer is
  // untouched in that case. Returns nullopt with ec set on a protocol error.
  std::optional<Chunk> decode(std::vector<std::uint8_t>& buffer, std::error_code& ec);

  // Appends the framed chunk to output and advances the send cursor.
  void encode(std::span<const std::uint8_t> chunk, std::vector<std::uint8_t>& output);

  // Bytes encode() would append for a chunk of this length at the current send cursor.
  std::size_t encoded_size(std::uint64_t chunk_length) const;

  // Appends the header (header byte, offset and length fields) for a chunk.
  // A zero length is written as a one-byte field holding 0.
  static void write_header(std::uint64_t offset, std::uint64_t length,
                           std::vector<std::uint8_t>& output);

  std::uint64_t send_cursor() const { return send_cursor_; }
  std::uint64_t receive_cursor() const { return receive_cursor_; }

  // 0 disables the limit.
  void set_max_chunk_length(std::uint64_t max_length) { max_chunk_length_ = max_length; }
  std::uint64_t max_chunk_length() const { return max_chunk_length_; }

 private:
  std::uint64_t send_cursor_{0};
  std::uint64_t receive_cursor_{0};
  std::uint64_t max_chunk_length_{0};
};

}  // namespace chunkio::framing
