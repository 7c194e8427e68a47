#include "framing/chunk_codec.h"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "framing/be_uint.h"
#include "framing/chunk_error.h"

namespace {

// Length fields are never empty on the wire.
std::size_t length_field_width(std::uint64_t length) {
  return std::max<std::size_t>(1, chunkio::framing::minimal_width(length));
}

}  // namespace

namespace chunkio::framing {

std::optional<Chunk> ChunkCodec::decode(std::vector<std::uint8_t>& buffer, std::error_code& ec) {
  ec.clear();
  if (buffer.size() < kMinHeaderSize) {
    return std::nullopt;
  }

  const std::size_t index_width = buffer[0] >> 4;
  const std::size_t length_width = buffer[0] & 0x0F;
  if (index_width > kMaxFieldWidth || length_width > kMaxFieldWidth || length_width == 0) {
    ec = ChunkErrc::kInvalidChunk;
    return std::nullopt;
  }

  const std::size_t header_size = 1 + index_width + length_width;
  if (buffer.size() < header_size) {
    return std::nullopt;
  }

  const std::span<const std::uint8_t> view(buffer);
  const auto offset = decode_be(view.subspan(1, index_width));
  if (!offset) {
    ec = ChunkErrc::kInvalidChunk;
    return std::nullopt;
  }
  if (*offset != receive_cursor_) {
    ec = ChunkErrc::kOutOfOrder;
    return std::nullopt;
  }

  const auto length = decode_be(view.subspan(1 + index_width, length_width));
  if (!length) {
    ec = ChunkErrc::kInvalidChunk;
    return std::nullopt;
  }
  if (max_chunk_length_ != 0 && *length > max_chunk_length_) {
    ec = ChunkErrc::kChunkTooLarge;
    return std::nullopt;
  }

  // Compared this way round so a huge length field cannot overflow.
  if (buffer.size() - header_size < *length) {
    return std::nullopt;
  }

  const auto payload_begin = buffer.begin() + static_cast<std::ptrdiff_t>(header_size);
  const auto payload_end = payload_begin + static_cast<std::ptrdiff_t>(*length);
  Chunk chunk(payload_begin, payload_end);
  buffer.erase(buffer.begin(), payload_end);
  receive_cursor_ += *length;
  return chunk;
}

void ChunkCodec::encode(std::span<const std::uint8_t> chunk, std::vector<std::uint8_t>& output) {
  output.reserve(output.size() + encoded_size(chunk.size()));
  write_header(send_cursor_, chunk.size(), output);
  output.insert(output.end(), chunk.begin(), chunk.end());
  send_cursor_ += chunk.size();
}

std::size_t ChunkCodec::encoded_size(std::uint64_t chunk_length) const {
  return 1 + minimal_width(send_cursor_) + length_field_width(chunk_length) +
         static_cast<std::size_t>(chunk_length);
}

void ChunkCodec::write_header(std::uint64_t offset, std::uint64_t length,
                              std::vector<std::uint8_t>& output) {
  const BeBytes index_bytes = encode_be_minimal(offset);
  BeBytes length_bytes = encode_be_minimal(length);
  if (length_bytes.size == 0) {
    length_bytes.size = 1;
  }

  output.push_back(static_cast<std::uint8_t>((index_bytes.size << 4) | length_bytes.size));
  const auto index_view = index_bytes.view();
  const auto length_view = length_bytes.view();
  output.insert(output.end(), index_view.begin(), index_view.end());
  output.insert(output.end(), length_view.begin(), length_view.end());
}

}  // namespace chunkio::framing
