#pragma once

#include <system_error>
#include <type_traits>

namespace chunkio::framing {

// Protocol failures raised while decoding the chunk stream. Transport failures
// are never mapped into this category; they keep the transport's own code.
enum class ChunkErrc {
  kInvalidChunk = 1,   // Header nibbles out of range or unparsable fields.
  kOutOfOrder = 2,     // Offset field does not match the receive cursor.
  kChunkTooLarge = 3,  // Length field exceeds the configured maximum.
};

const std::error_category& chunk_category() noexcept;

std::error_code make_error_code(ChunkErrc e) noexcept;

// Malformed-Header: kInvalidChunk or kChunkTooLarge.
bool is_malformed_header(const std::error_code& ec) noexcept;

// Out-of-Sequence: kOutOfOrder.
bool is_out_of_sequence(const std::error_code& ec) noexcept;

// Transport-Failure: any error outside the chunk category.
bool is_transport_failure(const std::error_code& ec) noexcept;

}  // namespace chunkio::framing

namespace std {
template <>
struct is_error_code_enum<chunkio::framing::ChunkErrc> : true_type {};
}  // namespace std
