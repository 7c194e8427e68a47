#include "framing/chunk_error.h"

#include <string>

namespace chunkio::framing {

namespace {

class ChunkCategory final : public std::error_category {
 public:
  const char* name() const noexcept override { return "chunkio.chunk"; }

  std::string message(int value) const override {
    switch (static_cast<ChunkErrc>(value)) {
      case ChunkErrc::kInvalidChunk:
        return "invalid chunk header";
      case ChunkErrc::kOutOfOrder:
        return "chunk is out of order";
      case ChunkErrc::kChunkTooLarge:
        return "chunk length exceeds limit";
    }
    return "unknown chunk error";
  }
};

}  // namespace

const std::error_category& chunk_category() noexcept {
  static const ChunkCategory category;
  return category;
}

std::error_code make_error_code(ChunkErrc e) noexcept {
  return {static_cast<int>(e), chunk_category()};
}

bool is_malformed_header(const std::error_code& ec) noexcept {
  return ec == ChunkErrc::kInvalidChunk || ec == ChunkErrc::kChunkTooLarge;
}

bool is_out_of_sequence(const std::error_code& ec) noexcept {
  return ec == ChunkErrc::kOutOfOrder;
}

bool is_transport_failure(const std::error_code& ec) noexcept {
  return static_cast<bool>(ec) && ec.category() != chunk_category();
}

}  // namespace chunkio::framing
