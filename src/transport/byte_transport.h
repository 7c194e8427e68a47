#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <system_error>

namespace chunkio::transport {

enum class IoStatus {
  kReady,        // Operation completed (bytes moved, flush or shutdown done).
  kWouldBlock,   // Transport not ready; retry after wait().
  kPending,      // Channel-level suspension: backpressure or an undrained write
                 // buffer. Wait for writability and call again.
  kEndOfStream,  // Peer closed its write side (reads only).
  kError,        // Transport failure; see the error_code.
};

struct IoResult {
  IoStatus status{IoStatus::kReady};
  std::size_t bytes{0};
};

enum class Interest : std::uint8_t { kRead = 1, kWrite = 2 };

// Readiness-driven, non-blocking duplex byte stream.
// Bytes are delivered in the order they were written. Implementations never
// block in read_some/write_some/flush/shutdown_write; they report kWouldBlock.
class ByteTransport {
 public:
  virtual ~ByteTransport() = default;

  virtual IoResult read_some(std::span<std::uint8_t> buffer, std::error_code& ec) = 0;
  virtual IoResult write_some(std::span<const std::uint8_t> data, std::error_code& ec) = 0;

  // Pushes any bytes the transport itself buffers.
  virtual IoResult flush(std::error_code& ec) = 0;

  // Signals end-of-stream to the peer. Reads stay possible.
  virtual IoResult shutdown_write(std::error_code& ec) = 0;

  // Blocks until the transport is ready for interest or timeout expires.
  // Returns true when ready, false on timeout (ec clear) or failure (ec set).
  virtual bool wait(Interest interest, std::chrono::milliseconds timeout, std::error_code& ec) = 0;
};

}  // namespace chunkio::transport
