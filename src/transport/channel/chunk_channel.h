#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <system_error>
#include <vector>

#include "common/config/config.h"
#include "framing/chunk_codec.h"
#include "transport/byte_transport.h"

namespace chunkio::transport {

enum class NextStatus {
  kChunk,        // A chunk was decoded.
  kPending,      // No complete chunk yet and the transport has nothing to read.
  kEndOfStream,  // Peer closed cleanly between chunks.
  kError,        // Protocol or transport failure; see the error_code.
};

struct NextResult {
  NextStatus status{NextStatus::kPending};
  framing::Chunk chunk;
};

struct ChannelStats {
  std::uint64_t chunks_sent{0};
  std::uint64_t chunks_received{0};
  std::uint64_t payload_bytes_sent{0};
  std::uint64_t payload_bytes_received{0};
  std::uint64_t wire_bytes_written{0};
  std::uint64_t wire_bytes_read{0};
};

/**
 * Duplex chunk adapter over a ByteTransport.
 *
 * Incoming bytes accumulate in a read buffer and are cut into chunks by the
 * codec; outgoing chunks are framed into a write buffer and drained to the
 * transport as it accepts bytes.
 *
 * The poll_* operations and send() never block. kPending means the transport
 * is not ready; wait for readiness and call again. Partially received frames
 * stay buffered across kPending, so an abandoned wait loses nothing.
 * next_chunk(), send_chunk(), flush() and close() are blocking forms built on
 * ByteTransport::wait().
 *
 * A decode failure or transport read failure ends the receive direction:
 * every later poll_next() reports the same error. A transport write failure
 * ends the send direction the same way. Nothing is retried.
 *
 * Thread Safety:
 *   Not thread-safe. Use one reader and one writer, serialized by the caller.
 */
class ChunkChannel {
 public:
  explicit ChunkChannel(std::unique_ptr<ByteTransport> transport,
                        config::ChannelConfig channel_config = {});

  ChunkChannel(const ChunkChannel&) = delete;
  ChunkChannel& operator=(const ChunkChannel&) = delete;

  // Returns the next chunk if one can be decoded without blocking.
  NextResult poll_next(std::error_code& ec);

  // Blocks until a chunk, end of stream, error, or timeout (std::errc::timed_out).
  NextResult next_chunk(std::chrono::milliseconds timeout, std::error_code& ec);
  NextResult next_chunk(std::error_code& ec) { return next_chunk(config_.io_timeout, ec); }

  // Frames chunk into the write buffer. Returns kPending without taking the
  // chunk when the write buffer is over the backpressure threshold and the
  // transport cannot drain it right now.
  IoStatus send(std::span<const std::uint8_t> chunk, std::error_code& ec);

  // Blocking send: waits out backpressure.
  bool send_chunk(std::span<const std::uint8_t> chunk, std::chrono::milliseconds timeout,
                  std::error_code& ec);
  bool send_chunk(std::span<const std::uint8_t> chunk, std::error_code& ec) {
    return send_chunk(chunk, config_.io_timeout, ec);
  }

  // Hands every buffered byte to the transport, then flushes the transport.
  IoStatus poll_flush(std::error_code& ec);
  bool flush(std::chrono::milliseconds timeout, std::error_code& ec);
  bool flush(std::error_code& ec) { return flush(config_.io_timeout, ec); }

  // Flushes, then signals end of stream to the peer. Further sends fail with
  // std::errc::broken_pipe. Receiving stays possible.
  IoStatus poll_close(std::error_code& ec);
  bool close(std::chrono::milliseconds timeout, std::error_code& ec);
  bool close(std::error_code& ec) { return close(config_.io_timeout, ec); }

  std::uint64_t send_cursor() const { return codec_.send_cursor(); }
  std::uint64_t receive_cursor() const { return codec_.receive_cursor(); }
  const ChannelStats& stats() const { return stats_; }
  std::size_t pending_write_bytes() const { return write_buffer_.size(); }
  std::size_t buffered_read_bytes() const { return read_buffer_.size(); }
  const config::ChannelConfig& channel_config() const { return config_; }

  ByteTransport& transport() { return *transport_; }

 private:
  IoStatus drain_write_buffer(std::error_code& ec);
  IoStatus fail_write(const std::error_code& error, std::error_code& ec);
  bool wait_ready(Interest interest, std::chrono::steady_clock::time_point deadline,
                  std::error_code& ec);

  std::unique_ptr<ByteTransport> transport_;
  config::ChannelConfig config_;
  framing::ChunkCodec codec_;

  std::vector<std::uint8_t> read_buffer_;
  bool read_eof_{false};
  std::error_code read_error_;

  std::vector<std::uint8_t> write_buffer_;
  bool write_closed_{false};
  std::error_code write_error_;

  ChannelStats stats_;
};

}  // namespace chunkio::transport
