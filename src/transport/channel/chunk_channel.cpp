#include "transport/channel/chunk_channel.h"

#include <utility>

#include "common/logging/logger.h"
#include "framing/chunk_error.h"

namespace chunkio::transport {

ChunkChannel::ChunkChannel(std::unique_ptr<ByteTransport> transport,
                           config::ChannelConfig channel_config)
    : transport_(std::move(transport)), config_(channel_config) {
  if (config_.read_chunk_size == 0) {
    config_.read_chunk_size = config::ChannelConfig{}.read_chunk_size;
  }
  if (config_.backpressure_threshold == 0) {
    config_.backpressure_threshold = config::ChannelConfig{}.backpressure_threshold;
  }
  codec_.set_max_chunk_length(config_.max_chunk_length);
}

NextResult ChunkChannel::poll_next(std::error_code& ec) {
  ec.clear();
  if (read_error_) {
    ec = read_error_;
    return {NextStatus::kError, {}};
  }

  while (true) {
    std::error_code decode_ec;
    auto chunk = codec_.decode(read_buffer_, decode_ec);
    if (decode_ec) {
      read_error_ = decode_ec;
      ec = decode_ec;
      LOG_WARN("Chunk stream terminated at receive offset {}: {}", codec_.receive_cursor(),
               decode_ec.message());
      return {NextStatus::kError, {}};
    }
    if (chunk) {
      ++stats_.chunks_received;
      stats_.payload_bytes_received += chunk->size();
      return {NextStatus::kChunk, std::move(*chunk)};
    }

    if (read_eof_) {
      if (read_buffer_.empty()) {
        return {NextStatus::kEndOfStream, {}};
      }
      read_error_ = std::make_error_code(std::errc::connection_aborted);
      ec = read_error_;
      LOG_WARN("Transport closed with {} bytes of an incomplete chunk buffered",
               read_buffer_.size());
      return {NextStatus::kError, {}};
    }

    const std::size_t used = read_buffer_.size();
    read_buffer_.resize(used + config_.read_chunk_size);
    std::error_code io_ec;
    const IoResult result =
        transport_->read_some(std::span<std::uint8_t>(read_buffer_).subspan(used), io_ec);
    read_buffer_.resize(used + (result.status == IoStatus::kReady ? result.bytes : 0));

    switch (result.status) {
      case IoStatus::kReady:
        stats_.wire_bytes_read += result.bytes;
        LOG_TRACE("Read {} bytes, {} buffered", result.bytes, read_buffer_.size());
        break;
      case IoStatus::kWouldBlock:
      case IoStatus::kPending:
        return {NextStatus::kPending, {}};
      case IoStatus::kEndOfStream:
        read_eof_ = true;
        break;
      case IoStatus::kError:
        read_error_ = io_ec;
        ec = io_ec;
        LOG_ERROR("Transport read failed: {}", io_ec.message());
        return {NextStatus::kError, {}};
    }
  }
}

NextResult ChunkChannel::next_chunk(std::chrono::milliseconds timeout, std::error_code& ec) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    NextResult result = poll_next(ec);
    if (result.status != NextStatus::kPending) {
      return result;
    }
    if (!wait_ready(Interest::kRead, deadline, ec)) {
      return {NextStatus::kError, {}};
    }
  }
}

IoStatus ChunkChannel::send(std::span<const std::uint8_t> chunk, std::error_code& ec) {
  ec.clear();
  if (write_error_) {
    ec = write_error_;
    return IoStatus::kError;
  }
  if (write_closed_) {
    ec = std::make_error_code(std::errc::broken_pipe);
    return IoStatus::kError;
  }

  if (!write_buffer_.empty() && write_buffer_.size() >= config_.backpressure_threshold) {
    if (drain_write_buffer(ec) == IoStatus::kError) {
      return IoStatus::kError;
    }
    if (!write_buffer_.empty() && write_buffer_.size() >= config_.backpressure_threshold) {
      return IoStatus::kPending;
    }
  }

  codec_.encode(chunk, write_buffer_);
  ++stats_.chunks_sent;
  stats_.payload_bytes_sent += chunk.size();
  return IoStatus::kReady;
}

bool ChunkChannel::send_chunk(std::span<const std::uint8_t> chunk,
                              std::chrono::milliseconds timeout, std::error_code& ec) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    switch (send(chunk, ec)) {
      case IoStatus::kReady:
        return true;
      case IoStatus::kPending:
        if (!wait_ready(Interest::kWrite, deadline, ec)) {
          return false;
        }
        break;
      default:
        return false;
    }
  }
}

IoStatus ChunkChannel::poll_flush(std::error_code& ec) {
  ec.clear();
  if (write_error_) {
    ec = write_error_;
    return IoStatus::kError;
  }

  const IoStatus drained = drain_write_buffer(ec);
  if (drained != IoStatus::kReady) {
    return drained;
  }

  std::error_code io_ec;
  const IoResult result = transport_->flush(io_ec);
  switch (result.status) {
    case IoStatus::kReady:
      return IoStatus::kReady;
    case IoStatus::kError:
      return fail_write(io_ec, ec);
    default:
      return IoStatus::kPending;
  }
}

bool ChunkChannel::flush(std::chrono::milliseconds timeout, std::error_code& ec) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    switch (poll_flush(ec)) {
      case IoStatus::kReady:
        return true;
      case IoStatus::kPending:
        if (!wait_ready(Interest::kWrite, deadline, ec)) {
          return false;
        }
        break;
      default:
        return false;
    }
  }
}

IoStatus ChunkChannel::poll_close(std::error_code& ec) {
  if (write_closed_) {
    ec.clear();
    return IoStatus::kReady;
  }

  const IoStatus flushed = poll_flush(ec);
  if (flushed != IoStatus::kReady) {
    return flushed;
  }

  std::error_code io_ec;
  const IoResult result = transport_->shutdown_write(io_ec);
  switch (result.status) {
    case IoStatus::kReady:
      write_closed_ = true;
      LOG_DEBUG("Send side closed after {} chunks ({} payload bytes)", stats_.chunks_sent,
                stats_.payload_bytes_sent);
      return IoStatus::kReady;
    case IoStatus::kError:
      return fail_write(io_ec, ec);
    default:
      return IoStatus::kPending;
  }
}

bool ChunkChannel::close(std::chrono::milliseconds timeout, std::error_code& ec) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    switch (poll_close(ec)) {
      case IoStatus::kReady:
        return true;
      case IoStatus::kPending:
        if (!wait_ready(Interest::kWrite, deadline, ec)) {
          return false;
        }
        break;
      default:
        return false;
    }
  }
}

IoStatus ChunkChannel::drain_write_buffer(std::error_code& ec) {
  std::size_t written = 0;
  IoStatus status = IoStatus::kReady;

  while (written < write_buffer_.size()) {
    std::error_code io_ec;
    const IoResult result = transport_->write_some(
        std::span<const std::uint8_t>(write_buffer_).subspan(written), io_ec);
    if (result.status == IoStatus::kReady && result.bytes > 0) {
      written += result.bytes;
      continue;
    }
    if (result.status == IoStatus::kWouldBlock || result.status == IoStatus::kPending) {
      status = IoStatus::kPending;
      break;
    }
    write_buffer_.erase(write_buffer_.begin(),
                        write_buffer_.begin() + static_cast<std::ptrdiff_t>(written));
    stats_.wire_bytes_written += written;
    // A zero-byte write on a non-empty buffer means the transport stopped accepting data.
    return fail_write(result.status == IoStatus::kError ? io_ec
                                                         : std::make_error_code(std::errc::io_error),
                      ec);
  }

  write_buffer_.erase(write_buffer_.begin(),
                      write_buffer_.begin() + static_cast<std::ptrdiff_t>(written));
  stats_.wire_bytes_written += written;
  return status;
}

IoStatus ChunkChannel::fail_write(const std::error_code& error, std::error_code& ec) {
  write_error_ = error;
  ec = error;
  LOG_ERROR("Transport write failed with {} bytes pending: {}", write_buffer_.size(),
            error.message());
  return IoStatus::kError;
}

bool ChunkChannel::wait_ready(Interest interest, std::chrono::steady_clock::time_point deadline,
                              std::error_code& ec) {
  const auto now = std::chrono::steady_clock::now();
  if (now >= deadline) {
    ec = std::make_error_code(std::errc::timed_out);
    return false;
  }
  const auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
  if (transport_->wait(interest, remaining, ec)) {
    return true;
  }
  if (!ec) {
    ec = std::make_error_code(std::errc::timed_out);
  }
  return false;
}

}  // namespace chunkio::transport
