#pragma once

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include "transport/byte_transport.h"

namespace chunkio::transport {

// Non-blocking stream socket (Unix domain, TCP, or any stream fd).
class StreamSocket final : public ByteTransport {
 public:
  StreamSocket() = default;
  ~StreamSocket() override;

  StreamSocket(const StreamSocket&) = delete;
  StreamSocket& operator=(const StreamSocket&) = delete;
  StreamSocket(StreamSocket&& other) noexcept;
  StreamSocket& operator=(StreamSocket&& other) noexcept;

  // Takes ownership of a connected stream fd and switches it to non-blocking mode.
  // The fd is closed on failure.
  bool adopt(int fd, std::error_code& ec);

  // Connects to a Unix domain stream socket.
  bool connect_unix(const std::string& path, std::error_code& ec);

  // Creates a connected pair of Unix domain stream sockets.
  static std::optional<std::pair<StreamSocket, StreamSocket>> make_pair(std::error_code& ec);

  IoResult read_some(std::span<std::uint8_t> buffer, std::error_code& ec) override;
  IoResult write_some(std::span<const std::uint8_t> data, std::error_code& ec) override;
  IoResult flush(std::error_code& ec) override;
  IoResult shutdown_write(std::error_code& ec) override;
  bool wait(Interest interest, std::chrono::milliseconds timeout, std::error_code& ec) override;

  void close();

  [[nodiscard]] bool is_open() const { return fd_ >= 0; }
  int fd() const { return fd_; }

 private:
  bool ensure_epoll(std::error_code& ec);
  void close_epoll();

  int fd_{-1};
  int epoll_fd_{-1};  // Persistent epoll FD reused across wait() calls.
  std::uint32_t registered_events_{0};
};

// Listening Unix domain stream socket.
class StreamListener {
 public:
  StreamListener() = default;
  ~StreamListener();

  StreamListener(const StreamListener&) = delete;
  StreamListener& operator=(const StreamListener&) = delete;

  // Binds and listens on path, removing a stale socket file first.
  bool listen(const std::string& path, std::error_code& ec);

  // Non-blocking accept. Returns nullopt with ec clear when no connection is pending.
  std::optional<StreamSocket> accept(std::error_code& ec);

  void close();

  [[nodiscard]] bool is_listening() const { return fd_ >= 0; }
  int fd() const { return fd_; }

 private:
  std::string path_;
  int fd_{-1};
};

}  // namespace chunkio::transport
