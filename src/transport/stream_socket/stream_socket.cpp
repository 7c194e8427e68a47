#include "transport/stream_socket/stream_socket.h"

#include <fcntl.h>
#include <sys/epoll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>
#include <system_error>

#include "common/logging/logger.h"

namespace chunkio::transport {

namespace {
constexpr int kMaxPendingConnections = 16;

std::error_code last_error() { return std::error_code(errno, std::generic_category()); }

bool set_nonblocking(int fd, std::error_code& ec) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    ec = last_error();
    return false;
  }
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    ec = last_error();
    return false;
  }
  return true;
}

bool fill_address(const std::string& path, sockaddr_un& addr, std::error_code& ec) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (path.size() >= sizeof(addr.sun_path)) {
    ec = std::make_error_code(std::errc::filename_too_long);
    return false;
  }
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  return true;
}

bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
}  // namespace

// ============================================================================
// StreamSocket
// ============================================================================

StreamSocket::~StreamSocket() { close(); }

StreamSocket::StreamSocket(StreamSocket&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)),
      epoll_fd_(std::exchange(other.epoll_fd_, -1)),
      registered_events_(std::exchange(other.registered_events_, 0)) {}

StreamSocket& StreamSocket::operator=(StreamSocket&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = std::exchange(other.fd_, -1);
    epoll_fd_ = std::exchange(other.epoll_fd_, -1);
    registered_events_ = std::exchange(other.registered_events_, 0);
  }
  return *this;
}

bool StreamSocket::adopt(int fd, std::error_code& ec) {
  if (fd_ >= 0) {
    ec = std::make_error_code(std::errc::already_connected);
    ::close(fd);
    return false;
  }
  if (!set_nonblocking(fd, ec)) {
    ::close(fd);
    return false;
  }
  fd_ = fd;
  return true;
}

bool StreamSocket::connect_unix(const std::string& path, std::error_code& ec) {
  if (fd_ >= 0) {
    ec = std::make_error_code(std::errc::already_connected);
    return false;
  }

  sockaddr_un addr{};
  if (!fill_address(path, addr, ec)) {
    return false;
  }

  const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd == -1) {
    ec = last_error();
    return false;
  }

  // Connect while still blocking; Unix domain connects complete immediately
  // or fail, so there is no EINPROGRESS handling to do.
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
    ec = last_error();
    ::close(fd);
    LOG_WARN("Failed to connect to {}: {}", path, ec.message());
    return false;
  }

  if (!adopt(fd, ec)) {
    return false;
  }
  LOG_DEBUG("Connected to {} (fd {})", path, fd_);
  return true;
}

std::optional<std::pair<StreamSocket, StreamSocket>> StreamSocket::make_pair(std::error_code& ec) {
  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) == -1) {
    ec = last_error();
    return std::nullopt;
  }

  StreamSocket first;
  StreamSocket second;
  if (!first.adopt(fds[0], ec)) {
    ::close(fds[1]);
    return std::nullopt;
  }
  if (!second.adopt(fds[1], ec)) {
    return std::nullopt;
  }
  return std::make_pair(std::move(first), std::move(second));
}

IoResult StreamSocket::read_some(std::span<std::uint8_t> buffer, std::error_code& ec) {
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return {IoStatus::kError, 0};
  }

  while (true) {
    const ssize_t n = ::recv(fd_, buffer.data(), buffer.size(), 0);
    if (n > 0) {
      return {IoStatus::kReady, static_cast<std::size_t>(n)};
    }
    if (n == 0) {
      return {IoStatus::kEndOfStream, 0};
    }
    if (errno == EINTR) {
      continue;
    }
    if (would_block(errno)) {
      return {IoStatus::kWouldBlock, 0};
    }
    ec = last_error();
    return {IoStatus::kError, 0};
  }
}

IoResult StreamSocket::write_some(std::span<const std::uint8_t> data, std::error_code& ec) {
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return {IoStatus::kError, 0};
  }

  while (true) {
    const ssize_t n = ::send(fd_, data.data(), data.size(), MSG_NOSIGNAL);
    if (n >= 0) {
      return {IoStatus::kReady, static_cast<std::size_t>(n)};
    }
    if (errno == EINTR) {
      continue;
    }
    if (would_block(errno)) {
      return {IoStatus::kWouldBlock, 0};
    }
    ec = last_error();
    return {IoStatus::kError, 0};
  }
}

IoResult StreamSocket::flush(std::error_code& ec) {
  // send() hands bytes straight to the kernel; nothing is buffered here.
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return {IoStatus::kError, 0};
  }
  return {IoStatus::kReady, 0};
}

IoResult StreamSocket::shutdown_write(std::error_code& ec) {
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return {IoStatus::kError, 0};
  }
  if (::shutdown(fd_, SHUT_WR) == -1) {
    ec = last_error();
    return {IoStatus::kError, 0};
  }
  return {IoStatus::kReady, 0};
}

bool StreamSocket::ensure_epoll(std::error_code& ec) {
  if (epoll_fd_ >= 0) {
    return true;
  }

  epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
  if (epoll_fd_ < 0) {
    ec = last_error();
    return false;
  }

  epoll_event ev{};
  ev.events = 0;
  ev.data.fd = fd_;
  if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, fd_, &ev) != 0) {
    ec = last_error();
    ::close(epoll_fd_);
    epoll_fd_ = -1;
    return false;
  }
  registered_events_ = 0;
  return true;
}

void StreamSocket::close_epoll() {
  if (epoll_fd_ >= 0) {
    ::close(epoll_fd_);
    epoll_fd_ = -1;
  }
  registered_events_ = 0;
}

bool StreamSocket::wait(Interest interest, std::chrono::milliseconds timeout, std::error_code& ec) {
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return false;
  }
  if (!ensure_epoll(ec)) {
    return false;
  }

  const std::uint32_t wanted = interest == Interest::kRead ? EPOLLIN : EPOLLOUT;
  if (registered_events_ != wanted) {
    epoll_event ev{};
    ev.events = wanted;
    ev.data.fd = fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_MOD, fd_, &ev) != 0) {
      ec = last_error();
      return false;
    }
    registered_events_ = wanted;
  }

  // epoll_wait treats any negative timeout as infinite.
  const auto timeout_ms = static_cast<int>(std::clamp<std::chrono::milliseconds::rep>(
      timeout.count(), 0, std::numeric_limits<int>::max()));
  std::array<epoll_event, 1> events{};
  while (true) {
    const int n = epoll_wait(epoll_fd_, events.data(), static_cast<int>(events.size()),
                             timeout_ms);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ec = last_error();
      return false;
    }
    // Errors and hangups count as ready: the next read or write reports them.
    return n > 0;
  }
}

void StreamSocket::close() {
  // Close epoll FD first (it references the socket FD).
  close_epoll();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

// ============================================================================
// StreamListener
// ============================================================================

StreamListener::~StreamListener() { close(); }

bool StreamListener::listen(const std::string& path, std::error_code& ec) {
  if (fd_ >= 0) {
    ec = std::make_error_code(std::errc::already_connected);
    return false;
  }

  sockaddr_un addr{};
  if (!fill_address(path, addr, ec)) {
    return false;
  }

  fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd_ == -1) {
    ec = last_error();
    return false;
  }

  if (!set_nonblocking(fd_, ec)) {
    ::close(fd_);
    fd_ = -1;
    return false;
  }

  // Remove old socket file if exists
  ::unlink(path.c_str());

  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
    ec = last_error();
    ::close(fd_);
    fd_ = -1;
    return false;
  }

  if (::listen(fd_, kMaxPendingConnections) == -1) {
    ec = last_error();
    ::close(fd_);
    fd_ = -1;
    ::unlink(path.c_str());
    return false;
  }

  path_ = path;
  LOG_INFO("Listening on {}", path_);
  return true;
}

std::optional<StreamSocket> StreamListener::accept(std::error_code& ec) {
  if (fd_ < 0) {
    ec = std::make_error_code(std::errc::not_connected);
    return std::nullopt;
  }

  while (true) {
    const int client_fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client_fd >= 0) {
      StreamSocket socket;
      if (!socket.adopt(client_fd, ec)) {
        return std::nullopt;
      }
      LOG_DEBUG("Accepted connection on {} (fd {})", path_, client_fd);
      return socket;
    }
    if (errno == EINTR) {
      continue;
    }
    if (would_block(errno)) {
      return std::nullopt;
    }
    ec = last_error();
    return std::nullopt;
  }
}

void StreamListener::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  if (!path_.empty()) {
    ::unlink(path_.c_str());
    path_.clear();
  }
}

}  // namespace chunkio::transport
