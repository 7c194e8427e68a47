#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "transport/stream_socket/stream_socket.h"

namespace chunkio::tests {

using namespace std::chrono_literals;

TEST(StreamSocketTests, PairExchangesBytes) {
  std::error_code ec;
  auto pair = transport::StreamSocket::make_pair(ec);
  ASSERT_TRUE(pair.has_value()) << ec.message();
  auto& [left, right] = *pair;

  std::vector<std::uint8_t> payload{1, 2, 3, 4};
  auto written = left.write_some(payload, ec);
  ASSERT_EQ(written.status, transport::IoStatus::kReady) << ec.message();
  EXPECT_EQ(written.bytes, payload.size());

  ASSERT_TRUE(right.wait(transport::Interest::kRead, 1000ms, ec)) << ec.message();
  std::vector<std::uint8_t> buffer(16);
  auto read = right.read_some(buffer, ec);
  ASSERT_EQ(read.status, transport::IoStatus::kReady);
  buffer.resize(read.bytes);
  EXPECT_EQ(buffer, payload);
}

TEST(StreamSocketTests, EmptySocketWouldBlock) {
  std::error_code ec;
  auto pair = transport::StreamSocket::make_pair(ec);
  ASSERT_TRUE(pair.has_value()) << ec.message();

  std::vector<std::uint8_t> buffer(16);
  auto read = pair->first.read_some(buffer, ec);
  EXPECT_EQ(read.status, transport::IoStatus::kWouldBlock);
  EXPECT_FALSE(ec);
  EXPECT_FALSE(pair->first.wait(transport::Interest::kRead, 10ms, ec));
  EXPECT_FALSE(ec);
  EXPECT_TRUE(pair->first.wait(transport::Interest::kWrite, 10ms, ec));
}

TEST(StreamSocketTests, WaitClampsTimeoutsOutsideEpollRange) {
  std::error_code ec;
  auto pair = transport::StreamSocket::make_pair(ec);
  ASSERT_TRUE(pair.has_value()) << ec.message();

  // A negative timeout is a zero-length poll, not an infinite wait.
  EXPECT_FALSE(pair->first.wait(transport::Interest::kRead, -1ms, ec));
  EXPECT_FALSE(ec);

  std::vector<std::uint8_t> payload{7};
  ASSERT_EQ(pair->second.write_some(payload, ec).status, transport::IoStatus::kReady);
  EXPECT_TRUE(pair->first.wait(transport::Interest::kRead,
                               std::chrono::milliseconds(0xFFFFFFFFLL), ec))
      << ec.message();
}

TEST(StreamSocketTests, ShutdownWriteSignalsEndOfStream) {
  std::error_code ec;
  auto pair = transport::StreamSocket::make_pair(ec);
  ASSERT_TRUE(pair.has_value()) << ec.message();

  ASSERT_EQ(pair->first.shutdown_write(ec).status, transport::IoStatus::kReady);
  ASSERT_TRUE(pair->second.wait(transport::Interest::kRead, 1000ms, ec));
  std::vector<std::uint8_t> buffer(16);
  EXPECT_EQ(pair->second.read_some(buffer, ec).status, transport::IoStatus::kEndOfStream);
}

TEST(StreamSocketTests, WriteToClosedPeerFails) {
  std::error_code ec;
  auto pair = transport::StreamSocket::make_pair(ec);
  ASSERT_TRUE(pair.has_value()) << ec.message();
  pair->second.close();

  std::vector<std::uint8_t> payload{1};
  auto result = pair->first.write_some(payload, ec);
  EXPECT_EQ(result.status, transport::IoStatus::kError);
  EXPECT_EQ(ec, std::errc::broken_pipe);
}

TEST(StreamSocketTests, ClosedSocketReportsNotConnected) {
  transport::StreamSocket socket;
  std::error_code ec;
  std::vector<std::uint8_t> buffer(4);
  EXPECT_EQ(socket.read_some(buffer, ec).status, transport::IoStatus::kError);
  EXPECT_EQ(ec, std::errc::not_connected);
  EXPECT_FALSE(socket.is_open());
}

TEST(StreamSocketTests, MoveTransfersOwnership) {
  std::error_code ec;
  auto pair = transport::StreamSocket::make_pair(ec);
  ASSERT_TRUE(pair.has_value()) << ec.message();
  const int fd = pair->first.fd();

  transport::StreamSocket moved(std::move(pair->first));
  EXPECT_EQ(moved.fd(), fd);
  EXPECT_FALSE(pair->first.is_open());
}

TEST(StreamSocketTests, ListenerAcceptsUnixConnection) {
  const std::string path = "/tmp/chunkio_listener_" + std::to_string(::getpid()) + ".sock";
  transport::StreamListener listener;
  std::error_code ec;
  if (!listener.listen(path, ec)) {
    if (ec == std::errc::operation_not_permitted || ec == std::errc::permission_denied) {
      GTEST_SKIP() << "Unix sockets not permitted in this environment";
    }
    FAIL() << ec.message();
  }

  auto none = listener.accept(ec);
  EXPECT_FALSE(none.has_value());
  EXPECT_FALSE(ec);

  transport::StreamSocket client;
  ASSERT_TRUE(client.connect_unix(path, ec)) << ec.message();

  std::optional<transport::StreamSocket> server;
  for (int attempt = 0; attempt < 100 && !server; ++attempt) {
    server = listener.accept(ec);
    ASSERT_FALSE(ec) << ec.message();
  }
  ASSERT_TRUE(server.has_value());

  std::vector<std::uint8_t> payload{9, 8, 7};
  ASSERT_EQ(client.write_some(payload, ec).status, transport::IoStatus::kReady);
  ASSERT_TRUE(server->wait(transport::Interest::kRead, 1000ms, ec));
  std::vector<std::uint8_t> buffer(8);
  auto read = server->read_some(buffer, ec);
  ASSERT_EQ(read.status, transport::IoStatus::kReady);
  buffer.resize(read.bytes);
  EXPECT_EQ(buffer, payload);

  listener.close();
}

TEST(StreamSocketTests, ConnectToMissingPathFails) {
  transport::StreamSocket client;
  std::error_code ec;
  EXPECT_FALSE(client.connect_unix("/tmp/chunkio_missing_socket_path.sock", ec));
  EXPECT_TRUE(ec);
  EXPECT_FALSE(client.is_open());
}

TEST(StreamSocketTests, RejectsOverlongPath) {
  transport::StreamSocket client;
  std::error_code ec;
  EXPECT_FALSE(client.connect_unix(std::string(200, 'x'), ec));
  EXPECT_EQ(ec, std::errc::filename_too_long);
}

}  // namespace chunkio::tests
