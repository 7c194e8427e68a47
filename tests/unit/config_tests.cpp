#include <gtest/gtest.h>

#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <system_error>

#include "common/config/config.h"
#include "common/logging/logger.h"

namespace chunkio::tests {

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = "/tmp/chunkio_config_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name() + ".ini";
  }

  void TearDown() override { std::remove(path_.c_str()); }

  void write_file(const std::string& contents) {
    std::ofstream out(path_);
    out << contents;
  }

  std::string path_;
};

TEST(ConfigParseTests, ParsesKeyValueWithBlanks) {
  std::string key;
  std::string value;
  ASSERT_TRUE(config::parse_ini_value("  read_chunk_size \t=  4096 ", key, value));
  EXPECT_EQ(key, "read_chunk_size");
  EXPECT_EQ(value, "4096");
}

TEST(ConfigParseTests, SkipsCommentsAndSections) {
  std::string key;
  std::string value;
  EXPECT_FALSE(config::parse_ini_value("# comment", key, value));
  EXPECT_FALSE(config::parse_ini_value("; comment", key, value));
  EXPECT_FALSE(config::parse_ini_value("[channel]", key, value));
  EXPECT_FALSE(config::parse_ini_value("no equals sign", key, value));
  EXPECT_FALSE(config::parse_ini_value("", key, value));
  EXPECT_EQ(config::get_current_section("[logging]"), "logging");
  EXPECT_EQ(config::get_current_section("key = value"), "");
}

TEST_F(ConfigFileTest, LoadsChannelAndLoggingSections) {
  write_file(
      "# chunkio settings\n"
      "[channel]\n"
      "read_chunk_size = 4096\n"
      "backpressure_threshold = 65536\n"
      "max_chunk_length = 1048576\n"
      "io_timeout_ms = 250\n"
      "\n"
      "[logging]\n"
      "level = debug\n"
      "file = /tmp/chunkio.log\n");

  config::Config cfg;
  std::error_code ec;
  ASSERT_TRUE(config::load_config_file(path_, cfg, ec)) << ec.message();
  EXPECT_EQ(cfg.channel.read_chunk_size, 4096U);
  EXPECT_EQ(cfg.channel.backpressure_threshold, 65536U);
  EXPECT_EQ(cfg.channel.max_chunk_length, 1048576U);
  EXPECT_EQ(cfg.channel.io_timeout.count(), 250);
  EXPECT_EQ(cfg.logging.level, logging::LogLevel::kDebug);
  EXPECT_EQ(cfg.logging.file, "/tmp/chunkio.log");
}

TEST_F(ConfigFileTest, KeepsDefaultsForMissingKeys) {
  write_file("[channel]\nmax_chunk_length = 10\nunknown_key = 1\n");

  config::Config cfg;
  std::error_code ec;
  ASSERT_TRUE(config::load_config_file(path_, cfg, ec)) << ec.message();
  EXPECT_EQ(cfg.channel.max_chunk_length, 10U);
  EXPECT_EQ(cfg.channel.read_chunk_size, config::ChannelConfig{}.read_chunk_size);
  EXPECT_EQ(cfg.logging.level, logging::LogLevel::kInfo);
}

TEST_F(ConfigFileTest, RejectsNegativeNumber) {
  write_file("[channel]\nread_chunk_size = -1\n");
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file(path_, cfg, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(ConfigFileTest, RejectsTrailingGarbage) {
  write_file("[channel]\nbackpressure_threshold = 12kb\n");
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file(path_, cfg, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(ConfigFileTest, RejectsOutOfRangeTimeout) {
  write_file("[channel]\nio_timeout_ms = 99999999999\n");
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file(path_, cfg, ec));
  EXPECT_EQ(ec, std::errc::result_out_of_range);
}

TEST_F(ConfigFileTest, RejectsTimeoutBeyondEpollRange) {
  write_file("[channel]\nio_timeout_ms = 2147483648\n");
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file(path_, cfg, ec));
  EXPECT_EQ(ec, std::errc::result_out_of_range);

  write_file("[channel]\nio_timeout_ms = 2147483647\n");
  ec.clear();
  EXPECT_TRUE(config::load_config_file(path_, cfg, ec)) << ec.message();
  EXPECT_EQ(cfg.channel.io_timeout.count(), 2147483647);
}

TEST_F(ConfigFileTest, RejectsZeroBackpressureThreshold) {
  write_file("[channel]\nbackpressure_threshold = 0\n");
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file(path_, cfg, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(ConfigFileTest, RejectsZeroReadChunkSize) {
  write_file("[channel]\nread_chunk_size = 0\n");
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file(path_, cfg, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST_F(ConfigFileTest, RejectsUnknownLogLevel) {
  write_file("[logging]\nlevel = chatty\n");
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file(path_, cfg, ec));
  EXPECT_EQ(ec, std::errc::invalid_argument);
}

TEST(ConfigLoadTests, MissingFileFails) {
  config::Config cfg;
  std::error_code ec;
  EXPECT_FALSE(config::load_config_file("/nonexistent/chunkio.ini", cfg, ec));
  EXPECT_TRUE(ec);
}

TEST(LoggingTests, ParsesLevels) {
  logging::LogLevel level{};
  EXPECT_TRUE(logging::parse_level("warn", level));
  EXPECT_EQ(level, logging::LogLevel::kWarn);
  EXPECT_TRUE(logging::parse_level("off", level));
  EXPECT_EQ(level, logging::LogLevel::kOff);
  EXPECT_FALSE(logging::parse_level("WARN", level));
}

TEST(LoggingTests, LogMacrosCompile) {
  std::error_code ec;
  ASSERT_TRUE(config::apply_logging({logging::LogLevel::kDebug, ""}, ec)) << ec.message();
  LOG_DEBUG("test debug message: {}", 42);
  LOG_INFO("test info message: {}", "hello");
  LOG_WARN("test warn message: {}", 3.14);
  EXPECT_NE(logging::logger(), nullptr);
  SUCCEED();
}

TEST(LoggingTests, UnopenableLogFileFallsBackToStderr) {
  std::error_code ec;
  // The parent is a character device, so neither mkdir nor fopen can succeed.
  EXPECT_FALSE(config::apply_logging({logging::LogLevel::kInfo, "/dev/null/chunkio.log"}, ec));
  EXPECT_EQ(ec, std::errc::io_error);
  ASSERT_NE(logging::logger(), nullptr);
  LOG_INFO("still logging after fallback");

  ASSERT_TRUE(config::apply_logging({logging::LogLevel::kInfo, ""}, ec)) << ec.message();
  EXPECT_FALSE(ec);
}

}  // namespace chunkio::tests
