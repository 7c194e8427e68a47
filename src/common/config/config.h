#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>

#include "common/logging/logger.h"

namespace chunkio::config {

// Tuning for a ChunkChannel.
struct ChannelConfig {
  // Bytes requested from the transport per read.
  std::size_t read_chunk_size{8192};
  // Write buffer size at which send() drains first and may report backpressure.
  std::size_t backpressure_threshold{128 * 1024};
  // Largest accepted chunk payload; 0 accepts any length.
  std::uint64_t max_chunk_length{0};
  // Default wait for the blocking helpers.
  std::chrono::milliseconds io_timeout{5000};
};

struct LoggingConfig {
  logging::LogLevel level{logging::LogLevel::kInfo};
  std::string file;  // Empty logs to stderr.
};

struct Config {
  ChannelConfig channel;
  LoggingConfig logging;
};

// Splits "key = value", trimming blanks. Returns false for blank lines,
// comments ('#' or ';'), section headers and lines without '='.
bool parse_ini_value(const std::string& line, std::string& key, std::string& value);

// Returns the section name for a "[name]" line, or an empty string.
std::string get_current_section(const std::string& line);

// Loads [channel] and [logging] settings from an INI file over the values
// already in config. Unknown keys are logged and skipped.
bool load_config_file(const std::string& path, Config& config, std::error_code& ec);

// Applies config.logging to the process logger. Returns false (and keeps a
// stderr logger) when the log file cannot be opened.
bool apply_logging(const LoggingConfig& config, std::error_code& ec);

}  // namespace chunkio::config
