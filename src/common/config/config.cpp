#include "common/config/config.h"

#include <cerrno>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>

#include "common/logging/logger.h"

namespace chunkio::config {

namespace {
template <typename T>
bool safe_parse_unsigned(const std::string& value, T& out, const std::string& field_name,
                         std::error_code& ec) {
  if (value.empty() || value[0] == '-') {
    LOG_ERROR("Configuration error: {} value '{}' must be a non-negative number", field_name,
              value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  try {
    std::size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
    if (parsed > static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
      LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
      ec = std::make_error_code(std::errc::result_out_of_range);
      return false;
    }
    out = static_cast<T>(parsed);
    return true;
  } catch (const std::invalid_argument&) {
    LOG_ERROR("Configuration error: {} value '{}' is not a valid number", field_name, value);
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  } catch (const std::out_of_range&) {
    LOG_ERROR("Configuration error: {} value '{}' is out of range", field_name, value);
    ec = std::make_error_code(std::errc::result_out_of_range);
    return false;
  }
}

bool apply_channel_key(const std::string& key, const std::string& value, ChannelConfig& channel,
                       std::error_code& ec) {
  if (key == "read_chunk_size") {
    if (!safe_parse_unsigned(value, channel.read_chunk_size, key, ec)) {
      return false;
    }
    if (channel.read_chunk_size == 0) {
      LOG_ERROR("Configuration error: read_chunk_size must be positive");
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
  } else if (key == "backpressure_threshold") {
    if (!safe_parse_unsigned(value, channel.backpressure_threshold, key, ec)) {
      return false;
    }
    if (channel.backpressure_threshold == 0) {
      LOG_ERROR("Configuration error: backpressure_threshold must be positive");
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
  } else if (key == "max_chunk_length") {
    return safe_parse_unsigned(value, channel.max_chunk_length, key, ec);
  } else if (key == "io_timeout_ms") {
    // Capped at INT_MAX: epoll_wait takes an int timeout.
    std::int32_t timeout_ms = 0;
    if (!safe_parse_unsigned(value, timeout_ms, key, ec)) {
      return false;
    }
    channel.io_timeout = std::chrono::milliseconds(timeout_ms);
  } else {
    LOG_WARN("Unknown [channel] key '{}' ignored", key);
  }
  return true;
}

bool apply_logging_key(const std::string& key, const std::string& value, LoggingConfig& out,
                       std::error_code& ec) {
  if (key == "level") {
    if (!logging::parse_level(value, out.level)) {
      LOG_ERROR("Configuration error: unknown log level '{}'", value);
      ec = std::make_error_code(std::errc::invalid_argument);
      return false;
    }
  } else if (key == "file") {
    out.file = value;
  } else {
    LOG_WARN("Unknown [logging] key '{}' ignored", key);
  }
  return true;
}
}  // namespace

bool parse_ini_value(const std::string& line, std::string& key, std::string& value) {
  if (line.empty() || line[0] == '#' || line[0] == ';') {
    return false;
  }
  if (line[0] == '[') {
    return false;
  }

  auto pos = line.find('=');
  if (pos == std::string::npos) {
    return false;
  }

  key = line.substr(0, pos);
  value = line.substr(pos + 1);

  while (!key.empty() && (key.back() == ' ' || key.back() == '\t')) {
    key.pop_back();
  }
  while (!key.empty() && (key.front() == ' ' || key.front() == '\t')) {
    key.erase(0, 1);
  }
  while (!value.empty() &&
         (value.back() == ' ' || value.back() == '\t' || value.back() == '\r')) {
    value.pop_back();
  }
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
    value.erase(0, 1);
  }

  return !key.empty();
}

std::string get_current_section(const std::string& line) {
  if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
    return line.substr(1, line.size() - 2);
  }
  return "";
}

bool load_config_file(const std::string& path, Config& config, std::error_code& ec) {
  std::ifstream file(path);
  if (!file) {
    ec = std::error_code(errno, std::generic_category());
    LOG_ERROR("Failed to open config file: {}", path);
    return false;
  }

  std::string line;
  std::string section;

  while (std::getline(file, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::string new_section = get_current_section(line);
    if (!new_section.empty()) {
      section = new_section;
      continue;
    }

    std::string key;
    std::string value;
    if (!parse_ini_value(line, key, value)) {
      continue;
    }

    if (section == "channel") {
      if (!apply_channel_key(key, value, config.channel, ec)) {
        return false;
      }
    } else if (section == "logging") {
      if (!apply_logging_key(key, value, config.logging, ec)) {
        return false;
      }
    } else {
      LOG_WARN("Key '{}' outside a known section ignored", key);
    }
  }

  return true;
}

bool apply_logging(const LoggingConfig& config, std::error_code& ec) {
  return logging::configure(config.level, config.file, ec);
}

}  // namespace chunkio::config
