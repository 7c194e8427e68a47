#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <system_error>

namespace chunkio::logging {

enum class LogLevel { kTrace, kDebug, kInfo, kWarn, kError, kOff };

// Installs the process-wide "chunkio" logger. An empty log_file logs to stderr.
// Safe to call more than once; the last call wins. When log_file cannot be
// opened the logger falls back to stderr and ec is set to std::errc::io_error.
bool configure(LogLevel level, const std::string& log_file, std::error_code& ec);

// Returns the chunkio logger, creating a stderr logger on first use.
std::shared_ptr<spdlog::logger> logger();

// Parses "trace", "debug", "info", "warn", "error" or "off".
bool parse_level(const std::string& text, LogLevel& level);

}  // namespace chunkio::logging

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::chunkio::logging::logger(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::chunkio::logging::logger(), __VA_ARGS__)
#define LOG_INFO(...) SPDLOG_LOGGER_INFO(::chunkio::logging::logger(), __VA_ARGS__)
#define LOG_WARN(...) SPDLOG_LOGGER_WARN(::chunkio::logging::logger(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::chunkio::logging::logger(), __VA_ARGS__)
