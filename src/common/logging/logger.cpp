#include "common/logging/logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace chunkio::logging {

namespace {
constexpr const char* kLoggerName = "chunkio";

std::mutex& logger_mutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
  static std::shared_ptr<spdlog::logger> instance;
  return instance;
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace:
      return spdlog::level::trace;
    case LogLevel::kDebug:
      return spdlog::level::debug;
    case LogLevel::kInfo:
      return spdlog::level::info;
    case LogLevel::kWarn:
      return spdlog::level::warn;
    case LogLevel::kError:
      return spdlog::level::err;
    case LogLevel::kOff:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}
}  // namespace

bool configure(LogLevel level, const std::string& log_file, std::error_code& ec) {
  ec.clear();
  std::string file_error;
  {
    std::lock_guard<std::mutex> lock(logger_mutex());

    spdlog::drop(kLoggerName);
    std::shared_ptr<spdlog::logger> created;
    if (!log_file.empty()) {
      try {
        created = spdlog::basic_logger_mt(kLoggerName, log_file);
      } catch (const spdlog::spdlog_ex& e) {
        file_error = e.what();
        spdlog::drop(kLoggerName);
      }
    }
    if (!created) {
      created = spdlog::stderr_color_mt(kLoggerName);
    }
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    created->set_level(to_spdlog(level));
    logger_slot() = std::move(created);
  }

  if (!file_error.empty()) {
    LOG_ERROR("Cannot open log file '{}', logging to stderr: {}", log_file, file_error);
    ec = std::make_error_code(std::errc::io_error);
    return false;
  }
  return true;
}

std::shared_ptr<spdlog::logger> logger() {
  std::lock_guard<std::mutex> lock(logger_mutex());
  auto& slot = logger_slot();
  if (!slot) {
    slot = spdlog::get(kLoggerName);
    if (!slot) {
      slot = spdlog::stderr_color_mt(kLoggerName);
      slot->set_level(spdlog::level::info);
    }
  }
  return slot;
}

bool parse_level(const std::string& text, LogLevel& level) {
  if (text == "trace") {
    level = LogLevel::kTrace;
  } else if (text == "debug") {
    level = LogLevel::kDebug;
  } else if (text == "info") {
    level = LogLevel::kInfo;
  } else if (text == "warn") {
    level = LogLevel::kWarn;
  } else if (text == "error") {
    level = LogLevel::kError;
  } else if (text == "off") {
    level = LogLevel::kOff;
  } else {
    return false;
  }
  return true;
}

}  // namespace chunkio::logging
