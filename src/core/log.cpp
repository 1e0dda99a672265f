#include "wfnorm/core/log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace wfnorm::core {

namespace {

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
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

std::shared_ptr<spdlog::logger> logger() {
  // Function-local static: initialization is thread-safe (C++11 magic statics).
  static const std::shared_ptr<spdlog::logger> instance = [] {
    if (auto existing = spdlog::get(kLoggerName)) {
      return existing;
    }
    return spdlog::stderr_color_mt(kLoggerName);
  }();
  return instance;
}

std::optional<LogLevel> parse_log_level(const std::string& value) {
  if (value == "trace") {
    return LogLevel::kTrace;
  }
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "info") {
    return LogLevel::kInfo;
  }
  if (value == "warn") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  if (value == "off") {
    return LogLevel::kOff;
  }
  return std::nullopt;
}

std::string log_level_to_string(LogLevel level) {
  switch (level) {
    case LogLevel::kTrace:
      return "trace";
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
    case LogLevel::kOff:
      return "off";
  }
  return "info";
}

void set_log_level(LogLevel level) {
  logger()->set_level(to_spdlog_level(level));
}

}  // namespace wfnorm::core
