#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace wfnorm::core {

// Name under which the library logger is registered with spdlog.
constexpr const char* kLoggerName = "wfnorm";

enum class LogLevel {
  kTrace,
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

// logger returns the shared library logger (stderr sink).
// Created on first use; safe to call concurrently. If the host application
// already registered a logger named kLoggerName, that one is reused.
[[nodiscard]] std::shared_ptr<spdlog::logger> logger();

// parse_log_level accepts "trace", "debug", "info", "warn", "error", "off".
// Returns nullopt for anything else.
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string& value);

[[nodiscard]] std::string log_level_to_string(LogLevel level);

void set_log_level(LogLevel level);

}  // namespace wfnorm::core
