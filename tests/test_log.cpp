#include "wfnorm/core/log.h"
#include "wfnorm/uri/identifier_normalizer.h"

#include <catch2/catch_test_macros.hpp>

#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <string>

using namespace wfnorm;

namespace {

// Captures everything the library logger writes while in scope.
class LogCapture {
 public:
  LogCapture() : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)) {
    sink_->set_pattern("%l %v");
    core::logger()->sinks().push_back(sink_);
    core::set_log_level(core::LogLevel::kDebug);
  }
  ~LogCapture() {
    auto& sinks = core::logger()->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
    core::set_log_level(core::LogLevel::kInfo);
  }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;
  LogCapture(LogCapture&&) = delete;
  LogCapture& operator=(LogCapture&&) = delete;

  [[nodiscard]] std::string text() const { return stream_.str(); }

 private:
  std::ostringstream stream_;
  std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

}  // namespace

TEST_CASE("parse_log_level accepts known names only", "[core][log]") {
  CHECK(core::parse_log_level("warn") == core::LogLevel::kWarn);
  CHECK(core::parse_log_level("off") == core::LogLevel::kOff);
  CHECK_FALSE(core::parse_log_level("WARN").has_value());
  CHECK_FALSE(core::parse_log_level("verbose").has_value());
  for (const auto level : {core::LogLevel::kTrace, core::LogLevel::kDebug, core::LogLevel::kInfo,
                           core::LogLevel::kWarn, core::LogLevel::kError, core::LogLevel::kOff}) {
    CHECK(core::parse_log_level(core::log_level_to_string(level)) == level);
  }
}

TEST_CASE("logger is a single shared instance", "[core][log]") {
  CHECK(core::logger() == core::logger());
  CHECK(core::logger()->name() == core::kLoggerName);
}

TEST_CASE("rejected input is logged at warn level with the input", "[core][log]") {
  const LogCapture capture;
  const auto result = uri::normalize_resource("/no-host");
  REQUIRE_FALSE(result.has_value());

  const std::string text = capture.text();
  CHECK(text.find("warning") != std::string::npos);
  CHECK(text.find("/no-host") != std::string::npos);
}

TEST_CASE("scheme inference is logged at debug level", "[core][log]") {
  const LogCapture capture;
  const auto result = uri::normalize_resource("bob@example.com");
  REQUIRE(result.has_value());
  CHECK(capture.text().find("acct") != std::string::npos);
}
