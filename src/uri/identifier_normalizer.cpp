#include "wfnorm/uri/identifier_normalizer.h"

#include "wfnorm/core/log.h"
#include "wfnorm/core/text.h"

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <system_error>
#include <utility>

namespace wfnorm::uri {

namespace {

// Capture group indices in the identifier grammar.
constexpr std::size_t kSchemeGroup = 2;
constexpr std::size_t kUserInfoGroup = 6;
constexpr std::size_t kHostGroup = 8;
constexpr std::size_t kPortGroup = 10;
constexpr std::size_t kPathGroup = 11;
constexpr std::size_t kQueryGroup = 13;

constexpr std::uint32_t kMaxPort = std::numeric_limits<std::uint16_t>::max();

std::string build_identifier_pattern() {
  std::string schemes;
  for (const Scheme scheme : kRecognizedSchemes) {
    if (!schemes.empty()) {
      schemes += '|';
    }
    schemes += scheme_to_string(scheme);
  }

  return "^"
         "((" + schemes + "):(//)?)?"  // scheme
         "("
         "(([^@]+)@)?"      // userinfo
         "(([^?#:/]+)"      // host
         "(:(\\d*))?)"      // port
         ")"
         "([^?#]+)?"        // path
         "(\\?([^#]+))?"    // query
         "(#(.*))?"         // fragment, matched but never kept
         "$";
}

const std::regex& identifier_grammar() {
  static const std::regex grammar(build_identifier_pattern(), std::regex::ECMAScript);
  return grammar;
}

std::optional<std::string> capture(const std::smatch& match, std::size_t group) {
  if (!match[group].matched) {
    return std::nullopt;
  }
  return match[group].str();
}

enum class PortParse {
  kAbsent,
  kValid,
  kOutOfRange,
};

// Digits-only capture: empty means no port; anything above kMaxPort (or too
// long for uint32) is out of range.
PortParse parse_port(const std::optional<std::string>& digits, std::uint16_t& port) {
  if (!digits.has_value() || digits->empty()) {
    return PortParse::kAbsent;
  }

  std::uint32_t value = 0;
  const char* first = digits->data();
  const char* last = first + digits->size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last || value > kMaxPort) {
    return PortParse::kOutOfRange;
  }

  port = static_cast<std::uint16_t>(value);
  return PortParse::kValid;
}

// Scheme inference, evaluated in order:
//   1. bare "user@host" (no path, query or port) is an account identifier
//   2. everything else is a web resource
std::string infer_scheme(const UriComponents& parts) {
  if (core::optional_has_text(parts.user_info) && !core::optional_has_text(parts.path) &&
      !core::optional_has_text(parts.query) && !parts.port.has_value()) {
    return scheme_to_string(Scheme::kAcct);
  }
  return scheme_to_string(Scheme::kHttps);
}

}  // namespace

core::Result<StructuredUri, core::NormalizeError> normalize_resource(std::string_view identifier) {
  using Outcome = core::Result<StructuredUri, core::NormalizeError>;

  if (core::is_blank(identifier)) {
    core::logger()->warn("Can't normalize null or empty URI: '{}'", identifier);
    return Outcome::err(core::NormalizeError::kBlankInput);
  }

  if (identifier.size() > kMaxIdentifierLength) {
    core::logger()->warn("Identifier too long to normalize: {} bytes (limit {})",
                         identifier.size(), kMaxIdentifierLength);
    return Outcome::err(core::NormalizeError::kTooLong);
  }

  const std::string input{identifier};
  std::smatch match;
  if (!std::regex_match(input, match, identifier_grammar())) {
    core::logger()->warn("Parser couldn't match input: '{}'", input);
    return Outcome::err(core::NormalizeError::kGrammarMismatch);
  }

  UriComponents parts;
  parts.scheme = capture(match, kSchemeGroup);
  parts.user_info = capture(match, kUserInfoGroup);
  parts.host = capture(match, kHostGroup);
  parts.path = capture(match, kPathGroup);
  parts.query = capture(match, kQueryGroup);

  std::uint16_t port = 0;
  const auto port_digits = capture(match, kPortGroup);
  switch (parse_port(port_digits, port)) {
    case PortParse::kAbsent:
      break;
    case PortParse::kValid:
      parts.port = port;
      break;
    case PortParse::kOutOfRange:
      core::logger()->warn("Port '{}' out of range in input: '{}'", port_digits.value_or(""),
                           input);
      return Outcome::err(core::NormalizeError::kPortOutOfRange);
  }

  if (!core::optional_has_text(parts.scheme)) {
    parts.scheme = infer_scheme(parts);
    core::logger()->debug("Inferred scheme '{}' for input: '{}'", parts.scheme.value(), input);
  }

  // The fragment group is never copied: a normalized identifier carries no fragment.
  return Outcome::ok(StructuredUri{std::move(parts)});
}

}  // namespace wfnorm::uri
