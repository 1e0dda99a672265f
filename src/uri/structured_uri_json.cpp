#include "wfnorm/uri/structured_uri_json.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>

namespace wfnorm::uri {

namespace {

void put_if_present(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
  if (value.has_value()) {
    j[key] = value.value();
  }
}

// Returns false when the key exists but does not hold a string.
bool read_string(const nlohmann::json& j, const char* key, std::optional<std::string>& out) {
  if (!j.contains(key) || j[key].is_null()) {
    return true;
  }
  if (!j[key].is_string()) {
    return false;
  }
  out = j[key].get<std::string>();
  return true;
}

}  // namespace

nlohmann::json structured_uri_to_json(const StructuredUri& uri) {
  nlohmann::json j = nlohmann::json::object();

  put_if_present(j, "scheme", uri.scheme());
  put_if_present(j, "user_info", uri.user_info());
  put_if_present(j, "host", uri.host());
  if (uri.port().has_value()) {
    j["port"] = uri.port().value();
  }
  put_if_present(j, "path", uri.path());
  put_if_present(j, "query", uri.query());
  put_if_present(j, "fragment", uri.fragment());

  return j;
}

core::Result<StructuredUri, core::ParseError> structured_uri_from_json(const nlohmann::json& j) {
  using Outcome = core::Result<StructuredUri, core::ParseError>;

  if (!j.is_object()) {
    return Outcome::err(core::ParseError::kInvalidFormat);
  }

  UriComponents parts;
  if (!read_string(j, "scheme", parts.scheme) || !read_string(j, "user_info", parts.user_info) ||
      !read_string(j, "host", parts.host) || !read_string(j, "path", parts.path) ||
      !read_string(j, "query", parts.query) || !read_string(j, "fragment", parts.fragment)) {
    return Outcome::err(core::ParseError::kInvalidFormat);
  }

  if (j.contains("port") && !j["port"].is_null()) {
    const auto& port_json = j["port"];
    if (!port_json.is_number_integer()) {
      return Outcome::err(core::ParseError::kInvalidFormat);
    }
    const auto port = port_json.get<std::int64_t>();
    if (port < 0 || port > std::numeric_limits<std::uint16_t>::max()) {
      return Outcome::err(core::ParseError::kInvalidFormat);
    }
    parts.port = static_cast<std::uint16_t>(port);
  }

  return Outcome::ok(StructuredUri{std::move(parts)});
}

std::string structured_uri_to_json_string(const StructuredUri& uri) {
  // Compact; invalid UTF-8 in a component is replaced with U+FFFD.
  return structured_uri_to_json(uri).dump(-1, ' ', false,
                                          nlohmann::json::error_handler_t::replace);
}

}  // namespace wfnorm::uri
