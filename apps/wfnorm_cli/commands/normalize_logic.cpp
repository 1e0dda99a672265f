#include "normalize_logic.h"

#include "wfnorm/core/text.h"
#include "wfnorm/uri/identifier_normalizer.h"
#include "wfnorm/uri/structured_uri_json.h"
#include "wfnorm/uri/uri_serializer.h"

#include <nlohmann/json.hpp>

#include <string>

namespace {

// Identifiers are raw user bytes; invalid UTF-8 is printed as U+FFFD instead of throwing.
std::string dump_json(const nlohmann::json& j, int indent = -1) {
  return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

nlohmann::json to_output_json(const wfnorm::uri::StructuredUri& uri) {
  nlohmann::json j = wfnorm::uri::structured_uri_to_json(uri);
  j["uri"] = wfnorm::uri::serialize_uri(uri);
  return j;
}

}  // namespace

int execute_normalize(const std::string& identifier, bool json, std::ostream& out,
                      std::ostream& err) {
  const auto result = wfnorm::uri::normalize_resource(identifier);
  if (!result.has_value()) {
    err << "Cannot normalize '" << identifier
        << "': " << wfnorm::core::normalize_error_to_string(result.error()) << "\n";
    return 1;
  }

  if (json) {
    out << dump_json(to_output_json(result.value()), 2) << "\n";
  } else {
    out << wfnorm::uri::serialize_uri(result.value()) << "\n";
  }
  return 0;
}

int execute_normalize_stream(std::istream& in, bool json, std::ostream& out) {
  int status = 0;
  std::string line;

  while (std::getline(in, line)) {
    const std::string identifier = wfnorm::core::trim(line);
    if (identifier.empty()) {
      continue;
    }

    const auto result = wfnorm::uri::normalize_resource(identifier);
    if (!result.has_value()) {
      status = 1;
      const std::string reason = wfnorm::core::normalize_error_to_string(result.error());
      if (json) {
        nlohmann::json rejected;
        rejected["error"] = reason;
        rejected["input"] = identifier;
        out << dump_json(rejected) << "\n";
      } else {
        out << "!" << reason << " " << identifier << "\n";
      }
      continue;
    }

    if (json) {
      out << dump_json(to_output_json(result.value())) << "\n";
    } else {
      out << wfnorm::uri::serialize_uri(result.value()) << "\n";
    }
  }

  return status;
}
