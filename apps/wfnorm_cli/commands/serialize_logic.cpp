#include "serialize_logic.h"

#include "wfnorm/uri/structured_uri_json.h"
#include "wfnorm/uri/uri_serializer.h"

#include <nlohmann/json.hpp>

int execute_serialize(const std::string& json_text, std::ostream& out, std::ostream& err) {
  const auto parsed = nlohmann::json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    err << "Invalid JSON input\n";
    return 1;
  }

  const auto uri = wfnorm::uri::structured_uri_from_json(parsed);
  if (!uri.has_value()) {
    err << "Invalid URI object: " << wfnorm::core::parse_error_to_string(uri.error()) << "\n";
    return 1;
  }

  out << wfnorm::uri::serialize_uri(uri.value()) << "\n";
  return 0;
}
