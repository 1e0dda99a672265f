#pragma once

#include "wfnorm/core/result.h"
#include "wfnorm/uri/structured_uri.h"

#include <nlohmann/json.hpp>

#include <string>

namespace wfnorm::uri {

/// Serialize StructuredUri to JSON. Absent components are omitted.
/// Keys: scheme, user_info, host, port, path, query, fragment
[[nodiscard]] nlohmann::json structured_uri_to_json(const StructuredUri& uri);

/// Deserialize StructuredUri from JSON.
/// kInvalidFormat for a non-object, a non-string component, or a port that is
/// not an integer in 0..65535.
[[nodiscard]] core::Result<StructuredUri, core::ParseError> structured_uri_from_json(
    const nlohmann::json& j);

/// Serialize to compact JSON string. Invalid UTF-8 bytes are written as U+FFFD.
[[nodiscard]] std::string structured_uri_to_json_string(const StructuredUri& uri);

}  // namespace wfnorm::uri
