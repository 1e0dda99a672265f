#pragma once

#include "wfnorm/uri/structured_uri.h"

#include <optional>
#include <string>

namespace wfnorm::uri {

// to_uri_string renders the generic authority form:
//   scheme "://" [userinfo "@"] host [":" port] path ["?" query] ["#" fragment]
// "//" is emitted only when userinfo or host is present; the port is emitted
// only inside the authority. A path not starting with "/" gets one when
// anything precedes it.
[[nodiscard]] std::string to_uri_string(const StructuredUri& uri);

// serialize_uri renders a StructuredUri as its canonical discovery string.
//
// acct, mailto, tel and device use the minimal form
//   scheme ":" [userinfo "@"] host [":" port] path ["?" query] ["#" fragment]
// with no "//" after the colon; blank components are skipped.
// http, https, blank and unrecognized schemes use to_uri_string.
[[nodiscard]] std::string serialize_uri(const StructuredUri& uri);

// Absent in, absent out: nothing to serialize is not an error.
[[nodiscard]] std::optional<std::string> serialize_uri(const std::optional<StructuredUri>& uri);

}  // namespace wfnorm::uri
