#pragma once

#include "wfnorm/core/result.h"
#include "wfnorm/uri/structured_uri.h"

#include <cstddef>
#include <string_view>

namespace wfnorm::uri {

// Longest identifier accepted. The grammar matcher recurses per character,
// so unbounded input would exhaust the stack.
inline constexpr std::size_t kMaxIdentifierLength = 2048;

// normalize_resource turns a user-supplied discovery identifier into a
// StructuredUri, following the WebFinger / OpenID Connect Discovery
// identifier-normalization rules.
//
// Accepted forms include a bare host ("example.com"), "user@host",
// "acct:user@host", "tel:+15551234", and full http(s) URLs.
//
// Grammar (whole-string match, standard backtracking):
//   [scheme ":" ["//"]] [userinfo "@"] host [":" digits] [path] ["?" query] ["#" fragment]
// where scheme is one of kRecognizedSchemes (case-sensitive).
//
// Postconditions on success:
//   - scheme is always present: the captured one, else "acct" when userinfo is
//     non-blank and path, query and port are all unset, else "https"
//   - fragment is always absent
//
// Errors (logged at warn level with the offending input):
//   - kBlankInput: empty or whitespace-only identifier
//   - kGrammarMismatch: identifier does not match the grammar end-to-end
//   - kPortOutOfRange: port digits present but the value exceeds 65535
//   - kTooLong: identifier longer than kMaxIdentifierLength bytes (checked
//     before matching; only the length is logged)
//
// Stateless and safe to call concurrently.
[[nodiscard]] core::Result<StructuredUri, core::NormalizeError> normalize_resource(
    std::string_view identifier);

}  // namespace wfnorm::uri
