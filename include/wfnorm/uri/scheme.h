#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace wfnorm::uri {

/// Schemes recognized by the identifier grammar
enum class Scheme {
  kHttps,
  kHttp,
  kAcct,
  kMailto,
  kTel,
  kDevice,
};

/// Grammar priority order. kHttps must precede kHttp so that "https:" is not
/// split into "http" + "s:".
inline constexpr std::array<Scheme, 6> kRecognizedSchemes = {
    Scheme::kHttps, Scheme::kHttp, Scheme::kAcct, Scheme::kMailto, Scheme::kTel, Scheme::kDevice,
};

/// Convert Scheme to its literal token ("https", "acct", ...)
[[nodiscard]] std::string scheme_to_string(Scheme scheme);

/// Convert a literal token to Scheme. Case-sensitive; nullopt for anything unrecognized.
[[nodiscard]] std::optional<Scheme> string_to_scheme(std::string_view token);

/// Non-HTTP schemes serialize without "//" after the colon.
[[nodiscard]] bool is_non_http_scheme(Scheme scheme);

}  // namespace wfnorm::uri
