#include "wfnorm/uri/scheme.h"

namespace wfnorm::uri {

std::string scheme_to_string(Scheme scheme) {
  switch (scheme) {
    case Scheme::kHttps:
      return "https";
    case Scheme::kHttp:
      return "http";
    case Scheme::kAcct:
      return "acct";
    case Scheme::kMailto:
      return "mailto";
    case Scheme::kTel:
      return "tel";
    case Scheme::kDevice:
      return "device";
  }
  return "https";
}

std::optional<Scheme> string_to_scheme(std::string_view token) {
  for (const Scheme scheme : kRecognizedSchemes) {
    if (token == scheme_to_string(scheme)) {
      return scheme;
    }
  }
  return std::nullopt;
}

bool is_non_http_scheme(Scheme scheme) {
  switch (scheme) {
    case Scheme::kAcct:
    case Scheme::kMailto:
    case Scheme::kTel:
    case Scheme::kDevice:
      return true;
    case Scheme::kHttps:
    case Scheme::kHttp:
      return false;
  }
  return false;
}

}  // namespace wfnorm::uri
