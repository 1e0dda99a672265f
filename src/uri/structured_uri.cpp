#include "wfnorm/uri/structured_uri.h"

namespace wfnorm::uri {

std::optional<Scheme> StructuredUri::known_scheme() const {
  if (!components_.scheme.has_value()) {
    return std::nullopt;
  }
  return string_to_scheme(components_.scheme.value());
}

}  // namespace wfnorm::uri
