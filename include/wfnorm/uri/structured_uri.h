#pragma once

#include "wfnorm/uri/scheme.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace wfnorm::uri {

/// Component fields of a URI, all optional.
/// An absent port means "not specified" and is distinct from port 0.
struct UriComponents {
  std::optional<std::string> scheme;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> user_info;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> host;       // NOLINT(readability-identifier-naming)
  std::optional<std::uint16_t> port;     // NOLINT(readability-identifier-naming)
  std::optional<std::string> path;       // NOLINT(readability-identifier-naming)
  std::optional<std::string> query;      // NOLINT(readability-identifier-naming)
  std::optional<std::string> fragment;   // NOLINT(readability-identifier-naming)

  bool operator==(const UriComponents&) const = default;
};

// StructuredUri is an immutable, component-separated URI.
// It is built once from a fully populated UriComponents and never revised.
// Query is kept raw; it is not split into key/value pairs.
class StructuredUri {
 public:
  explicit StructuredUri(UriComponents components) : components_(std::move(components)) {}

  [[nodiscard]] const std::optional<std::string>& scheme() const { return components_.scheme; }
  [[nodiscard]] const std::optional<std::string>& user_info() const {
    return components_.user_info;
  }
  [[nodiscard]] const std::optional<std::string>& host() const { return components_.host; }
  [[nodiscard]] const std::optional<std::uint16_t>& port() const { return components_.port; }
  [[nodiscard]] const std::optional<std::string>& path() const { return components_.path; }
  [[nodiscard]] const std::optional<std::string>& query() const { return components_.query; }
  [[nodiscard]] const std::optional<std::string>& fragment() const {
    return components_.fragment;
  }

  [[nodiscard]] const UriComponents& components() const { return components_; }

  /// The scheme as a recognized Scheme, or nullopt when absent or unrecognized.
  [[nodiscard]] std::optional<Scheme> known_scheme() const;

  bool operator==(const StructuredUri&) const = default;

 private:
  UriComponents components_;
};

}  // namespace wfnorm::uri
