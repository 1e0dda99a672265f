#include "wfnorm/uri/uri_serializer.h"

#include "wfnorm/core/text.h"

#include <string>

namespace wfnorm::uri {

namespace {

void append_path(std::string& out, const std::string& path) {
  if (!out.empty() && path.front() != '/') {
    out += '/';
  }
  out += path;
}

std::string serialize_without_authority_slashes(const StructuredUri& uri) {
  std::string out = uri.scheme().value();
  out += ':';

  if (core::optional_has_text(uri.user_info())) {
    out += uri.user_info().value();
    out += '@';
  }
  if (core::optional_has_text(uri.host())) {
    out += uri.host().value();
  }
  if (uri.port().has_value()) {
    out += ':';
    out += std::to_string(uri.port().value());
  }
  if (core::optional_has_text(uri.path())) {
    append_path(out, uri.path().value());
  }
  if (core::optional_has_text(uri.query())) {
    out += '?';
    out += uri.query().value();
  }
  if (core::optional_has_text(uri.fragment())) {
    out += '#';
    out += uri.fragment().value();
  }

  return out;
}

}  // namespace

std::string to_uri_string(const StructuredUri& uri) {
  std::string out;

  if (uri.scheme().has_value() && !uri.scheme()->empty()) {
    out += uri.scheme().value();
    out += ':';
  }

  if (uri.user_info().has_value() || uri.host().has_value()) {
    out += "//";
    if (uri.user_info().has_value()) {
      out += uri.user_info().value();
      out += '@';
    }
    if (uri.host().has_value()) {
      out += uri.host().value();
    }
    if (uri.port().has_value()) {
      out += ':';
      out += std::to_string(uri.port().value());
    }
  }

  if (uri.path().has_value() && !uri.path()->empty()) {
    append_path(out, uri.path().value());
  }
  if (uri.query().has_value()) {
    out += '?';
    out += uri.query().value();
  }
  if (uri.fragment().has_value()) {
    out += '#';
    out += uri.fragment().value();
  }

  return out;
}

std::string serialize_uri(const StructuredUri& uri) {
  const auto scheme = uri.known_scheme();
  if (scheme.has_value() && is_non_http_scheme(scheme.value())) {
    return serialize_without_authority_slashes(uri);
  }
  return to_uri_string(uri);
}

std::optional<std::string> serialize_uri(const std::optional<StructuredUri>& uri) {
  if (!uri.has_value()) {
    return std::nullopt;
  }
  return serialize_uri(uri.value());
}

}  // namespace wfnorm::uri
