#include "wfnorm/uri/identifier_normalizer.h"
#include "wfnorm/uri/uri_serializer.h"

#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <string>
#include <utility>

using namespace wfnorm::uri;

namespace {

StructuredUri make_uri(UriComponents parts) {
  return StructuredUri{std::move(parts)};
}

std::string normalize_then_serialize(const std::string& identifier) {
  const auto result = normalize_resource(identifier);
  REQUIRE(result.has_value());
  return serialize_uri(result.value());
}

}  // namespace

// ── Absent input ────────────────────────────────────────────────────────────

TEST_CASE("serialize_uri: absent input yields absent output", "[uri][serializer]") {
  const std::optional<StructuredUri> nothing;
  CHECK_FALSE(serialize_uri(nothing).has_value());
  CHECK_FALSE(serialize_uri(std::nullopt).has_value());
}

TEST_CASE("serialize_uri: present optional is serialized", "[uri][serializer]") {
  const std::optional<StructuredUri> uri = make_uri({.scheme = "acct", .host = "example.com"});
  CHECK(serialize_uri(uri) == std::optional<std::string>{"acct:example.com"});
}

// ── Non-HTTP schemes ────────────────────────────────────────────────────────

TEST_CASE("serialize_uri: non-http schemes have no authority slashes", "[uri][serializer]") {
  for (const std::string scheme : {"acct", "mailto", "tel", "device"}) {
    const auto text = serialize_uri(make_uri({.scheme = scheme, .host = "example.com"}));
    CHECK(text == scheme + ":example.com");
    CHECK(text.find("://") == std::string::npos);
  }
}

TEST_CASE("serialize_uri: acct with user info", "[uri][serializer]") {
  CHECK(normalize_then_serialize("bob@example.com") == "acct:bob@example.com");
  CHECK(normalize_then_serialize("acct:bob@example.com") == "acct:bob@example.com");
  CHECK(normalize_then_serialize("acct://bob@example.com") == "acct:bob@example.com");
}

TEST_CASE("serialize_uri: tel and mailto identifiers", "[uri][serializer]") {
  CHECK(normalize_then_serialize("tel:+15551234") == "tel:+15551234");
  CHECK(normalize_then_serialize("mailto:alice@example.org") == "mailto:alice@example.org");
}

TEST_CASE("serialize_uri: non-http form with every component", "[uri][serializer]") {
  const auto uri = make_uri({.scheme = "device",
                             .user_info = "u",
                             .host = "h.example",
                             .port = 7,
                             .path = "p/q",
                             .query = "a=b",
                             .fragment = "f"});
  CHECK(serialize_uri(uri) == "device:u@h.example:7/p/q?a=b#f");
}

TEST_CASE("serialize_uri: non-http form skips blank components", "[uri][serializer]") {
  const auto uri = make_uri({.scheme = "acct",
                             .user_info = "  ",
                             .host = "example.com",
                             .path = " ",
                             .query = "",
                             .fragment = "\t"});
  CHECK(serialize_uri(uri) == "acct:example.com");
}

TEST_CASE("serialize_uri: non-http form keeps an absolute path as is", "[uri][serializer]") {
  const auto uri = make_uri({.scheme = "acct", .host = "example.com", .path = "/x"});
  CHECK(serialize_uri(uri) == "acct:example.com/x");
}

TEST_CASE("serialize_uri: non-http form emits port 0", "[uri][serializer]") {
  const auto uri = make_uri({.scheme = "tel", .host = "+1", .port = 0});
  CHECK(serialize_uri(uri) == "tel:+1:0");
}

// ── HTTP and generic serialization ──────────────────────────────────────────

TEST_CASE("serialize_uri: https uses authority form", "[uri][serializer]") {
  CHECK(normalize_then_serialize("example.com") == "https://example.com");
  CHECK(normalize_then_serialize("example.com/bob") == "https://example.com/bob");
  CHECK(normalize_then_serialize("bob@example.com:8080") == "https://bob@example.com:8080");
  CHECK(normalize_then_serialize("https://example.com/bob#frag") == "https://example.com/bob");
  CHECK(normalize_then_serialize("http://example.com:80/a?b=c") == "http://example.com:80/a?b=c");
}

TEST_CASE("serialize_uri: unrecognized and absent schemes use authority form",
          "[uri][serializer]") {
  CHECK(serialize_uri(make_uri({.scheme = "ftp", .host = "files.example"})) ==
        "ftp://files.example");
  CHECK(serialize_uri(make_uri({.host = "example.com", .path = "/x"})) == "//example.com/x");
  CHECK(serialize_uri(make_uri({.scheme = "", .host = "example.com"})) == "//example.com");
}

TEST_CASE("to_uri_string: keeps fragment and empty query", "[uri][serializer]") {
  const auto uri = make_uri(
      {.scheme = "https", .host = "example.com", .path = "/a", .query = "", .fragment = "top"});
  CHECK(to_uri_string(uri) == "https://example.com/a?#top");
}

TEST_CASE("to_uri_string: relative path gets a separator after the authority",
          "[uri][serializer]") {
  const auto uri = make_uri({.scheme = "https", .host = "example.com", .path = "a/b"});
  CHECK(to_uri_string(uri) == "https://example.com/a/b");
}

TEST_CASE("to_uri_string: path-only URI", "[uri][serializer]") {
  CHECK(to_uri_string(make_uri({.path = "a/b"})) == "a/b");
  CHECK(to_uri_string(make_uri({.scheme = "https", .path = "/a"})) == "https:/a");
}

TEST_CASE("to_uri_string: port outside authority is dropped", "[uri][serializer]") {
  CHECK(to_uri_string(make_uri({.scheme = "https", .port = 8443, .path = "/a"})) == "https:/a");
}

// ── Round trip ──────────────────────────────────────────────────────────────

TEST_CASE("serialize then normalize is stable for http schemes", "[uri][serializer]") {
  for (const std::string input :
       {"example.com", "https://example.com:8443/a/b?x=1#f", "http://joe@example.com/p",
        "example.com/bob?q=1", "bob@example.com:8080"}) {
    const auto first = normalize_resource(input);
    REQUIRE(first.has_value());

    const auto second = normalize_resource(serialize_uri(first.value()));
    REQUIRE(second.has_value());
    CHECK(second.value() == first.value());
    CHECK_FALSE(second.value().fragment().has_value());
  }
}
