#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace wfnorm::core {

// ASCII whitespace as used by every "blank" check in the library.
// Locale-independent: space, tab, newline, carriage return, vertical tab, form feed.
constexpr bool is_ascii_space(const char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\v' || ch == '\f';
}

// has_text returns true when the value is present, non-empty, and contains
// at least one non-whitespace character.
inline bool has_text(const std::string_view value) {
  for (const char ch : value) {
    if (!is_ascii_space(ch)) {
      return true;
    }
  }
  return false;
}

// optional_has_text: absent counts as blank.
inline bool optional_has_text(const std::optional<std::string>& value) {
  return value.has_value() && has_text(std::string_view{*value});
}

// is_blank treats absent, empty and whitespace-only identically.
inline bool is_blank(const std::string_view value) {
  return !has_text(value);
}

// trim removes leading and trailing ASCII whitespace
inline std::string trim(const std::string_view input) {
  std::size_t start = 0;
  while (start < input.size() && is_ascii_space(input[start])) {
    ++start;
  }

  // All whitespace
  if (start == input.size()) {
    return std::string{};
  }

  std::size_t end = input.size();
  while (end > start && is_ascii_space(input[end - 1])) {
    --end;
  }

  return std::string{input.substr(start, end - start)};
}

}  // namespace wfnorm::core
