#pragma once

#include <string>
#include <utility>
#include <variant>

namespace wfnorm::core {

// Malformed identifiers are routine user input, so errors are values, not exceptions.

// NormalizeError is the reason an identifier could not be normalized.
enum class NormalizeError {
  kBlankInput,       // null, empty or whitespace-only identifier
  kGrammarMismatch,  // identifier does not match the identifier grammar end-to-end
  kPortOutOfRange,   // port digits matched but the value exceeds 65535
  kTooLong,          // identifier longer than kMaxIdentifierLength
};

// ParseError is the reason a serialized StructuredUri could not be decoded.
enum class ParseError {
  kInvalidFormat,
};

// Result<T, E> holds either a value or the error that prevented it.
template <typename T, typename E>
class Result {
 public:
  static Result ok(T value) { return Result(std::move(value)); }
  static Result err(E error) { return Result(std::move(error)); }

  [[nodiscard]] bool has_value() const { return std::holds_alternative<T>(data_); }
  [[nodiscard]] const T& value() const { return std::get<T>(data_); }
  [[nodiscard]] const E& error() const { return std::get<E>(data_); }

 private:
  explicit Result(T value) : data_(std::move(value)) {}
  explicit Result(E error) : data_(std::move(error)) {}

  std::variant<T, E> data_;
};

/// Stable lowercase token for a NormalizeError (e.g. "grammar_mismatch")
[[nodiscard]] std::string normalize_error_to_string(NormalizeError error);

/// Stable lowercase token for a ParseError
[[nodiscard]] std::string parse_error_to_string(ParseError error);

}  // namespace wfnorm::core
