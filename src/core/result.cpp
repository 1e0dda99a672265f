#include "wfnorm/core/result.h"

namespace wfnorm::core {

std::string normalize_error_to_string(NormalizeError error) {
  switch (error) {
    case NormalizeError::kBlankInput:
      return "blank_input";
    case NormalizeError::kGrammarMismatch:
      return "grammar_mismatch";
    case NormalizeError::kPortOutOfRange:
      return "port_out_of_range";
    case NormalizeError::kTooLong:
      return "too_long";
  }
  return "unknown";
}

std::string parse_error_to_string(ParseError error) {
  switch (error) {
    case ParseError::kInvalidFormat:
      return "invalid_format";
  }
  return "unknown";
}

}  // namespace wfnorm::core
