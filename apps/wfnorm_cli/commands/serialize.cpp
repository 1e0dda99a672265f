#include "serialize.h"

#include "common_options.h"
#include "serialize_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct SerializeCliConfig {
  std::optional<std::string> input;  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_serialize(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<wfnorm::apps::Option<SerializeCliConfig>> options = {
      {"--input", true, "StructuredUri as a JSON object",
       [](SerializeCliConfig& c, const std::string& v) {
         c.input = v;
         return true;
       }},
      {"--log-level", true, "Log level (trace|debug|info|warn|error|off)",
       [](SerializeCliConfig&, const std::string& v) { return apply_log_level_flag(v); }},
  };
  const auto parsed = wfnorm::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }

  if (!parsed.config.input.has_value()) {
    std::cerr << "Error: --input <json> is required\n";
    return 1;
  }

  return execute_serialize(parsed.config.input.value(), std::cout, std::cerr);
}
