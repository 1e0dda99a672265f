#include "normalize.h"

#include "common_options.h"
#include "normalize_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct NormalizeCliConfig {
  bool json{false};        // NOLINT(readability-identifier-naming)
  bool from_stdin{false};  // NOLINT(readability-identifier-naming)
};

std::vector<wfnorm::apps::Option<NormalizeCliConfig>> normalize_options() {
  return {
      {"--json", false, "Print components as JSON",
       [](NormalizeCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
      {"--stdin", false, "Read one identifier per line from standard input",
       [](NormalizeCliConfig& c, const std::string&) {
         c.from_stdin = true;
         return true;
       }},
      {"--log-level", true, "Log level (trace|debug|info|warn|error|off)",
       [](NormalizeCliConfig&, const std::string& v) { return apply_log_level_flag(v); }},
  };
}

}  // namespace

int cmd_normalize(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = normalize_options();
  const auto parsed = wfnorm::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok) {
    return 1;
  }

  const auto& config = parsed.config;
  if (config.from_stdin) {
    if (!parsed.positionals.empty()) {
      std::cerr << "Error: --stdin does not take an identifier argument\n";
      return 1;
    }
    return execute_normalize_stream(std::cin, config.json, std::cout);
  }

  if (parsed.positionals.size() != 1) {
    std::cerr << "Usage: wfnorm_cli normalize [options] [--] <identifier>\n";
    wfnorm::apps::print_options(std::cerr, options);
    return 1;
  }

  return execute_normalize(parsed.positionals.front(), config.json, std::cout, std::cerr);
}
