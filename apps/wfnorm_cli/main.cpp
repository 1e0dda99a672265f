#include "wfnorm/core/version.h"

#include "commands/normalize.h"
#include "commands/serialize.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "Usage: wfnorm_cli <command> [options]\n"
            << "Commands:\n"
            << "  normalize [--json] [--log-level <level>] [--] <identifier>\n"
            << "  normalize --stdin [--json] [--log-level <level>]\n"
            << "  serialize --input <json> [--log-level <level>]\n"
            << "  version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "normalize") {
    return cmd_normalize(argc, argv);
  }
  if (subcommand == "serialize") {
    return cmd_serialize(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << "wfnorm v" << wfnorm::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
