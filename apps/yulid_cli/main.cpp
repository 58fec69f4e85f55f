#include "yulid/core/version.h"

#include "commands/exit_codes.h"
#include "commands/generate.h"
#include "commands/validate.h"

#include <iostream>
#include <string>

namespace {

void print_usage(std::ostream& os) {
  os << "yulid_cli v" << yulid::core::kBuildVersion << "\n"
     << "Usage:\n"
     << "  yulid_cli generate <PREFIX> [--count N] [--json]\n"
     << "  yulid_cli validate <ID>... [--json]\n"
     << "  yulid_cli --version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage(std::cerr);
    return kExitUsage;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "validate") {
    return cmd_validate(argc, argv);
  }
  if (subcommand == "--version") {
    std::cout << yulid::core::kBuildVersion << "\n";
    return kExitOk;
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage(std::cout);
    return kExitOk;
  }

  std::cerr << "Unknown subcommand: " << subcommand << "\n";
  print_usage(std::cerr);
  return kExitUsage;
}
