#include "validate.h"

#include "exit_codes.h"
#include "shared/arg_parser.h"
#include "validate_logic.h"
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct ValidateCliConfig {
  bool json{false};  // NOLINT(readability-identifier-naming)
};

}  // namespace

int cmd_validate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<yulid::apps::Option<ValidateCliConfig>> options = {
      {"--json", false, "Print a JSON array of validation results",
       [](ValidateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = yulid::apps::parse_options(argc, argv, options, 2);

  if (!parsed.ok || parsed.positionals.empty()) {
    std::cerr << "Usage: yulid_cli validate <ID>... [--json]\n";
    yulid::apps::print_options(std::cerr, options);
    return kExitUsage;
  }

  const ValidateRequest request{std::move(parsed.positionals), parsed.config.json};
  return execute_validate(request, std::cout);
}
