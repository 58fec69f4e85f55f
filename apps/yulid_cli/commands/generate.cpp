#include "generate.h"

#include "yulid/core/random_source.h"

#include "exit_codes.h"
#include "generate_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

namespace {

struct GenerateCliConfig {
  int count{1};      // NOLINT(readability-identifier-naming)
  bool json{false};  // NOLINT(readability-identifier-naming)
};

bool parse_count(const std::string& value, int& out) {
  if (value.empty() || value.size() > 6) {
    return false;
  }
  for (const char c : value) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  out = std::stoi(value);
  return true;
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const std::vector<yulid::apps::Option<GenerateCliConfig>> options = {
      {"--count", true, "Number of identifiers to generate (1..10000, default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         if (!parse_count(v, c.count)) {
           std::cerr << "Invalid --count: " << v << " (expected a positive integer)\n";
           return false;
         }
         return true;
       }},
      {"--json", false, "Print a JSON array instead of one identifier per line",
       [](GenerateCliConfig& c, const std::string&) {
         c.json = true;
         return true;
       }},
  };
  auto parsed = yulid::apps::parse_options(argc, argv, options, 2);

  if (!parsed.ok || parsed.positionals.size() != 1) {
    std::cerr << "Usage: yulid_cli generate <PREFIX> [--count N] [--json]\n";
    yulid::apps::print_options(std::cerr, options);
    return kExitUsage;
  }

  const GenerateRequest request{parsed.positionals.front(), parsed.config.count,
                                parsed.config.json};
  return execute_generate(request, yulid::core::process_random_source(), std::cout, std::cerr);
}
