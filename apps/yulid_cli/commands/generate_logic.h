#pragma once

#include "yulid/core/random_source.h"

#include <ostream>
#include <string>

// Bounds for --count.
constexpr int kMinGenerateCount = 1;
constexpr int kMaxGenerateCount = 10000;

struct GenerateRequest {
  std::string prefix;  // NOLINT(readability-identifier-naming)
  int count{1};        // NOLINT(readability-identifier-naming)
  bool json{false};    // NOLINT(readability-identifier-naming)
};

// execute_generate creates request.count identifiers for request.prefix using rng.
// Plain output is one identifier per line; JSON output is an array of identifier objects.
// Returns kExitUsage (and writes a message to err) if the prefix or count is rejected.
int execute_generate(const GenerateRequest& request, yulid::core::IRandomSource& rng,
                     std::ostream& out, std::ostream& err);
