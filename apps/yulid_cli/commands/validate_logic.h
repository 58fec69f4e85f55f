#pragma once

#include <ostream>
#include <string>
#include <vector>

struct ValidateRequest {
  std::vector<std::string> ids;  // NOLINT(readability-identifier-naming)
  bool json{false};              // NOLINT(readability-identifier-naming)
};

// execute_validate checks every identifier in request.ids and reports each outcome.
// Plain output: "OK <id>" or "INVALID <id>: <message>" per line.
// JSON output: an array of validation objects in input order.
// Returns kExitOk when all are valid, kExitInvalid otherwise.
int execute_validate(const ValidateRequest& request, std::ostream& out);
