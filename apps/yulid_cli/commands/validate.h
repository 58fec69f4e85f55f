#pragma once

// cmd_validate: check one or more identifiers against the YULID format.
// Usage: yulid_cli validate <ID>... [--json]
int cmd_validate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
