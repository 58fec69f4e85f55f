#pragma once

// cmd_generate: create new identifiers from a 4-character prefix.
// Usage: yulid_cli generate <PREFIX> [--count N] [--json]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
