#pragma once

// Process exit codes shared by all yulid_cli subcommands.
constexpr int kExitOk = 0;
constexpr int kExitInvalid = 1;  // validate: at least one identifier failed
constexpr int kExitUsage = 2;    // bad flags, missing arguments, or an unusable prefix
