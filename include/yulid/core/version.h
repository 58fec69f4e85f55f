#pragma once

namespace yulid::core {

// kBuildVersion is the current software version string.
constexpr const char* kBuildVersion = "1.0";

}  // namespace yulid::core
