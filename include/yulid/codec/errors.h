#pragma once

#include <string_view>

namespace yulid::codec {

// Error enumerations following E.14 (use purpose-designed types as error indicators).

// ConstructError is returned by Yulid::create when the caller's prefix is unusable.
enum class ConstructError {
  kInvalidInput,
};

// ValidationError names the first structural rule an identifier breaks.
// Rules are checked in declaration order.
enum class ValidationError {
  kInvalidLength,
  kInvalidPrefix,
  kInvalidSeparator,
  kInvalidSuffix,
};

// to_string returns the human-readable message for an error.
[[nodiscard]] std::string_view to_string(ConstructError error);
[[nodiscard]] std::string_view to_string(ValidationError error);

// error_code returns a stable snake_case tag for machine-readable output.
[[nodiscard]] std::string_view error_code(ConstructError error);
[[nodiscard]] std::string_view error_code(ValidationError error);

}  // namespace yulid::codec
