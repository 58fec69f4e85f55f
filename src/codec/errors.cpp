#include "yulid/codec/errors.h"

namespace yulid::codec {

std::string_view to_string(ConstructError error) {
  switch (error) {
    case ConstructError::kInvalidInput:
      return "input should be exactly four alphabetic characters";
  }
  return "unknown construct error";
}

std::string_view to_string(ValidationError error) {
  switch (error) {
    case ValidationError::kInvalidLength:
      return "YULID has an invalid length";
    case ValidationError::kInvalidPrefix:
      return "YULID has an invalid prefix";
    case ValidationError::kInvalidSeparator:
      return "YULID separator is invalid";
    case ValidationError::kInvalidSuffix:
      return "YULID random part contains invalid characters";
  }
  return "unknown validation error";
}

std::string_view error_code(ConstructError error) {
  switch (error) {
    case ConstructError::kInvalidInput:
      return "invalid_input";
  }
  return "unknown";
}

std::string_view error_code(ValidationError error) {
  switch (error) {
    case ValidationError::kInvalidLength:
      return "invalid_length";
    case ValidationError::kInvalidPrefix:
      return "invalid_prefix";
    case ValidationError::kInvalidSeparator:
      return "invalid_separator";
    case ValidationError::kInvalidSuffix:
      return "invalid_suffix";
  }
  return "unknown";
}

}  // namespace yulid::codec
