#pragma once

#include <cstddef>
#include <string_view>

namespace yulid::core {

// kAlphanumeric is the 36-character alphabet shared by prefix and suffix.
// Index order matters: a random index i in [0, 36) maps to kAlphanumeric[i].
inline constexpr std::string_view kAlphanumeric = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
inline constexpr std::size_t kAlphabetSize = kAlphanumeric.size();

// is_alphanumeric accepts exactly A-Z and 0-9.
// Explicit char math: no locale, lowercase is rejected.
constexpr bool is_alphanumeric(const char ch) {
  return (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

// all_alphanumeric is true when every character of input passes is_alphanumeric.
// An empty view is vacuously alphanumeric; callers check length separately.
constexpr bool all_alphanumeric(const std::string_view input) {
  for (const char ch : input) {
    if (!is_alphanumeric(ch)) {
      return false;
    }
  }
  return true;
}

}  // namespace yulid::core
