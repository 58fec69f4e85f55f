#pragma once

#include "yulid/codec/errors.h"
#include "yulid/core/random_source.h"
#include "yulid/core/result.h"

#include <compare>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace yulid::codec {

// Layout of a YULID: [4-character prefix] '-' [4-6 character random suffix].
// Example: "JNDE-ED24HS" for a person named John Doe.
inline constexpr std::size_t kPrefixLen = 4;
inline constexpr std::size_t kSeparatorLen = 1;
inline constexpr char kSeparator = '-';
inline constexpr std::size_t kMinSuffixLen = 4;
inline constexpr std::size_t kMaxSuffixLen = 6;
inline constexpr std::size_t kMinLength = kPrefixLen + kSeparatorLen + kMinSuffixLen;
inline constexpr std::size_t kMaxLength = kPrefixLen + kSeparatorLen + kMaxSuffixLen;

// Length of the suffix emitted by create(). Validation still accepts kMinSuffixLen..kMaxSuffixLen.
inline constexpr std::size_t kGeneratedSuffixLen = kMaxSuffixLen;

// Yulid is an immutable, human-readable identifier value.
//
// The raw byte buffer is kept verbatim. Generated identifiers fill exactly kMaxLength bytes;
// identifiers rebuilt with from_bytes() may be shorter, longer, or carry zero bytes.
// A zero byte marks the end of meaningful content for rendering and validation.
class Yulid {
 public:
  // An empty identifier (renders as "", fails validation).
  Yulid() = default;

  // create builds a new identifier from a 4-character A-Z/0-9 prefix plus
  // kGeneratedSuffixLen random characters drawn from rng.
  // Returns err(kInvalidInput) if the prefix has the wrong length or any disallowed character.
  // Aborts the process if rng cannot produce values.
  [[nodiscard]] static core::Result<Yulid, ConstructError> create(std::string_view prefix,
                                                                  core::IRandomSource& rng);

  // create using the process-wide system random source.
  [[nodiscard]] static core::Result<Yulid, ConstructError> create(std::string_view prefix);

  // from_bytes wraps existing bytes without checking them. Pair with validate().
  [[nodiscard]] static Yulid from_bytes(std::string_view bytes);

  // str renders the identifier: bytes up to the first zero byte, or all bytes.
  [[nodiscard]] std::string str() const;

  // prefix and suffix slice the rendered text; empty when the text is too short.
  [[nodiscard]] std::string prefix() const;
  [[nodiscard]] std::string suffix() const;

  // Raw buffer, including anything past a zero byte.
  [[nodiscard]] std::string_view bytes() const { return bytes_; }

  auto operator<=>(const Yulid&) const = default;

 private:
  explicit Yulid(std::string bytes) : bytes_(std::move(bytes)) {}

  std::string bytes_;
};

// render is the free-function form of Yulid::str().
[[nodiscard]] std::string render(const Yulid& id);

// validate checks, in order: length, prefix alphabet, separator, suffix alphabet.
// Returns ok(true) if well-formed, otherwise err naming the first rule that failed.
[[nodiscard]] core::Result<bool, ValidationError> validate(const Yulid& id);

// parse rebuilds an identifier from text and validates it.
[[nodiscard]] core::Result<Yulid, ValidationError> parse(std::string_view text);

std::ostream& operator<<(std::ostream& os, const Yulid& id);

}  // namespace yulid::codec
