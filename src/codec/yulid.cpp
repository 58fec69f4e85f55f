#include "yulid/codec/yulid.h"

#include "yulid/core/alphabet.h"

#include <exception>

namespace yulid::codec {

namespace {

using CreateResult = core::Result<Yulid, ConstructError>;
using ValidateResult = core::Result<bool, ValidationError>;

// Returns the content length: position of the first zero byte, or the buffer size.
std::size_t content_length(std::string_view bytes) {
  const auto nul = bytes.find('\0');
  return nul == std::string_view::npos ? bytes.size() : nul;
}

char draw_alphabet_char(core::IRandomSource& rng) {
  std::size_t index = 0;
  try {
    index = rng.uniform_index(core::kAlphabetSize);
  } catch (const std::exception& e) {
    // RandomSourceError and anything the standard library throws from the device.
    core::fatal_random_source_failure(e.what());
  } catch (...) {
    core::fatal_random_source_failure("unknown exception from random source");
  }

  if (index >= core::kAlphabetSize) {
    core::fatal_random_source_failure("random source returned an out-of-range index");
  }
  return core::kAlphanumeric[index];
}

}  // namespace

CreateResult Yulid::create(std::string_view prefix, core::IRandomSource& rng) {
  // Length first, so a short prefix with bad characters reports the same error.
  if (prefix.size() != kPrefixLen) {
    return CreateResult::err(ConstructError::kInvalidInput);
  }
  if (!core::all_alphanumeric(prefix)) {
    return CreateResult::err(ConstructError::kInvalidInput);
  }

  std::string buffer(kMaxLength, '\0');
  buffer.replace(0, kPrefixLen, prefix);
  buffer[kPrefixLen] = kSeparator;

  for (std::size_t i = 0; i < kGeneratedSuffixLen; ++i) {
    buffer[kPrefixLen + kSeparatorLen + i] = draw_alphabet_char(rng);
  }

  return CreateResult::ok(Yulid(std::move(buffer)));
}

CreateResult Yulid::create(std::string_view prefix) {
  return create(prefix, core::process_random_source());
}

Yulid Yulid::from_bytes(std::string_view bytes) {
  return Yulid(std::string(bytes));
}

std::string Yulid::str() const {
  return bytes_.substr(0, content_length(bytes_));
}

std::string Yulid::prefix() const {
  const auto text = str();
  if (text.size() < kPrefixLen) {
    return {};
  }
  return text.substr(0, kPrefixLen);
}

std::string Yulid::suffix() const {
  const auto text = str();
  if (text.size() <= kPrefixLen + kSeparatorLen) {
    return {};
  }
  return text.substr(kPrefixLen + kSeparatorLen);
}

std::string render(const Yulid& id) {
  return id.str();
}

ValidateResult validate(const Yulid& id) {
  const std::string_view bytes = id.bytes();
  const std::size_t length = content_length(bytes);

  if (length < kMinLength || length > kMaxLength) {
    return ValidateResult::err(ValidationError::kInvalidLength);
  }

  if (!core::all_alphanumeric(bytes.substr(0, kPrefixLen))) {
    return ValidateResult::err(ValidationError::kInvalidPrefix);
  }

  if (bytes[kPrefixLen] != kSeparator) {
    return ValidateResult::err(ValidationError::kInvalidSeparator);
  }

  const std::size_t suffix_start = kPrefixLen + kSeparatorLen;
  if (!core::all_alphanumeric(bytes.substr(suffix_start, length - suffix_start))) {
    return ValidateResult::err(ValidationError::kInvalidSuffix);
  }

  return ValidateResult::ok(true);
}

core::Result<Yulid, ValidationError> parse(std::string_view text) {
  auto id = Yulid::from_bytes(text);
  auto result = validate(id);
  if (!result.has_value()) {
    return core::Result<Yulid, ValidationError>::err(result.error());
  }
  return core::Result<Yulid, ValidationError>::ok(std::move(id));
}

std::ostream& operator<<(std::ostream& os, const Yulid& id) {
  return os << id.str();
}

}  // namespace yulid::codec
