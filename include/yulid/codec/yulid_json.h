#pragma once

#include "yulid/codec/errors.h"
#include "yulid/codec/yulid.h"
#include "yulid/core/result.h"

#include <nlohmann/json.hpp>

#include <string_view>

namespace yulid::codec {

// to_json describes a generated identifier.
// Shape: {"prefix": "JNDE", "suffix": "ED24HS", "yulid": "JNDE-ED24HS"}
// nlohmann::json sorts object keys, so dump() output is deterministic.
[[nodiscard]] nlohmann::json to_json(const Yulid& id);

// validation_to_json describes the outcome of validating input.
// Shape: {"error": null|"<code>", "message": null|"<text>", "valid": bool, "yulid": "<input>"}
[[nodiscard]] nlohmann::json validation_to_json(std::string_view input,
                                                const core::Result<bool, ValidationError>& result);

}  // namespace yulid::codec
