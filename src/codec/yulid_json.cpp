#include "yulid/codec/yulid_json.h"

#include <string>

namespace yulid::codec {

nlohmann::json to_json(const Yulid& id) {
  nlohmann::json j;
  j["prefix"] = id.prefix();
  j["suffix"] = id.suffix();
  j["yulid"] = id.str();
  return j;
}

nlohmann::json validation_to_json(std::string_view input,
                                  const core::Result<bool, ValidationError>& result) {
  nlohmann::json j;
  j["yulid"] = std::string(input);
  j["valid"] = result.has_value();
  if (result.has_value()) {
    j["error"] = nullptr;
    j["message"] = nullptr;
  } else {
    j["error"] = std::string(error_code(result.error()));
    j["message"] = std::string(to_string(result.error()));
  }
  return j;
}

}  // namespace yulid::codec
