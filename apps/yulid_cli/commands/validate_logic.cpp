#include "validate_logic.h"

#include "yulid/codec/errors.h"
#include "yulid/codec/yulid.h"
#include "yulid/codec/yulid_json.h"

#include "exit_codes.h"

#include <nlohmann/json.hpp>

int execute_validate(const ValidateRequest& request, std::ostream& out) {
  bool all_valid = true;
  nlohmann::json arr = nlohmann::json::array();

  for (const auto& text : request.ids) {
    const auto result = yulid::codec::validate(yulid::codec::Yulid::from_bytes(text));
    all_valid = all_valid && result.has_value();

    if (request.json) {
      arr.push_back(yulid::codec::validation_to_json(text, result));
    } else if (result.has_value()) {
      out << "OK " << text << "\n";
    } else {
      out << "INVALID " << text << ": " << yulid::codec::to_string(result.error()) << "\n";
    }
  }

  if (request.json) {
    out << arr.dump(2) << "\n";
  }

  return all_valid ? kExitOk : kExitInvalid;
}
