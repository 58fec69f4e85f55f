#include "generate_logic.h"

#include "yulid/codec/errors.h"
#include "yulid/codec/yulid.h"
#include "yulid/codec/yulid_json.h"

#include "exit_codes.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <vector>

int execute_generate(const GenerateRequest& request, yulid::core::IRandomSource& rng,
                     std::ostream& out, std::ostream& err) {
  if (request.count < kMinGenerateCount || request.count > kMaxGenerateCount) {
    err << "Invalid --count: " << request.count << " (valid: " << kMinGenerateCount << ".."
        << kMaxGenerateCount << ")\n";
    return kExitUsage;
  }

  std::vector<yulid::codec::Yulid> ids;
  ids.reserve(static_cast<std::size_t>(request.count));

  for (int i = 0; i < request.count; ++i) {
    auto result = yulid::codec::Yulid::create(request.prefix, rng);
    if (!result.has_value()) {
      // Every iteration shares the prefix, so the first failure is the only one.
      err << "Invalid prefix '" << request.prefix
          << "': " << yulid::codec::to_string(result.error()) << "\n";
      return kExitUsage;
    }
    ids.push_back(result.value());
  }

  if (request.json) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& id : ids) {
      arr.push_back(yulid::codec::to_json(id));
    }
    out << arr.dump(2) << "\n";
  } else {
    for (const auto& id : ids) {
      out << id << "\n";
    }
  }

  return kExitOk;
}
