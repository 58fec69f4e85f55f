#include "yulid/codec/yulid.h"
#include "yulid/codec/yulid_json.h"

#include <catch2/catch_test_macros.hpp>

#include <nlohmann/json.hpp>

using namespace yulid::codec;

TEST_CASE("to_json: identifier fields", "[yulid][json]") {
  const auto j = to_json(Yulid::from_bytes("JNDE-ED24HS"));
  CHECK(j.at("prefix") == "JNDE");
  CHECK(j.at("suffix") == "ED24HS");
  CHECK(j.at("yulid") == "JNDE-ED24HS");
}

TEST_CASE("to_json: output is deterministic with sorted keys", "[yulid][json]") {
  const auto id = Yulid::from_bytes("JNDE-ED24HS");
  CHECK(to_json(id).dump() == R"({"prefix":"JNDE","suffix":"ED24HS","yulid":"JNDE-ED24HS"})");
  CHECK(to_json(id).dump() == to_json(id).dump());
}

TEST_CASE("validation_to_json: valid input", "[yulid][json]") {
  const auto result = validate(Yulid::from_bytes("ABCD-1234"));
  const auto j = validation_to_json("ABCD-1234", result);
  CHECK(j.at("valid") == true);
  CHECK(j.at("error").is_null());
  CHECK(j.at("message").is_null());
  CHECK(j.at("yulid") == "ABCD-1234");
}

TEST_CASE("validation_to_json: invalid input carries code and message", "[yulid][json]") {
  const auto result = validate(Yulid::from_bytes("ABCD_1234"));
  const auto j = validation_to_json("ABCD_1234", result);
  CHECK(j.dump() ==
        R"({"error":"invalid_separator","message":"YULID separator is invalid","valid":false,"yulid":"ABCD_1234"})");
}
