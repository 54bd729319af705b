#include "core/json_dom.hpp"
#include "core/json_utils.hpp"

#include <catch2/catch.hpp>

#include <limits>
#include <string>

TEST_CASE("JSON DOM parses nested documents", "[core][json]") {
  rsa::core::json::Value root;
  std::string error;
  REQUIRE(rsa::core::json::Parse(
      R"({"belief": {"particles": 500, "jitter": 1e-3}, "tags": ["a", "b\n"], "on": true, "x": null})",
      root, error));
  REQUIRE(root.IsObject());

  const rsa::core::json::Value* particles =
      rsa::core::json::FindPath(root, {"belief", "particles"});
  REQUIRE(particles != nullptr);
  REQUIRE(particles->IsNumber());
  REQUIRE(particles->number_value == 500.0);

  const rsa::core::json::Value* tags = rsa::core::json::FindMember(root, "tags");
  REQUIRE(tags != nullptr);
  REQUIRE(tags->array_value.size() == 2U);
  REQUIRE(tags->array_value[1].string_value == "b\n");

  REQUIRE(rsa::core::json::FindMember(root, "on")->bool_value);
  REQUIRE(rsa::core::json::FindMember(root, "x")->type == rsa::core::json::Value::Type::kNull);
  REQUIRE(rsa::core::json::FindPath(root, {"belief", "missing"}) == nullptr);
  REQUIRE(rsa::core::json::FindPath(root, {"on", "nested"}) == nullptr);
}

TEST_CASE("JSON DOM errors carry a position", "[core][json]") {
  rsa::core::json::Value root;
  std::string error;
  REQUIRE_FALSE(rsa::core::json::Parse("{\n  \"a\": ,\n}", root, error));
  REQUIRE(error.find("line 2") != std::string::npos);

  REQUIRE_FALSE(rsa::core::json::Parse("{} extra", root, error));
  REQUIRE(error.find("trailing") != std::string::npos);
}

TEST_CASE("JSON writers escape strings and null out non-finite numbers", "[core][json]") {
  REQUIRE(rsa::core::EscapeJson("a\"b\\c\n") == "a\\\"b\\\\c\\n");
  REQUIRE(rsa::core::Quoted("x") == "\"x\"");
  REQUIRE(rsa::core::FormatJsonNumber(0.25) == "0.25");
  REQUIRE(rsa::core::FormatJsonNumber(std::numeric_limits<double>::infinity()) == "null");
  REQUIRE(rsa::core::FormatJsonArray(rsa::core::MakeVector({1.0, -0.5})) == "[1,-0.5]");
  REQUIRE(rsa::core::FormatJsonArray(rsa::core::Vector()) == "[]");
}
