#include "oracle/structured_output.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace json = skillbench::core::json;
using skillbench::oracle::ParseStructuredOutput;

TEST_CASE("Structured output accepts a bare JSON answer", "[core][oracle][json]") {
  json::Value value;
  std::string error;
  REQUIRE(ParseStructuredOutput("  {\"total\": 85}\n", value, error));
  REQUIRE(json::GetNumber(value, "total").value() == 85.0);
}

TEST_CASE("Structured output prefers the fenced json block", "[core][oracle][json]") {
  json::Value value;
  std::string error;
  const std::string raw = "Here is my review:\n```json\n{\"verdict\": \"fenced\"}\n```\n"
                          "Ignore {this} aside.";
  REQUIRE(ParseStructuredOutput(raw, value, error));
  REQUIRE(json::GetString(value, "verdict") == "fenced");
}

TEST_CASE("Structured output falls back to the outer brace span", "[core][oracle][json]") {
  json::Value value;
  std::string error;
  const std::string raw =
      "Sure. {\"scores\": {\"readability\": 12}, \"reasoning\": \"ok\"} Hope that helps.";
  REQUIRE(ParseStructuredOutput(raw, value, error));
  const json::Value* scores = json::FindField(value, "scores");
  REQUIRE(scores != nullptr);
  REQUIRE(json::GetNumber(*scores, "readability").value() == 12.0);
}

TEST_CASE("Structured output rejects text without JSON", "[core][oracle][json]") {
  json::Value value;
  std::string error;
  REQUIRE_FALSE(ParseStructuredOutput("I could not score this submission.", value, error));
  REQUIRE(error.find("unable to extract structured JSON") != std::string::npos);

  REQUIRE_FALSE(ParseStructuredOutput("   \n", value, error));
  REQUIRE(error == "model output is empty");
}
