#include "eval/score.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

namespace eval = skillbench::eval;
namespace json = skillbench::core::json;

namespace {

json::Value ParseOrThrow(const std::string& text) {
  json::Value root;
  std::string error;
  REQUIRE(json::Parse(text, root, error));
  return root;
}

} // namespace

TEST_CASE("Rubric maxima add up to one hundred", "[core][score]") {
  double total = 0.0;
  for (const auto& info : eval::kScoreDimensions) {
    total += info.max;
  }
  REQUIRE(total == 100.0);
  REQUIRE(eval::MaxScore(eval::ScoreDimension::kRobustness) == 20.0);

  eval::ScoreDimension parsed = eval::ScoreDimension::kFunctionalCorrectness;
  REQUIRE(eval::ParseScoreDimension("complexity_control", parsed));
  REQUIRE(parsed == eval::ScoreDimension::kComplexityControl);
  REQUIRE_FALSE(eval::ParseScoreDimension("style", parsed));
}

TEST_CASE("ParseScore clamps dimensions and recomputes the total", "[core][score]") {
  const json::Value root = ParseOrThrow(R"({
    "scores": {"functional_correctness": 35, "robustness": 18, "readability": -2,
               "conciseness": 10, "complexity_control": 8, "format_compliance": 9,
               "total": 99},
    "reasoning": "solid"})");

  eval::Score score;
  std::string warning;
  std::string error;
  REQUIRE(eval::ParseScore(root, score, warning, error));
  REQUIRE(score.values[0] == 30.0);
  REQUIRE(score.values[2] == 0.0);
  REQUIRE(score.total == 75.0);
  REQUIRE(score.reasoning == "solid");
  REQUIRE(warning.find("functional_correctness clamped from 35 to 30") != std::string::npos);
  REQUIRE(warning.find("reported total 99 replaced by 75") != std::string::npos);
}

TEST_CASE("ParseScore rejects incomplete rubric answers", "[core][score]") {
  eval::Score score;
  std::string warning;
  std::string error;

  REQUIRE_FALSE(eval::ParseScore(ParseOrThrow(R"({"reasoning": "none"})"), score, warning, error));
  REQUIRE(error.find("'scores'") != std::string::npos);

  REQUIRE_FALSE(eval::ParseScore(
      ParseOrThrow(R"({"scores": {"functional_correctness": 20, "robustness": 10,
                                 "readability": 10, "conciseness": 10,
                                 "complexity_control": 5}})"),
      score, warning, error));
  REQUIRE(error.find("format_compliance") != std::string::npos);
}

TEST_CASE("Persisted scores restore with a recomputed total", "[core][score]") {
  eval::Score score;
  std::string error;
  REQUIRE(eval::ScoresFromJson(
      ParseOrThrow(R"({"functional_correctness": 25, "robustness": 15, "total": 1})"), score,
      error));
  REQUIRE(score.total == 40.0);
  REQUIRE(score.values[3] == 0.0);

  const json::Value persisted = eval::ScoresToJson(score);
  REQUIRE(json::GetNumber(persisted, "total").value() == 40.0);
  REQUIRE(json::GetNumber(persisted, "format_compliance").value() == 0.0);
  REQUIRE_FALSE(eval::ScoresFromJson(json::MakeArray(), score, error));
}
