#pragma once

#include "core/json_dom.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace skillbench::eval {

// Rubric dimensions in declaration order. The order breaks ties wherever a
// "weakest" or "leading" dimension is chosen.
enum class ScoreDimension {
  kFunctionalCorrectness = 0,
  kRobustness,
  kReadability,
  kConciseness,
  kComplexityControl,
  kFormatCompliance,
};

struct DimensionInfo {
  ScoreDimension dimension;
  const char* key;
  double max;
};

inline constexpr std::size_t kDimensionCount = 6;

inline constexpr std::array<DimensionInfo, kDimensionCount> kScoreDimensions = {{
    {ScoreDimension::kFunctionalCorrectness, "functional_correctness", 30.0},
    {ScoreDimension::kRobustness, "robustness", 20.0},
    {ScoreDimension::kReadability, "readability", 15.0},
    {ScoreDimension::kConciseness, "conciseness", 15.0},
    {ScoreDimension::kComplexityControl, "complexity_control", 10.0},
    {ScoreDimension::kFormatCompliance, "format_compliance", 10.0},
}};

const char* ToString(ScoreDimension dimension);
bool ParseScoreDimension(std::string_view text, ScoreDimension& dimension);
double MaxScore(ScoreDimension dimension);

using DimensionScores = std::array<double, kDimensionCount>;

// Invariant: total == sum of values.
struct Score {
  DimensionScores values{};
  double total = 0.0;
  std::string reasoning;
};

double SumDimensions(const DimensionScores& values);

// Reads a rubric answer `{"scores": {...}, "reasoning": "..."}`.
//
// Every dimension must be present and numeric. Values are clamped into
// [0, max] and `total` is recomputed; a clamp or a disagreeing model total is
// reported through `warning` while the call still succeeds.
bool ParseScore(const core::json::Value& root, Score& score, std::string& warning,
                std::string& error);

// `{"<dimension>": n, ..., "total": n}` as persisted in result records.
core::json::Value ScoresToJson(const Score& score);

// Inverse of ScoresToJson for records already on disk. Missing dimensions read
// as 0; total is recomputed.
bool ScoresFromJson(const core::json::Value& scores, Score& score, std::string& error);

// `{"<dimension>": n, ...}` without a total, used for averaged breakdowns.
core::json::Value BreakdownToJson(const DimensionScores& values);
DimensionScores BreakdownFromJson(const core::json::Value& breakdown);

} // namespace skillbench::eval
