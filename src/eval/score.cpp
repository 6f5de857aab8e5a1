#include "eval/score.hpp"

#include "core/json_utils.hpp"

#include <algorithm>
#include <cmath>

namespace skillbench::eval {

namespace {

constexpr double kTotalTolerance = 0.01;

std::size_t IndexOf(ScoreDimension dimension) {
  return static_cast<std::size_t>(dimension);
}

} // namespace

const char* ToString(ScoreDimension dimension) {
  return kScoreDimensions[IndexOf(dimension)].key;
}

bool ParseScoreDimension(std::string_view text, ScoreDimension& dimension) {
  for (const auto& info : kScoreDimensions) {
    if (text == info.key) {
      dimension = info.dimension;
      return true;
    }
  }
  return false;
}

double MaxScore(ScoreDimension dimension) {
  return kScoreDimensions[IndexOf(dimension)].max;
}

double SumDimensions(const DimensionScores& values) {
  double sum = 0.0;
  for (const double value : values) {
    sum += value;
  }
  return sum;
}

bool ParseScore(const core::json::Value& root, Score& score, std::string& warning,
                std::string& error) {
  score = Score{};
  warning.clear();
  error.clear();

  const core::json::Value* scores = core::json::FindField(root, "scores");
  if (scores == nullptr || !scores->is_object()) {
    error = "score response is missing the 'scores' object";
    return false;
  }

  for (const auto& info : kScoreDimensions) {
    const auto value = core::json::GetNumber(*scores, info.key);
    if (!value.has_value()) {
      error = std::string("score response is missing numeric dimension '") + info.key + "'";
      return false;
    }
    const double clamped = std::clamp(value.value(), 0.0, info.max);
    if (clamped != value.value()) {
      warning += std::string(warning.empty() ? "" : "; ") + info.key + " clamped from " +
                 core::FormatJsonNumber(value.value()) + " to " +
                 core::FormatJsonNumber(clamped);
    }
    score.values[IndexOf(info.dimension)] = clamped;
  }

  score.total = SumDimensions(score.values);
  const auto reported_total = core::json::GetNumber(*scores, "total");
  if (reported_total.has_value() &&
      std::fabs(reported_total.value() - score.total) > kTotalTolerance) {
    warning += std::string(warning.empty() ? "" : "; ") + "reported total " +
               core::FormatJsonNumber(reported_total.value()) + " replaced by " +
               core::FormatJsonNumber(score.total);
  }

  score.reasoning = core::json::GetString(root, "reasoning");
  return true;
}

core::json::Value ScoresToJson(const Score& score) {
  core::json::Value object = BreakdownToJson(score.values);
  object.object_value["total"] = core::json::MakeNumber(score.total);
  return object;
}

bool ScoresFromJson(const core::json::Value& scores, Score& score, std::string& error) {
  if (!scores.is_object()) {
    error = "scores must be an object";
    return false;
  }
  score.values = BreakdownFromJson(scores);
  score.total = SumDimensions(score.values);
  return true;
}

core::json::Value BreakdownToJson(const DimensionScores& values) {
  core::json::Value object = core::json::MakeObject();
  for (const auto& info : kScoreDimensions) {
    object.object_value[info.key] = core::json::MakeNumber(values[IndexOf(info.dimension)]);
  }
  return object;
}

DimensionScores BreakdownFromJson(const core::json::Value& breakdown) {
  DimensionScores values{};
  for (const auto& info : kScoreDimensions) {
    values[IndexOf(info.dimension)] = core::json::GetNumberOr(breakdown, info.key, 0.0);
  }
  return values;
}

} // namespace skillbench::eval
