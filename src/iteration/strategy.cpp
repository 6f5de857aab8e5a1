#include "iteration/strategy.hpp"

#include <cmath>
#include <limits>

namespace skillbench::iteration {

const char* ToString(Strategy strategy) {
  switch (strategy) {
  case Strategy::kGreedy:
    return "GREEDY";
  case Strategy::kDimensionFocus:
    return "DIMENSION_FOCUS";
  case Strategy::kSegmentExplore:
    return "SEGMENT_EXPLORE";
  case Strategy::kCrossPollinate:
    return "CROSS_POLLINATE";
  case Strategy::kRandomSubset:
    return "RANDOM_SUBSET";
  }
  return "GREEDY";
}

bool ParseStrategy(std::string_view text, Strategy& strategy) {
  for (const Strategy candidate :
       {Strategy::kGreedy, Strategy::kDimensionFocus, Strategy::kSegmentExplore,
        Strategy::kCrossPollinate, Strategy::kRandomSubset}) {
    if (text == ToString(candidate)) {
      strategy = candidate;
      return true;
    }
  }
  return false;
}

std::vector<Strategy> SelectStrategies(std::uint32_t /*round*/, int plateau_level,
                                       std::uint32_t beam_width) {
  if (beam_width <= 1U) {
    return {Strategy::kGreedy};
  }
  switch (plateau_level) {
  case 0:
    return {Strategy::kGreedy, Strategy::kDimensionFocus};
  case 1:
    return {Strategy::kGreedy, Strategy::kSegmentExplore};
  case 2:
    return {Strategy::kCrossPollinate, Strategy::kDimensionFocus};
  default:
    return {Strategy::kRandomSubset, Strategy::kSegmentExplore};
  }
}

int DetectPlateauLevel(const std::vector<RoundRecord>& rounds, double threshold,
                       std::uint32_t rounds_before_escape) {
  if (rounds.size() < 2U) {
    return 0;
  }

  std::uint32_t flat_run = 0;
  for (std::size_t i = rounds.size() - 1U; i >= 1U; --i) {
    const auto& delta = rounds[i].score_delta;
    if (delta.has_value() && std::fabs(delta.value()) >= threshold) {
      break;
    }
    ++flat_run;
  }

  if (flat_run == 0U) {
    return 0;
  }
  if (flat_run < rounds_before_escape) {
    return 1;
  }
  if (flat_run < rounds_before_escape * 2U) {
    return 2;
  }
  return 3;
}

eval::ScoreDimension FindWeakestDimension(const std::vector<RoundRecord>& rounds) {
  if (rounds.empty()) {
    return eval::ScoreDimension::kFunctionalCorrectness;
  }

  const auto& latest = rounds.back().score_breakdown;
  eval::ScoreDimension weakest = eval::ScoreDimension::kFunctionalCorrectness;
  double lowest_ratio = std::numeric_limits<double>::infinity();
  for (const auto& info : eval::kScoreDimensions) {
    const double ratio = latest[static_cast<std::size_t>(info.dimension)] / info.max;
    if (ratio < lowest_ratio) {
      lowest_ratio = ratio;
      weakest = info.dimension;
    }
  }
  return weakest;
}

} // namespace skillbench::iteration
