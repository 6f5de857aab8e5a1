#pragma once

#include "eval/score.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::iteration {

// Recompose directions handed to the recompose collaborator.
enum class Strategy {
  kGreedy,
  kDimensionFocus,
  kSegmentExplore,
  kCrossPollinate,
  kRandomSubset,
};

const char* ToString(Strategy strategy);
bool ParseStrategy(std::string_view text, Strategy& strategy);

// One completed round of the iteration loop. Also the score-history element
// passed to recomposition.
struct RoundRecord {
  std::uint32_t round = 0;
  // Strategy of the candidate that produced this round's skill. Round 1 is
  // always GREEDY.
  Strategy strategy = Strategy::kGreedy;
  std::string skill_id;
  std::string skill_name;
  double avg_score = 0.0;
  // Unset for the first round.
  std::optional<double> score_delta;
  eval::DimensionScores score_breakdown{};
};

// `[GREEDY]` for beam_width <= 1; otherwise two strategies chosen by plateau
// level:
//   0 -> GREEDY, DIMENSION_FOCUS
//   1 -> GREEDY, SEGMENT_EXPLORE
//   2 -> CROSS_POLLINATE, DIMENSION_FOCUS
//   3 -> RANDOM_SUBSET, SEGMENT_EXPLORE
std::vector<Strategy> SelectStrategies(std::uint32_t round, int plateau_level,
                                       std::uint32_t beam_width);

// Length of the trailing run of flat rounds (round 1 excluded), mapped to a
// level: none 0, run < limit 1, run < 2 x limit 2, else 3. A round without a
// delta counts as flat.
int DetectPlateauLevel(const std::vector<RoundRecord>& rounds, double threshold,
                       std::uint32_t rounds_before_escape);

// Dimension with the lowest achieved/max ratio in the newest round; ties go
// to the earlier dimension. No rounds -> functional_correctness.
eval::ScoreDimension FindWeakestDimension(const std::vector<RoundRecord>& rounds);

} // namespace skillbench::iteration
