#pragma once

#include "core/json_dom.hpp"
#include "eval/score.hpp"
#include "iteration/stop_conditions.hpp"
#include "iteration/strategy.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skillbench::iteration {

// One beam candidate. A failed candidate has no skill id or score, only an
// error.
struct CandidateOutcome {
  Strategy strategy = Strategy::kGreedy;
  std::string skill_id;
  std::optional<double> avg_score;
  eval::DimensionScores score_breakdown{};
  bool won = false;
  std::string error;
};

struct ExplorationRound {
  std::uint32_t round = 0;
  int plateau_level = 0;
  std::vector<Strategy> strategies_tried;
  std::vector<CandidateOutcome> candidates;
  // Empty when every candidate failed.
  std::string winner_skill_id;
};

struct BestRound {
  std::uint32_t round = 1;
  Strategy strategy = Strategy::kGreedy;
  std::string skill_id;
  std::string skill_name;
  double avg_score = 0.0;
};

struct ExplorationParams {
  std::uint32_t max_rounds = 3;
  std::uint32_t beam_width = 1;
  double plateau_threshold = 1.0;
  std::optional<double> stop_threshold;
};

// Full candidate history, `iterations/exploration_log.json`.
struct ExplorationLog {
  std::string project_id;
  std::string started_at;
  ExplorationParams params;
  std::vector<std::string> original_skill_ids;
  std::vector<ExplorationRound> rounds;
  BestRound best_ever;
  std::string completed_at;
};

// Final iteration run, `iterations/iteration_report.json`. Written once at
// loop exit.
struct IterationReport {
  std::string project_id;
  std::string generated_at;
  StopReason stop_reason = StopReason::kMaxRounds;
  std::optional<double> stop_threshold;
  BestRound best;
  std::vector<RoundRecord> rounds;
};

// Highest average among `rounds` (earliest wins ties); round 1 of
// `fallback_skill_id` with score 0 when no round completed.
BestRound SelectBestRound(const std::vector<RoundRecord>& rounds,
                          const std::string& fallback_skill_id);

core::json::Value RoundRecordToJson(const RoundRecord& record);
core::json::Value ExplorationLogToJson(const ExplorationLog& log);
core::json::Value IterationReportToJson(const IterationReport& report);

} // namespace skillbench::iteration
