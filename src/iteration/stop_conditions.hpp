#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace skillbench::iteration {

// Why an iteration loop ended. The order below is the evaluation priority
// when several conditions hold at one round boundary.
enum class StopReason {
  kContinue,
  kManual,
  kPaused,
  kThresholdReached,
  kMaxRounds,
  // Set by the loop itself when a round step fails.
  kError,
};

// Stable string form used in reports and logs.
const char* ToString(StopReason reason);
bool ParseStopReason(std::string_view text, StopReason& reason);

struct StopInput {
  bool stop_requested = false;
  bool pause_requested = false;
  // Last finished round; 0 before the first round.
  std::uint32_t completed_round = 0;
  std::uint32_t max_rounds = 0;
  // Score of the last finished round, unset before the first round.
  std::optional<double> avg_score;
  std::optional<double> stop_threshold;
};

struct StopDecision {
  bool should_stop = false;
  StopReason reason = StopReason::kContinue;
  std::string explanation;
};

// Evaluates the round-boundary stop decision in fixed priority order:
// 1) manual stop request
// 2) pause request
// 3) stop threshold met by the last round
// 4) max rounds exhausted
//
// Contract:
// - true: decision is valid and `error` is empty.
// - false: input invalid; `error` explains why.
bool EvaluateStopConditions(const StopInput& input, StopDecision& decision, std::string& error);

} // namespace skillbench::iteration
