#include "iteration/stop_conditions.hpp"

#include "core/json_utils.hpp"

#include <cmath>

namespace skillbench::iteration {

const char* ToString(StopReason reason) {
  switch (reason) {
  case StopReason::kContinue:
    return "continue";
  case StopReason::kManual:
    return "manual";
  case StopReason::kPaused:
    return "paused";
  case StopReason::kThresholdReached:
    return "threshold_reached";
  case StopReason::kMaxRounds:
    return "max_rounds";
  case StopReason::kError:
    return "error";
  }
  return "continue";
}

bool ParseStopReason(std::string_view text, StopReason& reason) {
  for (const StopReason candidate :
       {StopReason::kContinue, StopReason::kManual, StopReason::kPaused,
        StopReason::kThresholdReached, StopReason::kMaxRounds, StopReason::kError}) {
    if (text == ToString(candidate)) {
      reason = candidate;
      return true;
    }
  }
  return false;
}

bool EvaluateStopConditions(const StopInput& input, StopDecision& decision, std::string& error) {
  decision = StopDecision{};
  error.clear();

  if (input.max_rounds == 0U) {
    error = "max_rounds must be greater than 0";
    return false;
  }
  if (input.completed_round > input.max_rounds) {
    error = "completed_round exceeds max_rounds";
    return false;
  }
  if (input.stop_threshold.has_value() && !std::isfinite(input.stop_threshold.value())) {
    error = "stop_threshold must be finite";
    return false;
  }

  if (input.stop_requested) {
    decision.should_stop = true;
    decision.reason = StopReason::kManual;
    decision.explanation = "stop: manual stop requested";
    return true;
  }

  if (input.pause_requested) {
    decision.should_stop = true;
    decision.reason = StopReason::kPaused;
    decision.explanation = "stop: pause requested";
    return true;
  }

  if (input.stop_threshold.has_value() && input.avg_score.has_value() &&
      input.avg_score.value() >= input.stop_threshold.value()) {
    decision.should_stop = true;
    decision.reason = StopReason::kThresholdReached;
    decision.explanation = "stop: round " + std::to_string(input.completed_round) +
                           " average " + core::FormatJsonNumber(input.avg_score.value()) +
                           " reached threshold " +
                           core::FormatJsonNumber(input.stop_threshold.value());
    return true;
  }

  if (input.completed_round >= input.max_rounds) {
    decision.should_stop = true;
    decision.reason = StopReason::kMaxRounds;
    decision.explanation =
        "stop: reached max rounds (max_rounds=" + std::to_string(input.max_rounds) + ")";
    return true;
  }

  decision.explanation = "continue";
  return true;
}

} // namespace skillbench::iteration
