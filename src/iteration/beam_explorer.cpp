#include "iteration/beam_explorer.hpp"

#include "core/json_utils.hpp"
#include "eval/summary.hpp"

#include <algorithm>
#include <limits>
#include <utility>

namespace skillbench::iteration {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

// Summary entry for a freshly tested candidate: its own id first, then the
// first non-original skill.
const eval::SummaryEntry* FindCandidateEntry(const eval::Summary& summary,
                                             const std::string& skill_id,
                                             const std::vector<std::string>& original_ids) {
  if (const auto* entry = summary.FindSkill(skill_id); entry != nullptr) {
    return entry;
  }
  for (const auto& entry : summary.ranking) {
    if (std::find(original_ids.begin(), original_ids.end(), entry.skill_id) ==
        original_ids.end()) {
      return &entry;
    }
  }
  return nullptr;
}

} // namespace

BeamExplorer::BeamExplorer(IterationPorts ports, core::logging::Logger logger)
    : ports_(std::move(ports)), logger_(logger.WithComponent("beam-explorer")) {}

bool BeamExplorer::Explore(const ExploreRequest& request, const HaltFlags& halt,
                           ExplorationRound& log, ErrorInfo& error) const {
  log = ExplorationRound{};
  log.round = request.round;
  log.plateau_level = request.plateau_level;
  log.strategies_tried =
      SelectStrategies(request.round, request.plateau_level, request.beam_width);
  const eval::ScoreDimension focus = FindWeakestDimension(request.history);

  const std::string round_text = std::to_string(request.round);
  logger_.Info("beam exploration started",
               {{"project_id", request.project_id},
                {"round", round_text},
                {"plateau_level", std::to_string(request.plateau_level)},
                {"candidates", std::to_string(log.strategies_tried.size())},
                {"focus_dimension", eval::ToString(focus)}});

  double best_score = -std::numeric_limits<double>::infinity();
  std::size_t best_index = 0;
  bool have_winner = false;
  for (std::size_t i = 0; i < log.strategies_tried.size(); ++i) {
    if (halt.Halted()) {
      logger_.Info("beam exploration halted between candidates",
                   {{"project_id", request.project_id}, {"round", round_text}});
      break;
    }

    const Strategy strategy = log.strategies_tried[i];
    CandidateOutcome outcome;
    outcome.strategy = strategy;
    ErrorInfo candidate_error;
    if (!RunCandidate(request, i + 1U, strategy, focus, outcome, candidate_error)) {
      outcome.skill_id.clear();
      outcome.avg_score.reset();
      outcome.error = core::errors::Describe(candidate_error);
      logger_.Warn("beam candidate failed", {{"project_id", request.project_id},
                                             {"round", round_text},
                                             {"strategy", ToString(strategy)},
                                             {"error_code", ToString(candidate_error.code)},
                                             {"error", candidate_error.message}});
      log.candidates.push_back(std::move(outcome));
      continue;
    }

    logger_.Info("beam candidate scored",
                 {{"project_id", request.project_id},
                  {"round", round_text},
                  {"strategy", ToString(strategy)},
                  {"skill_id", outcome.skill_id},
                  {"avg_score", core::FormatJsonNumber(outcome.avg_score.value_or(0.0))}});
    if (outcome.avg_score.value_or(0.0) > best_score) {
      best_score = outcome.avg_score.value_or(0.0);
      best_index = log.candidates.size();
      have_winner = true;
    }
    log.candidates.push_back(std::move(outcome));
  }

  if (!have_winner) {
    logger_.Warn("all beam candidates failed; carrying previous skill forward",
                 {{"project_id", request.project_id}, {"round", round_text}});
    return true;
  }

  log.candidates[best_index].won = true;
  log.winner_skill_id = log.candidates[best_index].skill_id;

  // Later candidates replaced the winner in the project config.
  if (!ports_.registry->RegisterCandidate(request.project_id, log.winner_skill_id,
                                          request.round + 1U, error)) {
    return false;
  }
  logger_.Info("beam winner selected", {{"project_id", request.project_id},
                                        {"next_round", std::to_string(request.round + 1U)},
                                        {"skill_id", log.winner_skill_id},
                                        {"avg_score", core::FormatJsonNumber(best_score)}});
  return true;
}

bool BeamExplorer::RunCandidate(const ExploreRequest& request, std::size_t candidate_number,
                                Strategy strategy, eval::ScoreDimension focus,
                                CandidateOutcome& outcome, ErrorInfo& error) const {
  RecomposeRequest recompose;
  recompose.strategy = strategy;
  if (strategy == Strategy::kDimensionFocus) {
    recompose.focus_dimension = focus;
  }
  recompose.score_history = request.history;
  recompose.retention_rules = request.retention_rules;
  recompose.selected_segment_ids = request.selected_segment_ids;

  std::string content;
  if (!ports_.recompose->Recompose(request.project_id, recompose, content, error)) {
    return false;
  }

  const std::uint32_t next_round = request.round + 1U;
  SkillDraft draft;
  draft.name =
      "Iteration Skill v" + std::to_string(next_round) + "-c" + std::to_string(candidate_number);
  draft.strategy = strategy;
  draft.retention_rules = request.retention_rules;
  std::string skill_id;
  if (!ports_.recompose->SaveSkill(request.project_id, content, draft, skill_id, error)) {
    return false;
  }
  outcome.skill_id = skill_id;

  if (!ports_.registry->RegisterCandidate(request.project_id, skill_id, next_round, error) ||
      !ports_.test_run->RunTests(request.project_id, error)) {
    return false;
  }

  eval::Summary summary;
  std::string summary_error;
  if (!eval::LoadSummary(request.project_dir, summary, summary_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, summary_error);
    return false;
  }
  if (const auto* entry = FindCandidateEntry(summary, skill_id, request.original_skill_ids);
      entry != nullptr) {
    outcome.avg_score = entry->avg_score;
    outcome.score_breakdown = entry->score_breakdown;
  } else {
    outcome.avg_score = 0.0;
  }
  return true;
}

} // namespace skillbench::iteration
