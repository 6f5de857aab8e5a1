#include "iteration/round_controller.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "eval/summary.hpp"

#include <algorithm>
#include <utility>

namespace skillbench::iteration {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

std::string RoundSkillName(std::uint32_t round) {
  return "Iteration Skill v" + std::to_string(round);
}

bool IsOriginal(const std::vector<std::string>& original_ids, const std::string& skill_id) {
  return std::find(original_ids.begin(), original_ids.end(), skill_id) != original_ids.end();
}

// Tested skill first, then the first non-original entry, then the top entry.
const eval::SummaryEntry* FindRoundEntry(const eval::Summary& summary,
                                         const std::string& skill_id,
                                         const std::vector<std::string>& original_ids) {
  if (const auto* entry = summary.FindSkill(skill_id); entry != nullptr) {
    return entry;
  }
  for (const auto& entry : summary.ranking) {
    if (!IsOriginal(original_ids, entry.skill_id)) {
      return &entry;
    }
  }
  return summary.ranking.empty() ? nullptr : &summary.ranking.front();
}

const char* StatusForStopReason(std::string_view reason) {
  if (reason == "manual") {
    return "stopped";
  }
  if (reason == "paused") {
    return "paused";
  }
  return "completed";
}

} // namespace

const char* ToString(IterationPhase phase) {
  switch (phase) {
  case IterationPhase::kIdle:
    return "idle";
  case IterationPhase::kTesting:
    return "test";
  case IterationPhase::kAnalyzing:
    return "analysis";
  case IterationPhase::kExploring:
    return "explore";
  }
  return "idle";
}

RoundController::RoundController(std::shared_ptr<store::ProjectStore> store,
                                 IterationPorts ports, core::logging::Logger logger)
    : store_(std::move(store)), ports_(ports), explorer_(ports, logger),
      logger_(logger.WithComponent("round-controller")) {}

RoundController::~RoundController() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [project_id, iteration] : iterations_) {
      iteration->halt.stop_requested.store(true);
    }
  }
  WaitIdle();
}

bool RoundController::StartIteration(const std::string& project_id,
                                     const IterationParams& params,
                                     IterationCallbacks callbacks, std::string& iteration_id,
                                     ErrorInfo& error) {
  if (params.initial_skill_id.empty()) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, "initial skill id is required");
    return false;
  }
  if (params.max_rounds == 0U) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, "max_rounds must be at least 1");
    return false;
  }
  if (params.plateau_rounds_before_escape.has_value() &&
      params.plateau_rounds_before_escape.value() == 0U) {
    core::errors::SetError(error, ErrorCode::kInvalidParams,
                           "plateau_rounds_before_escape must be at least 1");
    return false;
  }

  store::ProjectConfig config;
  if (!store_->LoadProject(project_id, config, error)) {
    return false;
  }

  auto iteration = std::make_shared<ActiveIteration>();
  iteration->project_id = project_id;
  iteration->iteration_id = core::MakeRandomUuid();
  iteration->project_dir = config.project_dir;
  iteration->original_skill_ids = config.original_skill_ids;
  iteration->initial_skill_configured = config.FindSkill(params.initial_skill_id) != nullptr;
  iteration->callbacks = std::move(callbacks);

  ResolvedParams& resolved = iteration->params;
  resolved.initial_skill_id = params.initial_skill_id;
  resolved.max_rounds = params.max_rounds;
  resolved.stop_threshold = params.stop_threshold;
  resolved.retention_rules = params.retention_rules;
  resolved.selected_segment_ids = params.selected_segment_ids;
  resolved.beam_width = params.beam_width.value_or(config.iteration.beam_width);
  resolved.plateau_threshold =
      params.plateau_threshold.value_or(config.iteration.plateau_threshold);
  resolved.plateau_rounds_before_escape = params.plateau_rounds_before_escape.value_or(
      config.iteration.plateau_rounds_before_escape);

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (iterations_.count(project_id) != 0U) {
      core::errors::SetError(error, ErrorCode::kAlreadyRunning,
                             "iteration already running for project: " + project_id);
      return false;
    }
    iterations_[project_id] = iteration;
  }

  iteration_id = iteration->iteration_id;
  logger_.Info("iteration started",
               {{"project_id", project_id},
                {"iteration_id", iteration_id},
                {"initial_skill_id", resolved.initial_skill_id},
                {"max_rounds", std::to_string(resolved.max_rounds)},
                {"beam_width", std::to_string(resolved.beam_width)},
                {"stop_threshold", resolved.stop_threshold.has_value()
                                       ? core::FormatJsonNumber(resolved.stop_threshold.value())
                                       : std::string("none")}});
  workers_.Launch([this, iteration]() { RunLoop(iteration); });
  return true;
}

bool RoundController::PauseIteration(const std::string& project_id, ErrorInfo& error) {
  const auto iteration = FindActive(project_id);
  if (iteration == nullptr) {
    core::errors::SetError(error, ErrorCode::kNotRunning,
                           "no iteration running for project: " + project_id);
    return false;
  }
  iteration->halt.pause_requested.store(true);
  logger_.Info("iteration pause requested",
               {{"project_id", project_id}, {"iteration_id", iteration->iteration_id}});
  return true;
}

bool RoundController::StopIteration(const std::string& project_id, ErrorInfo& error) {
  const auto iteration = FindActive(project_id);
  if (iteration == nullptr) {
    core::errors::SetError(error, ErrorCode::kNotRunning,
                           "no iteration running for project: " + project_id);
    return false;
  }
  iteration->halt.stop_requested.store(true);
  logger_.Info("iteration stop requested",
               {{"project_id", project_id}, {"iteration_id", iteration->iteration_id}});
  return true;
}

bool RoundController::GetProgress(const std::string& project_id, IterationProgress& progress,
                                  ErrorInfo& error) const {
  std::filesystem::path project_dir;
  if (!store_->FindProjectDir(project_id, project_dir, error)) {
    return false;
  }

  progress = IterationProgress{};
  progress.project_id = project_id;
  progress.rounds = store::ListRoundSnapshots(project_dir);
  progress.total_rounds = static_cast<std::uint32_t>(progress.rounds.size());

  const store::RoundSnapshot* running_round = nullptr;
  std::uint32_t completed_rounds = 0;
  for (const auto& snapshot : progress.rounds) {
    if (snapshot.status == "running" && running_round == nullptr) {
      running_round = &snapshot;
    } else if (snapshot.status == "completed") {
      ++completed_rounds;
    }
  }
  progress.current_round = running_round != nullptr ? running_round->round : completed_rounds;

  if (const auto iteration = FindActive(project_id); iteration != nullptr) {
    if (iteration->halt.stop_requested.load()) {
      progress.status = "stopped";
    } else if (iteration->halt.pause_requested.load()) {
      progress.status = "paused";
    } else {
      progress.status = "running";
    }
    progress.current_phase = ToString(iteration->phase.load());
    return true;
  }

  progress.current_phase = running_round != nullptr ? ToString(IterationPhase::kTesting)
                                                     : ToString(IterationPhase::kIdle);
  core::json::Value report;
  ErrorInfo report_error;
  if (store::LoadIterationDocument(store::IterationReportPath(project_dir), report,
                                   report_error)) {
    progress.status = StatusForStopReason(core::json::GetString(report, "stop_reason"));
  }
  return true;
}

bool RoundController::GetReport(const std::string& project_id, core::json::Value& report,
                                ErrorInfo& error) const {
  std::filesystem::path project_dir;
  if (!store_->FindProjectDir(project_id, project_dir, error)) {
    return false;
  }
  if (!store::LoadIterationDocument(store::IterationReportPath(project_dir), report, error)) {
    if (error.code == ErrorCode::kNotFound) {
      error.message = "iteration report not found; run an iteration first";
    }
    return false;
  }
  return true;
}

bool RoundController::GetExplorationLog(const std::string& project_id, core::json::Value& log,
                                        ErrorInfo& error) const {
  std::filesystem::path project_dir;
  if (!store_->FindProjectDir(project_id, project_dir, error)) {
    return false;
  }
  if (!store::LoadIterationDocument(store::ExplorationLogPath(project_dir), log, error)) {
    if (error.code == ErrorCode::kNotFound) {
      error.message = "exploration log not found; run an iteration first";
    }
    return false;
  }
  return true;
}

void RoundController::RunLoop(const std::shared_ptr<ActiveIteration>& iteration) {
  const ResolvedParams& params = iteration->params;
  std::vector<RoundRecord> rounds;
  ExplorationLog log;
  log.project_id = iteration->project_id;
  log.started_at = core::NowUtcTimestamp();
  log.params.max_rounds = params.max_rounds;
  log.params.beam_width = params.beam_width;
  log.params.plateau_threshold = params.plateau_threshold;
  log.params.stop_threshold = params.stop_threshold;
  log.original_skill_ids = iteration->original_skill_ids;

  ErrorInfo error;
  if (!store::ClearIterationDocuments(iteration->project_dir, error)) {
    Finish(iteration, StopReason::kError, core::errors::Describe(error), std::move(rounds),
           std::move(log));
    return;
  }
  if (!iteration->initial_skill_configured &&
      !ports_.registry->RegisterCandidate(iteration->project_id, params.initial_skill_id, 1U,
                                          error)) {
    Finish(iteration, StopReason::kError, core::errors::Describe(error), std::move(rounds),
           std::move(log));
    return;
  }

  std::string current_skill_id = params.initial_skill_id;
  Strategy current_strategy = Strategy::kGreedy;
  StopReason reason = StopReason::kMaxRounds;
  std::string error_message;

  for (;;) {
    StopInput input;
    input.stop_requested = iteration->halt.stop_requested.load();
    input.pause_requested = iteration->halt.pause_requested.load();
    input.completed_round = static_cast<std::uint32_t>(rounds.size());
    input.max_rounds = params.max_rounds;
    if (!rounds.empty()) {
      input.avg_score = rounds.back().avg_score;
    }
    input.stop_threshold = params.stop_threshold;

    StopDecision decision;
    std::string decision_error;
    if (!EvaluateStopConditions(input, decision, decision_error)) {
      reason = StopReason::kError;
      error_message = decision_error;
      break;
    }
    if (decision.should_stop) {
      reason = decision.reason;
      logger_.Info("iteration stopping", {{"project_id", iteration->project_id},
                                          {"reason", ToString(reason)},
                                          {"detail", decision.explanation}});
      break;
    }

    const std::uint32_t round = input.completed_round + 1U;
    RoundRecord record;
    record.strategy = current_strategy;
    if (!RunRound(*iteration, round, current_skill_id, record, error)) {
      reason = StopReason::kError;
      error_message = core::errors::Describe(error);
      logger_.Warn("round failed", {{"project_id", iteration->project_id},
                                    {"round", std::to_string(round)},
                                    {"error_code", ToString(error.code)},
                                    {"error", error.message}});
      break;
    }
    if (!rounds.empty()) {
      record.score_delta = record.avg_score - rounds.back().avg_score;
    }
    rounds.push_back(record);
    const int plateau_level = DetectPlateauLevel(rounds, params.plateau_threshold,
                                                 params.plateau_rounds_before_escape);

    logger_.Info("round completed",
                 {{"project_id", iteration->project_id},
                  {"round", std::to_string(round)},
                  {"skill_id", record.skill_id},
                  {"avg_score", core::FormatJsonNumber(record.avg_score)},
                  {"plateau_level", std::to_string(plateau_level)}});
    if (iteration->callbacks.on_round) {
      RoundEvent event;
      event.project_id = iteration->project_id;
      event.round = round;
      event.skill_id = record.skill_id;
      event.avg_score = record.avg_score;
      event.score_delta = record.score_delta;
      event.plateau_level = plateau_level;
      iteration->callbacks.on_round(event);
    }

    const bool threshold_met =
        params.stop_threshold.has_value() && record.avg_score >= params.stop_threshold.value();
    if (threshold_met || round >= params.max_rounds || iteration->halt.Halted()) {
      continue;
    }

    ExploreRequest request;
    request.project_id = iteration->project_id;
    request.project_dir = iteration->project_dir;
    request.round = round;
    request.plateau_level = plateau_level;
    request.beam_width = params.beam_width;
    request.history = rounds;
    request.retention_rules = params.retention_rules;
    request.selected_segment_ids = params.selected_segment_ids;
    request.original_skill_ids = iteration->original_skill_ids;

    iteration->phase.store(IterationPhase::kExploring);
    ExplorationRound explored;
    const bool explored_ok = explorer_.Explore(request, iteration->halt, explored, error);
    iteration->phase.store(IterationPhase::kIdle);
    log.rounds.push_back(explored);
    if (!explored_ok) {
      reason = StopReason::kError;
      error_message = core::errors::Describe(error);
      break;
    }
    for (const auto& candidate : explored.candidates) {
      if (candidate.won) {
        current_skill_id = candidate.skill_id;
        current_strategy = candidate.strategy;
      }
    }
  }

  Finish(iteration, reason, error_message, std::move(rounds), std::move(log));
}

bool RoundController::RunRound(ActiveIteration& iteration, std::uint32_t round,
                               const std::string& skill_id, RoundRecord& record,
                               ErrorInfo& error) {
  store::RoundSnapshot snapshot;
  snapshot.round = round;
  snapshot.skill_id = skill_id;
  snapshot.skill_name = RoundSkillName(round);
  snapshot.retention_rules = iteration.params.retention_rules;
  snapshot.started_at = core::NowUtcTimestamp();
  if (!store::WriteRoundSnapshot(iteration.project_dir, snapshot, error)) {
    return false;
  }

  const auto fail_round = [&]() {
    snapshot.status = "failed";
    snapshot.completed_at = core::NowUtcTimestamp();
    ErrorInfo snapshot_error;
    if (!store::WriteRoundSnapshot(iteration.project_dir, snapshot, snapshot_error)) {
      logger_.Warn("failed round snapshot not written",
                   {{"project_id", iteration.project_id},
                    {"round", std::to_string(round)},
                    {"error", snapshot_error.message}});
    }
    iteration.phase.store(IterationPhase::kIdle);
    return false;
  };

  iteration.phase.store(IterationPhase::kTesting);
  if (!ports_.test_run->RunTests(iteration.project_id, error)) {
    return fail_round();
  }
  iteration.phase.store(IterationPhase::kAnalyzing);
  if (!ports_.analysis->RunAnalysis(iteration.project_id, error)) {
    return fail_round();
  }
  iteration.phase.store(IterationPhase::kIdle);

  record.round = round;
  record.skill_id = skill_id;
  record.skill_name = snapshot.skill_name;
  if (!ReadRoundScore(iteration, skill_id, record, error)) {
    return fail_round();
  }

  snapshot.avg_score = record.avg_score;
  snapshot.completed_at = core::NowUtcTimestamp();
  snapshot.status = "completed";
  return store::WriteRoundSnapshot(iteration.project_dir, snapshot, error);
}

bool RoundController::ReadRoundScore(const ActiveIteration& iteration,
                                     const std::string& skill_id, RoundRecord& record,
                                     ErrorInfo& error) const {
  eval::Summary summary;
  std::string summary_error;
  if (!eval::LoadSummary(iteration.project_dir, summary, summary_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, summary_error);
    return false;
  }
  const auto* entry = FindRoundEntry(summary, skill_id, iteration.original_skill_ids);
  if (entry != nullptr) {
    record.avg_score = entry->avg_score;
    record.score_breakdown = entry->score_breakdown;
  }
  return true;
}

void RoundController::Finish(const std::shared_ptr<ActiveIteration>& iteration,
                             StopReason reason, const std::string& error_message,
                             std::vector<RoundRecord> rounds, ExplorationLog log) {
  const ResolvedParams& params = iteration->params;
  const BestRound best = SelectBestRound(rounds, params.initial_skill_id);

  log.best_ever = best;
  log.completed_at = core::NowUtcTimestamp();

  IterationOutcome outcome;
  outcome.project_id = iteration->project_id;
  outcome.iteration_id = iteration->iteration_id;
  outcome.stop_reason = reason;
  outcome.error = error_message;
  outcome.report.project_id = iteration->project_id;
  outcome.report.generated_at = log.completed_at;
  outcome.report.stop_reason = reason;
  outcome.report.stop_threshold = params.stop_threshold;
  outcome.report.best = best;
  outcome.report.rounds = std::move(rounds);

  ErrorInfo write_error;
  if (!store::WriteIterationDocument(store::ExplorationLogPath(iteration->project_dir),
                                     ExplorationLogToJson(log), write_error) ||
      !store::WriteIterationDocument(store::IterationReportPath(iteration->project_dir),
                                     IterationReportToJson(outcome.report), write_error)) {
    logger_.Error("iteration documents not written",
                  {{"project_id", iteration->project_id},
                   {"error_code", ToString(write_error.code)},
                   {"error", write_error.message}});
    if (outcome.error.empty()) {
      outcome.error = core::errors::Describe(write_error);
    }
  }

  logger_.Info("iteration finished",
               {{"project_id", iteration->project_id},
                {"iteration_id", iteration->iteration_id},
                {"stop_reason", ToString(reason)},
                {"total_rounds", std::to_string(outcome.report.rounds.size())},
                {"best_round", std::to_string(best.round)},
                {"best_avg_score", core::FormatJsonNumber(best.avg_score)}});

  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = iterations_.find(iteration->project_id);
    if (it != iterations_.end() && it->second == iteration) {
      iterations_.erase(it);
    }
  }
  if (iteration->callbacks.on_complete) {
    iteration->callbacks.on_complete(outcome);
  }
}

std::shared_ptr<RoundController::ActiveIteration> RoundController::FindActive(
    const std::string& project_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = iterations_.find(project_id);
  return it == iterations_.end() ? nullptr : it->second;
}

void RoundController::WaitIdle() {
  workers_.WaitIdle();
}

} // namespace skillbench::iteration
