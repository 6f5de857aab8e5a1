#include "collab/recompose_service.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>
#include <utility>

namespace skillbench::collab {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;
using iteration::Strategy;

constexpr std::string_view kRecomposeRules = R"([Recomposition rules]
1. Keep every selected segment in full; do not cut or rewrite its core meaning.
2. Merge the strongest constraints the skills show for robustness, readability and the other dimensions.
3. Unify the output-format description and remove contradictions and redundancy.
4. Keep the instructions clear and concise; do not pile up requirements.
5. The result must be a complete prompt that can be used as is, without notes or commentary.
)";

constexpr std::string_view kRecomposeOutput = R"([Output]
Reply with the complete recomposed skill prompt text only, without explanations, headings or a JSON wrapper.
)";

std::string SignedDelta(double delta) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << (delta >= 0.0 ? "+" : "") << delta;
  return out.str();
}

std::string OneDecimal(double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << value;
  return out.str();
}

std::string TrimTrailingWhitespace(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ' ||
                           text.back() == '\t')) {
    text.pop_back();
  }
  return text;
}

core::json::Value BuildProvenance(const std::string& project_id,
                                  const store::ProjectConfig& config,
                                  const AnalysisReport& report,
                                  const iteration::SkillDraft& draft) {
  // Source skills in first-appearance order with the segments they supplied.
  std::vector<std::string> order;
  std::map<std::string, core::json::Value> sources;
  for (const auto& segment : report.advantage_segments) {
    auto it = sources.find(segment.skill_id);
    if (it == sources.end()) {
      const store::SkillRef* ref = config.FindSkill(segment.skill_id);
      core::json::Value source = core::json::MakeObject();
      source.object_value["skill_id"] = core::json::MakeString(segment.skill_id);
      source.object_value["skill_name"] = core::json::MakeString(segment.skill_name);
      source.object_value["skill_version"] =
          core::json::MakeString(ref != nullptr ? ref->version : std::string("v1"));
      source.object_value["contributed_segments"] = core::json::MakeArray();
      it = sources.emplace(segment.skill_id, std::move(source)).first;
      order.push_back(segment.skill_id);
    }
    it->second.object_value["contributed_segments"].array_value.push_back(
        core::json::MakeString(segment.id));
  }

  core::json::Value root = core::json::MakeObject();
  auto& fields = root.object_value;
  fields["type"] = core::json::MakeString("recomposed");
  fields["source_project_id"] = core::json::MakeString(project_id);
  fields["source_project_name"] = core::json::MakeString(config.name);
  fields["recomposition_strategy"] = core::json::MakeString(iteration::ToString(draft.strategy));
  fields["user_retention_rules"] = core::json::MakeString(draft.retention_rules);
  core::json::Value source_skills = core::json::MakeArray();
  for (const auto& skill_id : order) {
    source_skills.array_value.push_back(std::move(sources[skill_id]));
  }
  fields["source_skills"] = std::move(source_skills);
  fields["created_at"] = core::json::MakeString(core::NowUtcTimestamp());
  return root;
}

} // namespace

std::vector<eval::ScoreDimension> DetectStagnantDimensions(
    const std::vector<iteration::RoundRecord>& history) {
  std::vector<eval::ScoreDimension> stagnant;
  if (history.size() < 2U) {
    return stagnant;
  }
  const auto& previous = history[history.size() - 2U].score_breakdown;
  const auto& latest = history.back().score_breakdown;
  for (const auto& info : eval::kScoreDimensions) {
    const auto index = static_cast<std::size_t>(info.dimension);
    if (latest[index] <= previous[index]) {
      stagnant.push_back(info.dimension);
    }
  }
  return stagnant;
}

std::string BuildScoreHistoryTail(const std::vector<iteration::RoundRecord>& history,
                                  Strategy strategy,
                                  const std::optional<eval::ScoreDimension>& focus) {
  if (history.empty()) {
    return "";
  }

  std::ostringstream tail;
  tail << "[Score history]\n";
  for (const auto& round : history) {
    tail << "Round " << round.round << " (" << iteration::ToString(round.strategy)
         << "): total " << OneDecimal(round.avg_score);
    if (round.score_delta.has_value()) {
      tail << " (" << SignedDelta(round.score_delta.value()) << ")";
    }
    tail << "  ";
    for (std::size_t i = 0; i < eval::kDimensionCount; ++i) {
      if (i > 0U) {
        tail << " | ";
      }
      tail << eval::kScoreDimensions[i].key << " "
           << core::FormatJsonNumber(round.score_breakdown[i]);
    }
    tail << "\n";
  }
  tail << "\n";

  switch (strategy) {
  case Strategy::kDimensionFocus:
    if (focus.has_value()) {
      tail << "Strategy this round: DIMENSION_FOCUS, improve \"" << eval::ToString(focus.value())
           << "\".\nStrengthen the instructions or constraints behind that dimension without "
              "giving up the others.\n";
    }
    break;
  case Strategy::kSegmentExplore:
    tail << "Strategy this round: SEGMENT_EXPLORE, bring in advantage segments that earlier "
            "rounds did not use.\nIntegrate them with the existing text instead of appending "
            "them.\n";
    break;
  case Strategy::kCrossPollinate:
    tail << "Strategy this round: CROSS_POLLINATE, take the best structure from several "
            "source skills.\nRevisit the source segments without keeping the previous round's "
            "prompt structure.\n";
    break;
  case Strategy::kRandomSubset:
    tail << "Strategy this round: RANDOM_SUBSET, rebuild from a different subset of the "
            "advantage segments.\n";
    break;
  case Strategy::kGreedy:
    break;
  }

  const std::vector<eval::ScoreDimension> stagnant = DetectStagnantDimensions(history);
  if (!stagnant.empty()) {
    tail << "Stagnant dimensions (no gain over the last two rounds): ";
    for (std::size_t i = 0; i < stagnant.size(); ++i) {
      tail << (i > 0U ? ", " : "") << eval::ToString(stagnant[i]);
    }
    tail << "\nFocus this round on these dimensions.\n";
  }
  return tail.str();
}

std::string BuildRecomposePrompt(const AnalysisReport& report, const eval::Summary& summary,
                                 const iteration::RecomposeRequest& request,
                                 std::vector<AdvantageSegment>& selected) {
  selected.clear();
  for (const auto& segment : report.advantage_segments) {
    const auto& ids = request.selected_segment_ids;
    if (ids.empty() || std::find(ids.begin(), ids.end(), segment.id) != ids.end()) {
      selected.push_back(segment);
    }
  }

  std::ostringstream prompt;
  prompt << "You are an expert prompt engineer. Merge the advantage segments of the skills "
            "below into one better skill prompt, following the user's retention rules.\n\n";

  prompt << "[Source skills]\n";
  std::set<std::string> seen;
  for (const auto& segment : selected) {
    if (!seen.insert(segment.skill_id).second) {
      continue;
    }
    const eval::SummaryEntry* entry = summary.FindSkill(segment.skill_id);
    prompt << "- " << segment.skill_name << " (overall score "
           << core::FormatJsonNumber(entry != nullptr ? entry->avg_score : 0.0) << ")\n";
  }
  if (seen.empty()) {
    prompt << "no source information\n";
  }

  prompt << "\n[Selected advantage segments]\n";
  if (selected.empty()) {
    prompt << "no segments selected\n";
  }
  for (std::size_t i = 0; i < selected.size(); ++i) {
    prompt << (i > 0U ? "\n" : "") << "Segment " << (i + 1U) << " (from "
           << selected[i].skill_name << ", type " << selected[i].type << "):\n"
           << selected[i].content << "\n";
  }

  prompt << "\n[Retention rules]\n"
         << (request.retention_rules.empty() ? std::string("no special requirements")
                                             : request.retention_rules)
         << "\n\n"
         << kRecomposeRules << "\n";

  const std::string tail =
      BuildScoreHistoryTail(request.score_history, request.strategy, request.focus_dimension);
  if (!tail.empty()) {
    prompt << tail << "\n";
  }
  prompt << kRecomposeOutput;
  return prompt.str();
}

RecomposeService::RecomposeService(std::shared_ptr<store::ProjectStore> store,
                                   std::shared_ptr<oracle::IOracleClient> oracle,
                                   OracleCallSettings settings, core::logging::Logger logger)
    : store_(std::move(store)), oracle_(std::move(oracle)), settings_(std::move(settings)),
      library_(store_->workspace().root()), logger_(logger.WithComponent("recompose")) {}

RecomposeService::~RecomposeService() {
  WaitIdle();
}

bool RecomposeService::ExecuteRecompose(const std::string& project_id,
                                        const iteration::RecomposeRequest& request,
                                        RecomposeCallback on_complete, std::string& task_id,
                                        ErrorInfo& error) {
  std::filesystem::path project_dir;
  if (!store_->FindProjectDir(project_id, project_dir, error)) {
    return false;
  }
  task_id = core::MakeRandomUuid();

  workers_.Launch([this, project_id, request, task_id, on_complete = std::move(on_complete)]() {
    RecomposeCompletion completion;
    ErrorInfo recompose_error;
    if (!Recompose(project_id, request, completion, recompose_error)) {
      completion = RecomposeCompletion{};
      completion.error = core::errors::Describe(recompose_error);
    }
    completion.project_id = project_id;
    completion.task_id = task_id;
    if (on_complete) {
      on_complete(completion);
    }
  });
  return true;
}

bool RecomposeService::Recompose(const std::string& project_id,
                                 const iteration::RecomposeRequest& request,
                                 RecomposeCompletion& completion, ErrorInfo& error) const {
  store::ProjectConfig config;
  if (!store_->LoadProject(project_id, config, error)) {
    return false;
  }
  AnalysisReport report;
  if (!LoadAnalysisReport(config.project_dir, report, error)) {
    logger_.Error("recompose failed", {{"project_id", project_id},
                                       {"error_code", ToString(error.code)},
                                       {"error", error.message}});
    return false;
  }
  eval::Summary summary;
  std::string summary_error;
  if (!eval::LoadSummary(config.project_dir, summary, summary_error)) {
    logger_.Warn("summary unavailable for recompose",
                 {{"project_id", project_id}, {"error", summary_error}});
  }

  std::vector<AdvantageSegment> selected;
  const std::string prompt = BuildRecomposePrompt(report, summary, request, selected);

  oracle::GenerateOptions options;
  options.working_dir = config.project_dir / ".claude";
  options.timeout = settings_.timeout;
  options.model = config.cli.model.empty() ? settings_.model : config.cli.model;

  oracle::GenerateResult result;
  oracle::OracleError oracle_error;
  if (!oracle_->Generate(prompt, options, result, oracle_error)) {
    core::errors::SetError(error, ErrorCode::kOracleFailure,
                           std::string(oracle::ToString(oracle_error.kind)) + ": " +
                               oracle_error.message);
    logger_.Error("recompose failed", {{"project_id", project_id},
                                       {"strategy", iteration::ToString(request.strategy)},
                                       {"error_code", oracle::ToString(oracle_error.kind)},
                                       {"error", oracle_error.message}});
    return false;
  }

  completion.content = TrimTrailingWhitespace(result.text);
  if (completion.content.empty()) {
    core::errors::SetError(error, ErrorCode::kOracleFailure,
                           "oracle returned empty skill content");
    logger_.Error("recompose failed",
                  {{"project_id", project_id}, {"error", error.message}});
    return false;
  }

  std::set<std::string> sources;
  for (const auto& segment : selected) {
    sources.insert(segment.skill_id);
  }
  completion.succeeded = true;
  completion.segment_count = selected.size();
  completion.source_skill_count = sources.size();
  logger_.Info("recompose completed",
               {{"project_id", project_id},
                {"strategy", iteration::ToString(request.strategy)},
                {"segments", std::to_string(completion.segment_count)},
                {"source_skills", std::to_string(completion.source_skill_count)}});
  return true;
}

bool RecomposeService::SaveRecomposedSkill(const std::string& project_id,
                                           const std::string& content,
                                           const iteration::SkillDraft& draft,
                                           std::string& skill_id, ErrorInfo& error) {
  store::ProjectConfig config;
  if (!store_->LoadProject(project_id, config, error)) {
    return false;
  }

  store::SkillMeta meta;
  meta.name = draft.name;
  meta.purpose = draft.purpose;
  meta.provider = draft.provider;
  meta.source = "recomposed";
  std::filesystem::path skill_dir;
  if (!library_.SaveSkill(content, meta, skill_id, skill_dir, error)) {
    return false;
  }

  // A missing report only leaves the source list empty.
  AnalysisReport report;
  ErrorInfo report_error;
  if (!LoadAnalysisReport(config.project_dir, report, report_error)) {
    logger_.Warn("provenance written without analysis sources",
                 {{"project_id", project_id}, {"error", report_error.message}});
  }

  std::string write_error;
  if (!core::WriteJsonFileAtomic(skill_dir / "provenance.json",
                                 BuildProvenance(project_id, config, report, draft),
                                 write_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, write_error);
    return false;
  }

  logger_.Info("recomposed skill saved",
               {{"project_id", project_id}, {"skill_id", skill_id}, {"name", draft.name}});
  return true;
}

void RecomposeService::WaitIdle() {
  workers_.WaitIdle();
}

} // namespace skillbench::collab
