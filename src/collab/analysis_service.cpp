#include "collab/analysis_service.hpp"

#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "eval/score.hpp"
#include "oracle/structured_output.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>

namespace skillbench::collab {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

constexpr std::size_t kTopDiffCases = 3;

constexpr std::string_view kAnalysisRequirements = R"([Requirements]
1. Name the skill with the best overall performance (best_skill_id).
2. Name the leading skill for every scoring dimension (dimension_leaders).
3. Extract at least three concrete advantage segments from the skill prompts. Each
   segment names its skill, its type, the verbatim text, the dimension it helps and why.
   Segment types: instruction | constraint | format | role | example
4. List concrete weaknesses of each skill on a dimension (issues).

Reply with JSON only, no prose and no markdown fences.

Reply format:
{
  "best_skill_id": "<skill id>",
  "best_skill_name": "<skill name>",
  "dimension_leaders": {
    "functional_correctness": "<skill id>",
    "robustness": "<skill id>",
    "readability": "<skill id>",
    "conciseness": "<skill id>",
    "complexity_control": "<skill id>",
    "format_compliance": "<skill id>"
  },
  "advantage_segments": [
    {
      "id": "seg_001",
      "skill_id": "<skill id>",
      "skill_name": "<skill name>",
      "type": "role|instruction|constraint|format|example",
      "content": "<verbatim prompt fragment>",
      "reason": "<why it stands out>",
      "dimension": "<dimension key>"
    }
  ],
  "issues": [
    {
      "skill_id": "<skill id>",
      "skill_name": "<skill name>",
      "dimension": "<dimension key>",
      "description": "<concrete weakness>"
    }
  ]
}
)";

struct CaseSpread {
  std::string case_id;
  std::map<std::string, double> totals;
  double spread = 0.0;
};

std::vector<CaseSpread> WidestSpreads(const store::ProjectConfig& config,
                                      const std::vector<eval::ResultRecord>& records) {
  std::map<std::string, CaseSpread> by_case;
  for (const auto& record : records) {
    if (!record.score.has_value() || config.FindSkill(record.skill_id) == nullptr) {
      continue;
    }
    CaseSpread& spread = by_case[record.case_id];
    spread.case_id = record.case_id;
    spread.totals[record.skill_id] = record.score->total;
  }

  std::vector<CaseSpread> spreads;
  for (auto& [case_id, spread] : by_case) {
    if (spread.totals.size() < 2U) {
      continue;
    }
    double low = spread.totals.begin()->second;
    double high = low;
    for (const auto& [skill_id, total] : spread.totals) {
      low = std::min(low, total);
      high = std::max(high, total);
    }
    spread.spread = high - low;
    spreads.push_back(std::move(spread));
  }
  std::stable_sort(spreads.begin(), spreads.end(),
                   [](const CaseSpread& a, const CaseSpread& b) { return a.spread > b.spread; });
  if (spreads.size() > kTopDiffCases) {
    spreads.resize(kTopDiffCases);
  }
  return spreads;
}

std::string RoleTag(const store::ProjectConfig& config, const std::string& skill_id) {
  if (config.original_skill_ids.empty()) {
    return "";
  }
  return config.IsOriginalSkill(skill_id) ? " [original]" : " [iteration candidate]";
}

} // namespace

std::string BuildAnalysisPrompt(const store::ProjectConfig& config, const eval::Summary& summary,
                                const std::map<std::string, std::string>& skill_contents,
                                const std::vector<eval::ResultRecord>& records) {
  std::ostringstream prompt;
  prompt << "You are an expert prompt engineer for code generation. Compare the test results "
            "of the skills below, identify the advantage segments and the weaknesses of each "
            "skill, and produce a structured analysis report.\n\n";

  prompt << "[Baseline]\nName: "
         << (config.baselines.empty() ? std::string("unknown") : config.baselines.front().name)
         << "\nCases: " << summary.total_cases << "\n\n";

  bool has_candidate = false;
  for (const auto& skill : config.skills) {
    has_candidate = has_candidate || !config.IsOriginalSkill(skill.ref_id);
  }
  if (!config.original_skill_ids.empty() && has_candidate) {
    prompt << "[Iteration context]\nThis run contains original reference skills and the "
              "current iteration candidate. Prefer segments where the candidate improved on "
              "the originals; where the candidate is still worse on a dimension, say so in "
              "issues.\n\n";
  }

  prompt << "[Skill prompts]\n";
  for (std::size_t i = 0; i < config.skills.size(); ++i) {
    const auto& skill = config.skills[i];
    if (i > 0U) {
      prompt << "\n---\n\n";
    }
    const auto content = skill_contents.find(skill.ref_id);
    prompt << "Skill: " << skill.name << RoleTag(config, skill.ref_id) << " (ID: " << skill.ref_id
           << ")\n"
           << (content == skill_contents.end() ? std::string() : content->second) << "\n";
  }

  prompt << "\n[Score summary]\n";
  for (const auto& entry : summary.ranking) {
    prompt << "- " << entry.skill_name << RoleTag(config, entry.skill_id)
           << " (ID: " << entry.skill_id
           << "): average total " << core::FormatJsonNumber(entry.avg_score) << ", completed "
           << entry.completed_cases << "/" << summary.total_cases;
    if (entry.failed_cases > 0U) {
      prompt << " (" << entry.failed_cases << " failed)";
    }
    prompt << "\n";
  }

  prompt << "\n[Dimension averages]\ndimension";
  for (const auto& entry : summary.ranking) {
    prompt << "\t" << entry.skill_name;
  }
  prompt << "\n" << std::fixed << std::setprecision(1);
  for (const auto& info : eval::kScoreDimensions) {
    prompt << info.key << "(" << static_cast<int>(info.max) << ")";
    for (const auto& entry : summary.ranking) {
      prompt << "\t" << entry.score_breakdown[static_cast<std::size_t>(info.dimension)];
    }
    prompt << "\n";
  }
  prompt.unsetf(std::ios_base::floatfield);

  prompt << "\n[Cases with the widest score spread]\n";
  const std::vector<CaseSpread> spreads = WidestSpreads(config, records);
  if (spreads.empty()) {
    prompt << "not enough data to compare\n";
  }
  for (const auto& spread : spreads) {
    prompt << "Case " << spread.case_id << ":\n";
    for (const auto& skill : config.skills) {
      const auto total = spread.totals.find(skill.ref_id);
      prompt << "  " << skill.name << " (total "
             << (total == spread.totals.end() ? std::string("N/A")
                                              : core::FormatJsonNumber(total->second))
             << ")\n";
    }
  }

  prompt << "\n" << kAnalysisRequirements;
  return prompt.str();
}

AnalysisService::AnalysisService(std::shared_ptr<store::ProjectStore> store,
                                 std::shared_ptr<oracle::IOracleClient> oracle,
                                 OracleCallSettings settings, core::logging::Logger logger)
    : store_(std::move(store)), oracle_(std::move(oracle)), settings_(std::move(settings)),
      logger_(logger.WithComponent("analysis")) {}

AnalysisService::~AnalysisService() {
  WaitIdle();
}

bool AnalysisService::RunAnalysis(const std::string& project_id, AnalysisCallback on_complete,
                                  std::string& task_id, ErrorInfo& error) {
  std::filesystem::path project_dir;
  if (!store_->FindProjectDir(project_id, project_dir, error)) {
    return false;
  }
  task_id = core::MakeRandomUuid();
  logger_.Info("analysis started", {{"project_id", project_id}, {"task_id", task_id}});

  workers_.Launch([this, project_id, task_id, on_complete = std::move(on_complete)]() {
    AnalysisCompletion completion;
    completion.project_id = project_id;
    completion.task_id = task_id;
    AnalysisReport report;
    ErrorInfo analyze_error;
    completion.succeeded = Analyze(project_id, report, analyze_error);
    if (!completion.succeeded) {
      completion.error = core::errors::Describe(analyze_error);
    }
    if (on_complete) {
      on_complete(completion);
    }
  });
  return true;
}

bool AnalysisService::Analyze(const std::string& project_id, AnalysisReport& report,
                              ErrorInfo& error) const {
  store::ProjectConfig config;
  if (!store_->LoadProject(project_id, config, error)) {
    return false;
  }

  eval::Summary summary;
  std::string summary_error;
  if (!eval::LoadSummary(config.project_dir, summary, summary_error)) {
    core::errors::SetError(error, ErrorCode::kNotFound,
                           "test summary not found; run tests first (" + summary_error + ")");
    logger_.Error("analysis failed", {{"project_id", project_id},
                                      {"error_code", ToString(error.code)},
                                      {"error", error.message}});
    return false;
  }

  std::map<std::string, std::string> contents;
  for (const auto& skill : config.skills) {
    std::string content;
    std::string content_error;
    if (!store::ReadSkillContent(config.project_dir, skill, content, content_error)) {
      logger_.Warn("skill content unavailable for analysis",
                   {{"project_id", project_id},
                    {"skill_id", skill.ref_id},
                    {"error", content_error}});
    }
    contents[skill.ref_id] = content;
  }

  std::vector<std::string> skipped;
  const std::vector<eval::ResultRecord> records =
      eval::LoadAllResultRecords(config.project_dir, skipped);
  for (const auto& path : skipped) {
    logger_.Warn("unreadable result record skipped", {{"project_id", project_id}, {"path", path}});
  }

  oracle::GenerateOptions options;
  options.working_dir = config.project_dir / ".claude";
  options.timeout = settings_.timeout;
  options.model = config.cli.model.empty() ? settings_.model : config.cli.model;

  oracle::GenerateResult result;
  oracle::OracleError oracle_error;
  if (!oracle_->Generate(BuildAnalysisPrompt(config, summary, contents, records), options, result,
                         oracle_error)) {
    core::errors::SetError(error, ErrorCode::kOracleFailure,
                           std::string(oracle::ToString(oracle_error.kind)) + ": " +
                               oracle_error.message);
    logger_.Error("analysis failed", {{"project_id", project_id},
                                      {"error_code", oracle::ToString(oracle_error.kind)},
                                      {"error", oracle_error.message}});
    return false;
  }

  core::json::Value parsed;
  std::string parse_error;
  if (!oracle::ParseStructuredOutput(result.text, parsed, parse_error)) {
    core::errors::SetError(error, ErrorCode::kOracleFailure,
                           std::string(oracle::ToString(oracle::OracleErrorKind::kOutputParseError)) +
                               ": " + parse_error);
    logger_.Error("analysis output unparseable",
                  {{"project_id", project_id}, {"error", parse_error}});
    return false;
  }

  report = AnalysisReport{};
  AnalysisReportFromJson(parsed, report);
  report.project_id = project_id;
  report.generated_at = core::NowUtcTimestamp();
  if (!WriteAnalysisReport(config.project_dir, report, error)) {
    logger_.Error("analysis report not written",
                  {{"project_id", project_id}, {"error", error.message}});
    return false;
  }

  logger_.Info("analysis completed",
               {{"project_id", project_id},
                {"best_skill_id", report.best_skill_id},
                {"segments", std::to_string(report.advantage_segments.size())},
                {"duration_ms", std::to_string(result.duration_ms)}});
  return true;
}

void AnalysisService::WaitIdle() {
  workers_.WaitIdle();
}

} // namespace skillbench::collab
