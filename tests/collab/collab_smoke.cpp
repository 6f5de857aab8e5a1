#include "../common/temp_dir.hpp"
#include "../common/workspace_fixtures.hpp"
#include "collab/analysis_report.hpp"
#include "collab/analysis_service.hpp"
#include "collab/port_adapters.hpp"
#include "collab/recompose_service.hpp"
#include "eval/run_scheduler.hpp"
#include "eval/summary.hpp"
#include "iteration/round_controller.hpp"
#include "oracle/testing/scripted_oracle_client.hpp"
#include "store/project_config.hpp"
#include "store/skill_library.hpp"

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

namespace common = skillbench::tests::common;

using skillbench::core::errors::ErrorCode;
using skillbench::core::errors::ErrorInfo;
using skillbench::oracle::testing::OracleCall;
using skillbench::oracle::testing::ScriptedOracleClient;

constexpr std::string_view kAnalysisAnswer = R"(Here is the comparison:
```json
{
  "best_skill_id": "skill-a",
  "best_skill_name": "Skill A",
  "dimension_leaders": {"functional_correctness": "skill-a", "robustness": "skill-b"},
  "advantage_segments": [
    {"id": "seg_001", "skill_id": "skill-a", "skill_name": "Skill A", "type": "role",
     "content": "You are a senior engineer", "reason": "sets expertise",
     "dimension": "functional_correctness"},
    {"id": "seg_002", "skill_id": "skill-b", "skill_name": "Skill B", "type": "constraint",
     "content": "Always validate inputs", "reason": "fewer crashes", "dimension": "robustness"}
  ],
  "issues": [
    {"skill_id": "skill-b", "skill_name": "Skill B", "dimension": "readability",
     "description": "terse names"}
  ]
}
```)";

constexpr std::string_view kMergedSkill = "You are a senior engineer.\nAlways validate inputs.";

constexpr common::RubricScores kStrongRubric = {26, 17, 13, 12, 9, 8}; // 85
constexpr common::RubricScores kWeakRubric = {24, 16, 12, 11, 8, 8};   // 79
constexpr common::RubricScores kMergedRubric = {28, 18, 14, 13, 9, 8}; // 90

common::FixtureProject ComparisonProject(const std::string& id) {
  common::FixtureProject project;
  project.id = id;
  project.skills = {{"skill-a", "Skill A", "You are a senior engineer"},
                    {"skill-b", "Skill B", "Always validate inputs"}};
  project.cases = {{"case-1", "write fizzbuzz", "loop 1..100"},
                   {"case-2", "reverse a list", "in-place reversal"}};
  project.original_skill_ids = {"skill-a", "skill-b"};
  return project;
}

// Answers every prompt kind the services send.
ScriptedOracleClient::Handler MakeFullHandler() {
  const auto task_handler = common::MakeTaskHandler({{"You are a senior engineer", kStrongRubric},
                                                     {"Always validate inputs", kWeakRubric},
                                                     {std::string(kMergedSkill), kMergedRubric}});
  return [task_handler](const OracleCall& call, skillbench::oracle::GenerateResult& result,
                        skillbench::oracle::OracleError& error) {
    if (common::IsAnalysisPrompt(call.prompt)) {
      result.text = std::string(kAnalysisAnswer);
      return true;
    }
    if (common::IsRecomposePrompt(call.prompt)) {
      result.text = std::string(kMergedSkill) + "\n\n";
      return true;
    }
    return task_handler(call, result, error);
  };
}

skillbench::core::logging::Logger QuietLogger() {
  return skillbench::core::logging::Logger(skillbench::core::logging::LogLevel::kError);
}

void WriteSummaryOrFail(const std::filesystem::path& project_dir) {
  skillbench::eval::SummaryEntry a;
  a.skill_id = "skill-a";
  a.skill_name = "Skill A";
  a.avg_score = 85.0;
  a.scored_cases = 2;
  a.completed_cases = 2;
  a.score_breakdown = {26, 17, 13, 12, 9, 8};
  a.rank = 1;
  skillbench::eval::SummaryEntry b = a;
  b.skill_id = "skill-b";
  b.skill_name = "Skill B";
  b.avg_score = 79.0;
  b.score_breakdown = {24, 16, 12, 11, 8, 8};
  b.rank = 2;

  skillbench::eval::Summary summary;
  summary.project_id = "analysis";
  summary.total_cases = 2;
  summary.ranking = {a, b};
  std::string error;
  if (!skillbench::eval::WriteSummary(project_dir, summary, error)) {
    common::Fail("failed to write fixture summary: " + error);
  }
}

void AssertAnalysisAndRecompose(const std::filesystem::path& workspace) {
  const auto project_dir = common::WriteProject(workspace, ComparisonProject("analysis"));
  auto store = std::make_shared<skillbench::store::ProjectStore>(workspace);
  auto oracle = std::make_shared<ScriptedOracleClient>(MakeFullHandler());
  skillbench::collab::AnalysisService analysis(store, oracle, {}, QuietLogger());
  skillbench::collab::RecomposeService recompose(store, oracle, {}, QuietLogger());

  skillbench::collab::AnalysisReport report;
  ErrorInfo error;
  if (analysis.Analyze("analysis", report, error) || error.code != ErrorCode::kNotFound) {
    common::Fail("analysis before any test run must be NOT_FOUND");
  }
  skillbench::iteration::RecomposeRequest request;
  skillbench::collab::RecomposeCompletion completion;
  if (recompose.Recompose("analysis", request, completion, error) ||
      error.code != ErrorCode::kNotFound) {
    common::Fail("recompose before analysis must be NOT_FOUND");
  }

  WriteSummaryOrFail(project_dir);
  if (!analysis.Analyze("analysis", report, error)) {
    common::Fail("Analyze failed: " + skillbench::core::errors::Describe(error));
  }
  if (report.best_skill_id != "skill-a" || report.advantage_segments.size() != 2U ||
      report.issues.size() != 1U || report.dimension_leaders["robustness"] != "skill-b") {
    common::Fail("fenced analysis answer should decode into the report");
  }
  const std::string analysis_prompt = oracle->calls().back().prompt;
  common::AssertContains(analysis_prompt, "You are a senior engineer");
  common::AssertContains(analysis_prompt, "Skill B");
  common::AssertContains(analysis_prompt, "functional_correctness");

  skillbench::collab::AnalysisReport loaded;
  if (!skillbench::collab::LoadAnalysisReport(project_dir, loaded, error) ||
      loaded.project_id != "analysis" || loaded.generated_at.empty()) {
    common::Fail("analysis report should be persisted with project id and timestamp");
  }

  request.strategy = skillbench::iteration::Strategy::kCrossPollinate;
  request.retention_rules = "keep the senior engineer persona";
  request.selected_segment_ids = {"seg_002"};
  skillbench::iteration::RoundRecord round;
  round.round = 1;
  round.avg_score = 85.0;
  round.score_breakdown = {26, 17, 13, 12, 9, 8};
  request.score_history = {round};
  if (!recompose.Recompose("analysis", request, completion, error)) {
    common::Fail("Recompose failed: " + skillbench::core::errors::Describe(error));
  }
  if (completion.content != kMergedSkill || completion.segment_count != 1U ||
      completion.source_skill_count != 1U) {
    common::Fail("recompose should trim content and count the selected segment");
  }
  const std::string recompose_prompt = oracle->calls().back().prompt;
  common::AssertContains(recompose_prompt, "Always validate inputs");
  common::AssertNotContains(recompose_prompt, "Segment 2");
  common::AssertContains(recompose_prompt, "keep the senior engineer persona");
  common::AssertContains(recompose_prompt, "CROSS_POLLINATE");
  common::AssertContains(recompose_prompt, "Round 1 (GREEDY): total 85");

  skillbench::iteration::SkillDraft draft;
  draft.name = "Merged Skill";
  draft.strategy = skillbench::iteration::Strategy::kCrossPollinate;
  draft.retention_rules = request.retention_rules;
  std::string skill_id;
  if (!recompose.SaveRecomposedSkill("analysis", completion.content, draft, skill_id, error)) {
    common::Fail("SaveRecomposedSkill failed: " + skillbench::core::errors::Describe(error));
  }
  const skillbench::store::SkillLibrary library(workspace);
  std::filesystem::path skill_dir;
  if (!library.FindSkillDir(skill_id, skill_dir, error)) {
    common::Fail("saved skill should be in the library");
  }
  if (common::ReadFileToString(skill_dir / "content.txt") != kMergedSkill) {
    common::Fail("saved skill content mismatch");
  }
  const std::string provenance = common::ReadFileToString(skill_dir / "provenance.json");
  common::AssertContains(provenance, "CROSS_POLLINATE");
  common::AssertContains(provenance, "skill-a");
  common::AssertContains(provenance, "keep the senior engineer persona");

  // Registering copies the skill into the project as its iteration candidate.
  skillbench::collab::ProjectSkillRegistry registry(store, QuietLogger());
  if (!registry.RegisterCandidate("analysis", skill_id, 2U, error)) {
    common::Fail("RegisterCandidate failed: " + skillbench::core::errors::Describe(error));
  }
  if (!registry.RegisterCandidate("analysis", skill_id, 3U, error)) {
    common::Fail("second RegisterCandidate failed");
  }
  skillbench::store::ProjectConfig config;
  if (!store->LoadProject("analysis", config, error) || config.skills.size() != 3U ||
      config.skills.back().ref_id != skill_id ||
      config.skills.back().local_path != "skills/skill_iter_v3") {
    common::Fail("project should hold the originals plus one candidate");
  }
  if (common::ReadFileToString(project_dir / "skills" / "skill_iter_v3" / "content.txt") !=
      kMergedSkill) {
    common::Fail("candidate content should be copied into the project");
  }
  if (registry.RegisterCandidate("analysis", "no-such-skill", 4U, error) ||
      error.code != ErrorCode::kNotFound) {
    common::Fail("unknown library skill must be NOT_FOUND");
  }
}

void AssertEndToEndIteration(const std::filesystem::path& workspace) {
  const auto project_dir = common::WriteProject(workspace, ComparisonProject("loop"));
  auto store = std::make_shared<skillbench::store::ProjectStore>(workspace);
  auto oracle = std::make_shared<ScriptedOracleClient>(MakeFullHandler());
  auto scheduler = std::make_shared<skillbench::eval::RunScheduler>(
      store, oracle, skillbench::eval::SchedulerSettings{}, QuietLogger());
  auto analysis = std::make_shared<skillbench::collab::AnalysisService>(
      store, oracle, skillbench::collab::OracleCallSettings{}, QuietLogger());
  auto recompose = std::make_shared<skillbench::collab::RecomposeService>(
      store, oracle, skillbench::collab::OracleCallSettings{}, QuietLogger());
  skillbench::iteration::RoundController controller(
      store,
      skillbench::collab::MakeIterationPorts(store, scheduler, analysis, recompose,
                                             QuietLogger()),
      QuietLogger());

  auto outcomes = std::make_shared<common::Mailbox<skillbench::iteration::IterationOutcome>>();
  skillbench::iteration::IterationCallbacks callbacks;
  callbacks.on_complete = [outcomes](const skillbench::iteration::IterationOutcome& outcome) {
    outcomes->Put(outcome);
  };
  skillbench::iteration::IterationParams params;
  params.initial_skill_id = "skill-a";
  params.max_rounds = 2;
  params.beam_width = 1;
  std::string iteration_id;
  ErrorInfo error;
  if (!controller.StartIteration("loop", params, callbacks, iteration_id, error)) {
    common::Fail("StartIteration failed: " + skillbench::core::errors::Describe(error));
  }
  const auto outcome = outcomes->WaitFor(
      [](const skillbench::iteration::IterationOutcome&) { return true; }, "iteration");
  if (outcome.stop_reason != skillbench::iteration::StopReason::kMaxRounds) {
    common::Fail("expected max_rounds, got error: " + outcome.error);
  }
  const auto& rounds = outcome.report.rounds;
  if (rounds.size() != 2U || rounds[0].skill_id != "skill-a") {
    common::Fail("round 1 should test the initial skill");
  }
  common::AssertNear(rounds[0].avg_score, 85.0, "round 1 score");
  common::AssertNear(rounds[1].avg_score, 90.0, "round 2 merged skill score");
  if (outcome.report.best.round != 2U) {
    common::Fail("merged skill should be the best round");
  }

  skillbench::store::ProjectConfig config;
  if (!store->LoadProject("loop", config, error) || config.skills.size() != 3U ||
      config.skills.back().local_path != "skills/skill_iter_v2") {
    common::Fail("winning candidate should be registered for round 2");
  }
  if (!std::filesystem::exists(project_dir / "analysis_report.json")) {
    common::Fail("each round should leave an analysis report");
  }
}

void AssertPausedTestRunFails(const std::filesystem::path& workspace) {
  common::WriteProject(workspace, ComparisonProject("paused-port"));
  auto store = std::make_shared<skillbench::store::ProjectStore>(workspace);
  auto scheduler_slot = std::make_shared<skillbench::eval::RunScheduler*>(nullptr);
  const auto full_handler = MakeFullHandler();
  auto oracle = std::make_shared<ScriptedOracleClient>(
      [scheduler_slot, full_handler](const OracleCall& call,
                                     skillbench::oracle::GenerateResult& result,
                                     skillbench::oracle::OracleError& error) {
        if (!common::IsScoringPrompt(call.prompt) && *scheduler_slot != nullptr) {
          std::uint64_t checkpoint = 0;
          ErrorInfo pause_error;
          // Only the first call finds the run still running.
          (*scheduler_slot)->Pause("paused-port", checkpoint, pause_error);
        }
        return full_handler(call, result, error);
      });
  auto scheduler = std::make_shared<skillbench::eval::RunScheduler>(
      store, oracle, skillbench::eval::SchedulerSettings{}, QuietLogger());
  *scheduler_slot = scheduler.get();

  skillbench::collab::SchedulerTestRunPort port(scheduler);
  ErrorInfo error;
  if (port.RunTests("paused-port", error)) {
    common::Fail("a paused test run must not report success");
  }
  if (error.code != ErrorCode::kInterrupted) {
    common::Fail("paused test run should fail with INTERRUPTED");
  }
  common::AssertContains(error.message, "test run paused");

  skillbench::eval::RunProgress progress;
  if (!scheduler->GetProgress("paused-port", progress, error) ||
      progress.status != skillbench::eval::RunStatus::kPaused) {
    common::Fail("the run should be left paused");
  }
  if (!scheduler->Stop("paused-port", error)) {
    common::Fail("Stop on the paused run should succeed");
  }
  scheduler->WaitIdle();
  *scheduler_slot = nullptr;
}

} // namespace

int main() {
  const std::filesystem::path workspace = common::CreateUniqueTempDir("skillbench-collab");

  AssertAnalysisAndRecompose(workspace);
  AssertEndToEndIteration(workspace);
  AssertPausedTestRunFails(workspace);

  common::RemovePathBestEffort(workspace);
  std::cout << "collab_smoke: ok\n";
  return 0;
}
