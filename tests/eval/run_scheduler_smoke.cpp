#include "../common/temp_dir.hpp"
#include "../common/workspace_fixtures.hpp"
#include "eval/result_record.hpp"
#include "eval/run_scheduler.hpp"
#include "eval/summary.hpp"
#include "oracle/testing/scripted_oracle_client.hpp"
#include "store/project_config.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace {

namespace common = skillbench::tests::common;

using skillbench::core::errors::ErrorCode;
using skillbench::core::errors::ErrorInfo;
using skillbench::eval::ProgressEvent;
using skillbench::eval::RunStatus;

constexpr common::RubricScores kStrongRubric = {26, 17, 13, 12, 9, 8}; // 85
constexpr common::RubricScores kWeakRubric = {24, 16, 12, 11, 8, 8};   // 79

common::FixtureProject TwoSkillProject(const std::string& id) {
  common::FixtureProject project;
  project.id = id;
  project.skills = {{"skill-a", "Skill A", "be precise"}, {"skill-b", "Skill B", "be brief"}};
  project.cases = {{"case-1", "write fizzbuzz", "loop 1..100"},
                   {"case-2", "reverse a list", "in-place reversal"},
                   {"case-3", "parse an int", "handles sign and overflow"}};
  project.original_skill_ids = {"skill-a", "skill-b"};
  return project;
}

struct Harness {
  std::shared_ptr<skillbench::store::ProjectStore> store;
  std::shared_ptr<skillbench::oracle::testing::ScriptedOracleClient> oracle;
  std::unique_ptr<skillbench::eval::RunScheduler> scheduler;
};

Harness MakeHarness(const std::filesystem::path& workspace,
                    skillbench::oracle::testing::ScriptedOracleClient::Handler handler) {
  Harness harness;
  harness.store = std::make_shared<skillbench::store::ProjectStore>(workspace);
  harness.oracle =
      std::make_shared<skillbench::oracle::testing::ScriptedOracleClient>(std::move(handler));
  skillbench::eval::SchedulerSettings settings;
  settings.rate_limit_backoff = std::chrono::milliseconds(1);
  harness.scheduler = std::make_unique<skillbench::eval::RunScheduler>(
      harness.store, harness.oracle, settings,
      skillbench::core::logging::Logger(skillbench::core::logging::LogLevel::kError));
  return harness;
}

bool IsTerminal(const ProgressEvent& event) {
  return !event.last_result.has_value();
}

ProgressEvent StartAndWait(Harness& harness, const std::string& project_id) {
  auto mailbox = std::make_shared<common::Mailbox<ProgressEvent>>();
  std::string run_id;
  ErrorInfo error;
  if (!harness.scheduler->Start(
          project_id, [mailbox](const ProgressEvent& event) { mailbox->Put(event); }, run_id,
          error)) {
    common::Fail("Start failed: " + skillbench::core::errors::Describe(error));
  }
  if (run_id.rfind("run-", 0U) != 0U) {
    common::Fail("run id should carry the run prefix: " + run_id);
  }
  return mailbox->WaitFor(IsTerminal, "terminal run event");
}

void AssertAllTasksSucceed(const std::filesystem::path& workspace) {
  const auto project_dir = common::WriteProject(workspace, TwoSkillProject("all-ok"));
  Harness harness = MakeHarness(
      workspace, common::MakeTaskHandler({{"be precise", kStrongRubric},
                                          {"be brief", kWeakRubric}}));

  const ProgressEvent terminal = StartAndWait(harness, "all-ok");
  if (terminal.project_status != RunStatus::kCompleted || terminal.completed != 6U ||
      terminal.failed != 0U || terminal.total != 6U) {
    common::Fail("expected completed run with 6/6 successes");
  }
  // One execution plus one scoring call per task.
  if (harness.oracle->call_count() != 12U) {
    common::Fail("expected 12 oracle calls, got " +
                 std::to_string(harness.oracle->call_count()));
  }

  skillbench::eval::Summary summary;
  std::string summary_error;
  if (!skillbench::eval::LoadSummary(project_dir, summary, summary_error)) {
    common::Fail("summary missing after completed run: " + summary_error);
  }
  if (summary.ranking.size() != 2U || summary.ranking[0].skill_id != "skill-a" ||
      summary.ranking[0].rank != 1U || summary.ranking[1].skill_id != "skill-b") {
    common::Fail("expected skill-a ranked above skill-b");
  }
  common::AssertNear(summary.ranking[0].avg_score, 85.0, "skill-a average");
  common::AssertNear(summary.ranking[1].avg_score, 79.0, "skill-b average");

  skillbench::store::ProjectConfig config;
  ErrorInfo error;
  if (!harness.store->LoadProject("all-ok", config, error) ||
      config.status != RunStatus::kCompleted || config.progress.last_checkpoint != 6U) {
    common::Fail("project config should record the completed checkpoint");
  }

  // Re-running after deleting K records executes exactly those K tasks.
  for (const char* case_id : {"case-1", "case-3"}) {
    std::filesystem::remove(skillbench::eval::ResultRecordPath(project_dir, "skill-b", case_id));
  }
  const std::size_t calls_before = harness.oracle->call_count();
  const ProgressEvent rerun = StartAndWait(harness, "all-ok");
  if (rerun.project_status != RunStatus::kCompleted || rerun.completed != 6U) {
    common::Fail("re-run should complete with every task counted");
  }
  if (harness.oracle->call_count() - calls_before != 4U) {
    common::Fail("re-run should only execute and score the 2 missing tasks");
  }
}

void AssertPartialFailuresStillComplete(const std::filesystem::path& workspace) {
  const auto project_dir = common::WriteProject(workspace, TwoSkillProject("partial"));
  Harness harness = MakeHarness(workspace, common::MakeTaskHandler({}, {"reverse a list"}));

  const ProgressEvent terminal = StartAndWait(harness, "partial");
  if (terminal.project_status != RunStatus::kCompleted || terminal.completed != 4U ||
      terminal.failed != 2U) {
    common::Fail("expected completed run with 4 successes and 2 failures");
  }

  skillbench::eval::ResultRecord record;
  std::string load_error;
  if (!skillbench::eval::LoadResultRecord(
          skillbench::eval::ResultRecordPath(project_dir, "skill-a", "case-2"), record,
          load_error)) {
    common::Fail("failed record should still be persisted: " + load_error);
  }
  if (record.status != skillbench::eval::RecordStatus::kFailed || record.score.has_value() ||
      !record.error_code.has_value()) {
    common::Fail("failed record must carry an error code and no score");
  }

  skillbench::eval::Summary summary;
  std::string summary_error;
  if (!skillbench::eval::LoadSummary(project_dir, summary, summary_error)) {
    common::Fail("summary missing after partial run: " + summary_error);
  }
  const auto* entry = summary.FindSkill("skill-a");
  if (entry == nullptr || entry->completed_cases != 2U || entry->failed_cases != 1U) {
    common::Fail("summary should count completed and failed cases per skill");
  }
  common::AssertNear(entry->avg_score, 70.0, "average over scored cases only");
}

void AssertPauseAndResume(const std::filesystem::path& workspace) {
  common::FixtureProject project;
  project.id = "pausable";
  project.skills = {{"solo", "Solo", "one skill"}};
  project.cases = {{"c1", "in-1", "out-1"},
                   {"c2", "in-2", "out-2"},
                   {"c3", "in-3", "out-3"},
                   {"c4", "in-4", "out-4"}};
  project.original_skill_ids = {"solo"};
  common::WriteProject(workspace, project);
  Harness harness = MakeHarness(workspace, common::MakeTaskHandler());

  auto mailbox = std::make_shared<common::Mailbox<ProgressEvent>>();
  auto* scheduler = harness.scheduler.get();
  std::string run_id;
  ErrorInfo error;
  if (!scheduler->Start(
          "pausable",
          [mailbox, scheduler](const ProgressEvent& event) {
            if (event.last_result.has_value() && event.completed == 1U) {
              std::uint64_t checkpoint = 0;
              ErrorInfo pause_error;
              if (!scheduler->Pause("pausable", checkpoint, pause_error) || checkpoint != 1U) {
                common::Fail("pause after the first task should succeed at checkpoint 1");
              }
            }
            mailbox->Put(event);
          },
          run_id, error)) {
    common::Fail("Start failed: " + skillbench::core::errors::Describe(error));
  }

  const ProgressEvent paused = mailbox->WaitFor(IsTerminal, "paused event");
  if (paused.project_status != RunStatus::kPaused || paused.completed != 1U) {
    common::Fail("expected paused terminal event after one task");
  }

  std::string second_run;
  if (scheduler->Start("pausable", {}, second_run, error) ||
      error.code != ErrorCode::kAlreadyRunning) {
    common::Fail("Start must be rejected while the run is paused");
  }

  skillbench::eval::RunProgress progress;
  if (!scheduler->GetProgress("pausable", progress, error) ||
      progress.status != RunStatus::kPaused || progress.completed_tasks != 1U) {
    common::Fail("progress should report the paused checkpoint");
  }

  auto resumed_box = std::make_shared<common::Mailbox<ProgressEvent>>();
  std::uint64_t remaining = 0;
  if (!scheduler->Resume(
          "pausable", [resumed_box](const ProgressEvent& event) { resumed_box->Put(event); },
          remaining, error)) {
    common::Fail("Resume failed: " + skillbench::core::errors::Describe(error));
  }
  if (remaining != 3U) {
    common::Fail("expected 3 remaining tasks on resume");
  }
  const ProgressEvent done = resumed_box->WaitFor(IsTerminal, "completed event");
  if (done.project_status != RunStatus::kCompleted || done.completed != 4U) {
    common::Fail("resumed run should complete all 4 tasks");
  }
  if (harness.oracle->call_count() != 8U) {
    common::Fail("no task may run twice across pause and resume");
  }

  std::uint64_t checkpoint = 0;
  if (scheduler->Pause("pausable", checkpoint, error) || error.code != ErrorCode::kNotRunning) {
    common::Fail("Pause on a finished run must fail with NOT_RUNNING");
  }
  if (scheduler->Resume("pausable", {}, remaining, error) ||
      error.code != ErrorCode::kNotPaused) {
    common::Fail("Resume on a completed run must fail with NOT_PAUSED");
  }
}

void AssertStopInterrupts(const std::filesystem::path& workspace) {
  common::FixtureProject project;
  project.id = "stoppable";
  project.skills = {{"solo", "Solo", "one skill"}};
  project.cases = {{"c1", "in-1", "out-1"},
                   {"c2", "in-2", "out-2"},
                   {"c3", "in-3", "out-3"},
                   {"c4", "in-4", "out-4"}};
  const auto project_dir = common::WriteProject(workspace, project);
  Harness harness = MakeHarness(workspace, common::MakeTaskHandler());

  auto mailbox = std::make_shared<common::Mailbox<ProgressEvent>>();
  auto* scheduler = harness.scheduler.get();
  std::string run_id;
  ErrorInfo error;
  if (!scheduler->Start(
          "stoppable",
          [mailbox, scheduler](const ProgressEvent& event) {
            if (event.last_result.has_value() && event.completed == 2U) {
              ErrorInfo stop_error;
              if (!scheduler->Stop("stoppable", stop_error)) {
                common::Fail("Stop during the run should succeed");
              }
            }
            mailbox->Put(event);
          },
          run_id, error)) {
    common::Fail("Start failed: " + skillbench::core::errors::Describe(error));
  }

  const ProgressEvent stopped = mailbox->WaitFor(IsTerminal, "interrupted event");
  if (stopped.project_status != RunStatus::kInterrupted || stopped.completed != 2U) {
    common::Fail("expected interrupted terminal event after two tasks");
  }
  harness.scheduler->WaitIdle();
  if (harness.oracle->call_count() != 4U) {
    common::Fail("no task may start after Stop");
  }

  const auto config = common::ReadJsonOrFail(project_dir / "config.json");
  if (skillbench::core::json::GetString(config, "status") != "interrupted") {
    common::Fail("stopped run should persist status interrupted");
  }
  if (skillbench::core::PathExists(project_dir / "results" / "summary.json")) {
    common::Fail("an interrupted run must not write a summary");
  }

  skillbench::eval::RunProgress progress;
  if (!scheduler->GetProgress("stoppable", progress, error) ||
      progress.status != RunStatus::kInterrupted || progress.completed_tasks != 2U) {
    common::Fail("progress should fall back to the interrupted checkpoint");
  }
  std::uint64_t remaining = 0;
  if (scheduler->Resume("stoppable", {}, remaining, error) ||
      error.code != ErrorCode::kNotPaused) {
    common::Fail("an interrupted run cannot be resumed");
  }
  if (scheduler->Stop("stoppable", error) || error.code != ErrorCode::kNotRunning) {
    common::Fail("Stop without an active run must fail with NOT_RUNNING");
  }
}

// Holds the first execution call until Release(), so a test can act while a
// task is in flight.
class FirstCallGate {
public:
  void EnterAndWait() {
    std::unique_lock<std::mutex> lock(mu_);
    if (entered_) {
      return;
    }
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return released_; });
  }

  void WaitEntered() {
    std::unique_lock<std::mutex> lock(mu_);
    if (!cv_.wait_for(lock, std::chrono::seconds(30), [this] { return entered_; })) {
      common::Fail("timed out waiting for the first execution call");
    }
  }

  void Release() {
    std::lock_guard<std::mutex> lock(mu_);
    released_ = true;
    cv_.notify_all();
  }

private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool entered_ = false;
  bool released_ = false;
};

std::size_t CountExecutionCalls(const skillbench::oracle::testing::ScriptedOracleClient& oracle) {
  std::size_t count = 0;
  for (const auto& call : oracle.calls()) {
    if (!common::IsScoringPrompt(call.prompt)) {
      ++count;
    }
  }
  return count;
}

void AssertStoppedRunKeepsProjectLocked(const std::filesystem::path& workspace) {
  common::FixtureProject project;
  project.id = "draining";
  project.skills = {{"solo", "Solo", "one skill"}};
  project.cases = {{"c1", "in-1", "out-1"}};
  common::WriteProject(workspace, project);

  auto gate = std::make_shared<FirstCallGate>();
  const auto task_handler = common::MakeTaskHandler();
  Harness harness = MakeHarness(
      workspace, [gate, task_handler](const skillbench::oracle::testing::OracleCall& call,
                                      skillbench::oracle::GenerateResult& result,
                                      skillbench::oracle::OracleError& error) {
        if (!common::IsScoringPrompt(call.prompt)) {
          gate->EnterAndWait();
        }
        return task_handler(call, result, error);
      });
  auto* scheduler = harness.scheduler.get();

  auto mailbox = std::make_shared<common::Mailbox<ProgressEvent>>();
  std::string run_id;
  ErrorInfo error;
  if (!scheduler->Start(
          "draining", [mailbox](const ProgressEvent& event) { mailbox->Put(event); }, run_id,
          error)) {
    common::Fail("Start failed: " + skillbench::core::errors::Describe(error));
  }
  gate->WaitEntered();

  if (!scheduler->Stop("draining", error)) {
    common::Fail("Stop with a task in flight should succeed");
  }
  std::string second_run;
  if (scheduler->Start("draining", {}, second_run, error) ||
      error.code != ErrorCode::kAlreadyRunning) {
    gate->Release();
    common::Fail("Start must be rejected while the stopped run is draining");
  }
  std::string retry_id;
  if (scheduler->RetryCase("draining", "solo", "c1", {}, retry_id, error) ||
      error.code != ErrorCode::kAlreadyRunning) {
    gate->Release();
    common::Fail("RetryCase must be rejected while the stopped run is draining");
  }

  gate->Release();
  const ProgressEvent stopped = mailbox->WaitFor(IsTerminal, "interrupted event");
  if (stopped.project_status != RunStatus::kInterrupted || stopped.completed != 1U) {
    common::Fail("the in-flight task should finish before the interrupted event");
  }
  scheduler->WaitIdle();
  if (CountExecutionCalls(*harness.oracle) != 1U) {
    common::Fail("the in-flight task must execute exactly once, got " +
                 std::to_string(CountExecutionCalls(*harness.oracle)));
  }

  // Once drained the project is free again; the finished record is reused.
  const ProgressEvent rerun = StartAndWait(harness, "draining");
  if (rerun.project_status != RunStatus::kCompleted || rerun.completed != 1U) {
    common::Fail("a new run after draining should complete from the existing record");
  }
  if (CountExecutionCalls(*harness.oracle) != 1U) {
    common::Fail("the new run must not execute the drained task again");
  }
}

void AssertScoringFailureIsNonFatal(const std::filesystem::path& workspace) {
  const auto project_dir = common::WriteProject(workspace, TwoSkillProject("unscored"));
  const auto task_handler = common::MakeTaskHandler();
  Harness harness = MakeHarness(
      workspace, [task_handler](const skillbench::oracle::testing::OracleCall& call,
                                skillbench::oracle::GenerateResult& result,
                                skillbench::oracle::OracleError& error) {
        if (common::IsScoringPrompt(call.prompt) &&
            common::SkillContentFromScoringPrompt(call.prompt) == "be precise") {
          result.text = "I would rather not grade this one.";
          return true;
        }
        return task_handler(call, result, error);
      });

  const ProgressEvent terminal = StartAndWait(harness, "unscored");
  if (terminal.project_status != RunStatus::kCompleted || terminal.completed != 6U ||
      terminal.failed != 0U) {
    common::Fail("unscored tasks must still count as completed");
  }

  skillbench::eval::ResultRecord record;
  std::string load_error;
  if (!skillbench::eval::LoadResultRecord(
          skillbench::eval::ResultRecordPath(project_dir, "skill-a", "case-1"), record,
          load_error)) {
    common::Fail("unscored record should be persisted: " + load_error);
  }
  if (record.status != skillbench::eval::RecordStatus::kCompleted || record.score.has_value() ||
      record.error_code.has_value()) {
    common::Fail("a scoring failure must leave a completed record with no score");
  }

  skillbench::eval::Summary summary;
  std::string summary_error;
  if (!skillbench::eval::LoadSummary(project_dir, summary, summary_error)) {
    common::Fail("summary missing after run: " + summary_error);
  }
  const auto* unscored = summary.FindSkill("skill-a");
  if (unscored == nullptr || unscored->completed_cases != 3U || unscored->scored_cases != 0U ||
      unscored->rank != 2U) {
    common::Fail("a skill without scores should rank last with zero scored cases");
  }
  common::AssertNear(unscored->avg_score, 0.0, "unscored average");
  const auto* scored = summary.FindSkill("skill-b");
  if (scored == nullptr || scored->rank != 1U || scored->scored_cases != 3U) {
    common::Fail("the scored skill should rank first");
  }
}

void AssertRetryCase(const std::filesystem::path& workspace) {
  const auto project_dir = common::WriteProject(workspace, TwoSkillProject("retry"));
  Harness harness = MakeHarness(workspace, common::MakeTaskHandler({}, {"parse an int"}));
  const ProgressEvent terminal = StartAndWait(harness, "retry");
  if (terminal.failed != 2U) {
    common::Fail("expected two failed tasks before retry");
  }

  // A fresh scheduler over a fixed oracle retries one of them.
  Harness fixed = MakeHarness(workspace, common::MakeTaskHandler());
  auto mailbox = std::make_shared<common::Mailbox<ProgressEvent>>();
  std::string task_id;
  ErrorInfo error;
  if (!fixed.scheduler->RetryCase(
          "retry", "skill-b", "case-3",
          [mailbox](const ProgressEvent& event) { mailbox->Put(event); }, task_id, error)) {
    common::Fail("RetryCase failed: " + skillbench::core::errors::Describe(error));
  }
  const ProgressEvent event =
      mailbox->WaitFor([](const ProgressEvent&) { return true; }, "retry event");
  if (!event.last_result.has_value() ||
      event.last_result->status != skillbench::eval::RecordStatus::kCompleted) {
    common::Fail("retried task should now complete");
  }
  fixed.scheduler->WaitIdle();

  skillbench::eval::Summary summary;
  std::string summary_error;
  if (!skillbench::eval::LoadSummary(project_dir, summary, summary_error)) {
    common::Fail("summary missing after retry: " + summary_error);
  }
  const auto* entry = summary.FindSkill("skill-b");
  if (entry == nullptr || entry->completed_cases != 3U || entry->failed_cases != 0U) {
    common::Fail("retry should refresh the existing summary");
  }

  if (fixed.scheduler->RetryCase("retry", "skill-b", "no-such-case", {}, task_id, error) ||
      error.code != ErrorCode::kNotFound) {
    common::Fail("retry of an unknown case must fail with NOT_FOUND");
  }
}

void AssertUnknownProject(const std::filesystem::path& workspace) {
  Harness harness = MakeHarness(workspace, common::MakeTaskHandler());
  std::string run_id;
  ErrorInfo error;
  if (harness.scheduler->Start("missing", {}, run_id, error) ||
      error.code != ErrorCode::kNotFound) {
    common::Fail("Start on an unknown project must fail with NOT_FOUND");
  }
}

} // namespace

int main() {
  const std::filesystem::path workspace = common::CreateUniqueTempDir("skillbench-scheduler");

  AssertAllTasksSucceed(workspace);
  AssertPartialFailuresStillComplete(workspace);
  AssertPauseAndResume(workspace);
  AssertStopInterrupts(workspace);
  AssertStoppedRunKeepsProjectLocked(workspace);
  AssertScoringFailureIsNonFatal(workspace);
  AssertRetryCase(workspace);
  AssertUnknownProject(workspace);

  common::RemovePathBestEffort(workspace);
  std::cout << "run_scheduler_smoke: ok\n";
  return 0;
}
