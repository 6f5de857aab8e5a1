#include "../common/assertions.hpp"
#include "../common/cli_dispatch.hpp"
#include "../common/temp_dir.hpp"
#include "../common/workspace_fixtures.hpp"
#include "core/fs_utils.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
namespace common = skillbench::tests::common;

namespace {

// Stand-in for the model CLI: rubric prompts get a fixed 80-point answer,
// everything else gets a short solution.
constexpr const char* kOracleScript = R"(#!/bin/sh
prompt=$(cat)
case "$prompt" in
  "You are a strict code-quality reviewer"*)
    printf '%s' '{"result":"{\"scores\":{\"functional_correctness\":25,\"robustness\":15,\"readability\":12,\"conciseness\":12,\"complexity_control\":8,\"format_compliance\":8},\"reasoning\":\"ok\"}","duration_ms":3,"is_error":false}'
    ;;
  *)
    printf '%s' '{"result":"def solve(): pass","duration_ms":3,"is_error":false}'
    ;;
esac
)";

void ExpectExit(const std::vector<std::string>& args, int expected, const std::string& context) {
  std::string out;
  const int exit_code = common::DispatchWithCapturedStdout(args, out);
  if (exit_code != expected) {
    common::Fail(context + ": expected exit " + std::to_string(expected) + ", got " +
                 std::to_string(exit_code) + "\n" + out);
  }
}

fs::path PrepareWorkspace(const fs::path& root) {
  const fs::path workspace = root / "ws";
  const fs::path script = root / "fake-model-cli";
  common::WriteTextOrFail(script, kOracleScript);
  fs::permissions(script, fs::perms::owner_all, fs::perm_options::replace);

  skillbench::core::json::Value cli_config = skillbench::core::json::MakeObject();
  cli_config.object_value["cli_path"] = skillbench::core::json::MakeString(script.string());
  cli_config.object_value["default_retry_count"] = skillbench::core::json::MakeNumber(0);
  common::WriteJsonOrFail(workspace / "cli" / "config.json", cli_config);

  common::FixtureProject project;
  project.skills = {{"skill-a", "Skill A", "You write terse Python."},
                    {"skill-b", "Skill B", "You write documented Python."}};
  project.cases = {{"case-1", "reverse a list", "xs[::-1]"},
                   {"case-2", "sum a list", "sum(xs)"}};
  common::WriteProject(workspace, project);
  return workspace;
}

void AssertUsageContract() {
  std::string out;
  if (common::DispatchWithCapturedStdout({"skillbench", "version"}, out) != 0) {
    common::Fail("version should succeed");
  }
  common::AssertContains(out, "skillbench 0.1.0");

  if (common::DispatchWithCapturedStdout({"skillbench", "help"}, out) != 0) {
    common::Fail("help should succeed");
  }
  common::AssertContains(out, "skillbench iterate <project_id> --skill <id>");

  ExpectExit({"skillbench"}, 2, "no subcommand");
  ExpectExit({"skillbench", "benchmark"}, 2, "unknown subcommand");
  ExpectExit({"skillbench", "version", "extra"}, 2, "version with arguments");
  ExpectExit({"skillbench", "results"}, 2, "results without project");
  ExpectExit({"skillbench", "results", "p", "--page"}, 2, "missing option value");
  ExpectExit({"skillbench", "results", "p", "--verbose", "1"}, 2, "unknown option");
  ExpectExit({"skillbench", "results", "p", "--status", "done"}, 2, "bad status filter");
  ExpectExit({"skillbench", "results", "p", "--log-level", "loud"}, 2, "bad log level");
  ExpectExit({"skillbench", "export", "p", "--format", "xml", "--out", "x"}, 2, "bad format");
  ExpectExit({"skillbench", "iterate", "p"}, 2, "iterate without --skill");
  ExpectExit({"skillbench", "iterate", "p", "--skill", "s", "--max-rounds", "0"}, 2,
             "zero max rounds");
}

void AssertRunLifecycle(const fs::path& workspace) {
  const std::string ws = workspace.string();
  std::string out;

  ExpectExit({"skillbench", "results", "missing", "--workspace", ws}, 10, "unknown project");
  ExpectExit({"skillbench", "run", "missing", "--workspace", ws}, 10, "run unknown project");
  ExpectExit({"skillbench", "resume", "proj-1", "--workspace", ws}, 20, "resume without pause");

  if (common::DispatchWithCapturedStdout(
          {"skillbench", "run", "proj-1", "--workspace", ws, "--log-level", "warn"}, out) != 0) {
    common::Fail("run should complete:\n" + out);
  }
  common::AssertContains(out, "run started: run-");
  common::AssertContains(out, "run completed: 4 completed, 0 failed, 4 total");
  common::AssertContains(out, "rank 1: Skill ");
  common::AssertContains(out, "avg=80");
  common::AssertContains(out, "status=completed score=80");

  if (common::DispatchWithCapturedStdout({"skillbench", "progress", "proj-1", "--workspace", ws},
                                         out) != 0) {
    common::Fail("progress should succeed");
  }
  common::AssertContains(out, "status: completed");
  common::AssertContains(out, "completed_tasks: 4");
  common::AssertNotContains(out, "iteration_status");

  if (common::DispatchWithCapturedStdout({"skillbench", "results", "proj-1", "--workspace", ws,
                                          "--skill", "skill-a", "--page-size", "1"},
                                         out) != 0) {
    common::Fail("results should succeed");
  }
  common::AssertContains(out, "\"total\": 2");
  common::AssertContains(out, "\"page_size\": 1");
  common::AssertContains(out, "\"skill_id\": \"skill-a\"");
  common::AssertContains(out, "\"ranking\"");

  const fs::path csv_path = workspace / "exports" / "results.csv";
  if (common::DispatchWithCapturedStdout({"skillbench", "export", "proj-1", "--workspace", ws,
                                          "--format", "csv", "--out", csv_path.string()},
                                         out) != 0) {
    common::Fail("export should succeed");
  }
  common::AssertContains(out, "exported: ");
  const std::string csv = common::ReadFileToString(csv_path);
  common::AssertContains(csv, "case_id,skill_id,skill_version,status,duration_ms,model,");
  common::AssertContains(csv, "\"case-2\",\"skill-b\"");

  if (common::DispatchWithCapturedStdout(
          {"skillbench", "retry", "proj-1", "skill-a", "case-1", "--workspace", ws}, out) != 0) {
    common::Fail("retry should succeed:\n" + out);
  }
  common::AssertContains(out, "retry started: retry_skill-a_case-1_");
  common::AssertContains(out, "[1/1] skill=skill-a case=case-1 status=completed");

  ExpectExit({"skillbench", "retry", "proj-1", "skill-a", "case-9", "--workspace", ws}, 10,
             "retry unknown case");
  ExpectExit({"skillbench", "report", "proj-1", "--workspace", ws}, 10,
             "report before any iteration");
  ExpectExit({"skillbench", "report", "proj-1", "--exploration-log", "--workspace", ws}, 10,
             "exploration log before any iteration");
}

} // namespace

int main() {
  const fs::path root = common::CreateUniqueTempDir("skillbench-cli");
  AssertUsageContract();
  AssertRunLifecycle(PrepareWorkspace(root));
  common::RemovePathBestEffort(root);
  std::cout << "cli_smoke: ok\n";
  return 0;
}
