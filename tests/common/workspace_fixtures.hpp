#ifndef SKILLBENCH_TESTS_COMMON_WORKSPACE_FIXTURES_HPP_
#define SKILLBENCH_TESTS_COMMON_WORKSPACE_FIXTURES_HPP_

#include "assertions.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "oracle/oracle_client.hpp"
#include "oracle/testing/scripted_oracle_client.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::tests::common {

struct FixtureSkill {
  std::string id;
  std::string name;
  std::string content;
};

struct FixtureCase {
  std::string id;
  std::string input;
  std::string expected_output;
};

struct FixtureProject {
  std::string id = "proj-1";
  std::string name = "Fixture Project";
  std::string status = "pending";
  std::vector<FixtureSkill> skills;
  std::vector<FixtureCase> cases;
  std::vector<std::string> original_skill_ids;
};

inline void WriteTextOrFail(const std::filesystem::path& path, std::string_view text) {
  std::string error;
  if (!core::WriteTextFileAtomic(path, text, error)) {
    Fail("failed to write fixture file " + path.string() + ": " + error);
  }
}

inline void WriteJsonOrFail(const std::filesystem::path& path, const core::json::Value& root) {
  WriteTextOrFail(path, core::json::Serialize(root));
}

inline core::json::Value ReadJsonOrFail(const std::filesystem::path& path) {
  core::json::Value root;
  std::string error;
  if (!core::json::Parse(ReadFileToString(path), root, error)) {
    Fail("fixture file is not JSON " + path.string() + ": " + error);
  }
  return root;
}

// Lays out `projects/<id>/` with one baseline named "base" that holds every
// fixture case. Returns the project directory.
inline std::filesystem::path WriteProject(const std::filesystem::path& workspace,
                                          const FixtureProject& project) {
  using core::json::MakeArray;
  using core::json::MakeNumber;
  using core::json::MakeObject;
  using core::json::MakeString;

  const std::filesystem::path project_dir = workspace / "projects" / project.id;

  core::json::Value skills = MakeArray();
  for (const auto& skill : project.skills) {
    core::json::Value item = MakeObject();
    item.object_value["ref_id"] = MakeString(skill.id);
    item.object_value["name"] = MakeString(skill.name);
    item.object_value["purpose"] = MakeString("coding");
    item.object_value["provider"] = MakeString("fixture");
    item.object_value["version"] = MakeString("v1");
    item.object_value["local_path"] = MakeString("skills/" + skill.id);
    skills.array_value.push_back(item);
    WriteTextOrFail(project_dir / "skills" / skill.id / "content.txt", skill.content);
  }

  core::json::Value cases = MakeArray();
  for (const auto& test_case : project.cases) {
    core::json::Value item = MakeObject();
    item.object_value["case_id"] = MakeString(test_case.id);
    item.object_value["input"] = MakeString(test_case.input);
    item.object_value["expected_output"] = MakeString(test_case.expected_output);
    cases.array_value.push_back(item);
  }
  core::json::Value cases_doc = MakeObject();
  cases_doc.object_value["cases"] = cases;
  WriteJsonOrFail(project_dir / "baselines" / "base" / "cases.json", cases_doc);

  core::json::Value baseline = MakeObject();
  baseline.object_value["ref_id"] = MakeString("base");
  baseline.object_value["name"] = MakeString("Fixture Baseline");
  baseline.object_value["version"] = MakeString("v1");
  baseline.object_value["local_path"] = MakeString("baselines/base");
  core::json::Value baselines = MakeArray();
  baselines.array_value.push_back(baseline);

  core::json::Value originals = MakeArray();
  for (const auto& id : project.original_skill_ids) {
    originals.array_value.push_back(MakeString(id));
  }

  core::json::Value cli = MakeObject();
  cli.object_value["model"] = MakeString("fixture-model");
  cli.object_value["timeout_seconds"] = MakeNumber(5);
  cli.object_value["retry_count"] = MakeNumber(0);

  core::json::Value root = MakeObject();
  root.object_value["id"] = MakeString(project.id);
  root.object_value["name"] = MakeString(project.name);
  root.object_value["status"] = MakeString(project.status);
  root.object_value["skills"] = skills;
  root.object_value["baselines"] = baselines;
  root.object_value["original_skill_ids"] = originals;
  root.object_value["cli_config"] = cli;
  WriteJsonOrFail(project_dir / "config.json", root);
  return project_dir;
}

using RubricScores = std::array<int, 6>;

// 20 + 15 + 10 + 10 + 8 + 7 = 70.
inline constexpr RubricScores kDefaultRubric = {20, 15, 10, 10, 8, 7};

inline std::string RubricAnswer(const RubricScores& scores) {
  static constexpr std::array<const char*, 6> kKeys = {
      "functional_correctness", "robustness",         "readability",
      "conciseness",            "complexity_control", "format_compliance"};
  std::ostringstream out;
  int total = 0;
  out << "{\"scores\": {";
  for (std::size_t i = 0; i < kKeys.size(); ++i) {
    out << "\"" << kKeys[i] << "\": " << scores[i] << ", ";
    total += scores[i];
  }
  out << "\"total\": " << total << "}, \"reasoning\": \"fixture\"}";
  return out.str();
}

inline bool IsScoringPrompt(std::string_view prompt) {
  return prompt.rfind("You are a strict code-quality reviewer", 0U) == 0U;
}

inline bool IsAnalysisPrompt(std::string_view prompt) {
  return prompt.find("\"advantage_segments\"") != std::string_view::npos &&
         prompt.find("[Requirements]") != std::string_view::npos;
}

inline bool IsRecomposePrompt(std::string_view prompt) {
  return prompt.rfind("You are an expert prompt engineer", 0U) == 0U;
}

// Execution answers embed the skill content so the scoring call can tell
// which skill produced them.
inline std::string ExecutionAnswer(const oracle::testing::OracleCall& call) {
  return "output-from[" + call.system_instructions.value_or("") + "] for " + call.prompt;
}

inline std::string SkillContentFromScoringPrompt(std::string_view prompt) {
  const std::string_view marker = "output-from[";
  const std::size_t start = prompt.find(marker);
  if (start == std::string_view::npos) {
    return "";
  }
  const std::size_t end = prompt.find(']', start + marker.size());
  if (end == std::string_view::npos) {
    return "";
  }
  return std::string(prompt.substr(start + marker.size(), end - start - marker.size()));
}

// Handler for task execution and rubric scoring. Skills absent from
// `rubric_by_content` score kDefaultRubric. Inputs listed in `failing_inputs`
// fail execution with EXECUTION_ERROR.
inline oracle::testing::ScriptedOracleClient::Handler MakeTaskHandler(
    std::map<std::string, RubricScores> rubric_by_content = {},
    std::vector<std::string> failing_inputs = {}) {
  return [rubric_by_content, failing_inputs](const oracle::testing::OracleCall& call,
                                             oracle::GenerateResult& result,
                                             oracle::OracleError& error) {
    if (IsScoringPrompt(call.prompt)) {
      const auto it = rubric_by_content.find(SkillContentFromScoringPrompt(call.prompt));
      result.text = RubricAnswer(it != rubric_by_content.end() ? it->second : kDefaultRubric);
      return true;
    }
    for (const auto& input : failing_inputs) {
      if (call.prompt == input) {
        error.kind = oracle::OracleErrorKind::kExecutionError;
        error.message = "fixture failure for input " + input;
        return false;
      }
    }
    result.text = ExecutionAnswer(call);
    result.duration_ms = 5;
    return true;
  };
}

// Waits for the first callback payload of type T.
template <typename T>
class Mailbox {
public:
  void Put(const T& value) {
    std::lock_guard<std::mutex> lock(mu_);
    values_.push_back(value);
    cv_.notify_all();
  }

  // Blocks until `predicate` accepts a delivered value; fails after 30 s.
  template <typename Predicate>
  T WaitFor(Predicate predicate, std::string_view context) {
    std::unique_lock<std::mutex> lock(mu_);
    const bool found = cv_.wait_for(lock, std::chrono::seconds(30), [&]() {
      for (const auto& value : values_) {
        if (predicate(value)) {
          return true;
        }
      }
      return false;
    });
    if (!found) {
      Fail("timed out waiting for " + std::string(context));
    }
    for (const auto& value : values_) {
      if (predicate(value)) {
        return value;
      }
    }
    Fail("unreachable wait state for " + std::string(context));
  }

  std::vector<T> values() const {
    std::lock_guard<std::mutex> lock(mu_);
    return values_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<T> values_;
};

} // namespace skillbench::tests::common

#endif // SKILLBENCH_TESTS_COMMON_WORKSPACE_FIXTURES_HPP_
