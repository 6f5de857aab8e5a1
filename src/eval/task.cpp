#include "eval/task.hpp"

#include <set>
#include <utility>

namespace fs = std::filesystem;

namespace skillbench::eval {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

fs::path SkillWorkingDir(const fs::path& project_dir, const std::string& skill_id) {
  return project_dir / ".claude" / ("skill_" + skill_id.substr(0, 8));
}

bool LoadSkillHandle(const store::ProjectConfig& config, const store::SkillRef& skill,
                     SkillHandle& handle, ErrorInfo& error) {
  std::string content;
  std::string read_error;
  if (!store::ReadSkillContent(config.project_dir, skill, content, read_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, read_error);
    return false;
  }
  handle.id = skill.ref_id;
  handle.name = skill.name;
  handle.version = skill.version;
  handle.content = std::move(content);
  handle.working_dir = SkillWorkingDir(config.project_dir, skill.ref_id);
  return true;
}

bool BuildTaskMatrix(const store::ProjectConfig& config, std::vector<Task>& tasks,
                     ErrorInfo& error) {
  tasks.clear();
  if (config.skills.empty()) {
    core::errors::SetError(error, ErrorCode::kInvalidParams,
                           "project " + config.id + " has no skills configured");
    return false;
  }

  std::vector<std::pair<BaselineHandle, std::vector<store::TestCaseSpec>>> baselines;
  for (const auto& baseline : config.baselines) {
    std::vector<store::TestCaseSpec> cases;
    std::string read_error;
    if (!store::LoadBaselineCases(config.project_dir, baseline, cases, read_error)) {
      core::errors::SetError(error, ErrorCode::kIoError, read_error);
      return false;
    }
    baselines.push_back({BaselineHandle{baseline.ref_id, baseline.version}, std::move(cases)});
  }

  std::set<std::string> seen_skills;
  for (const auto& skill : config.skills) {
    if (!seen_skills.insert(skill.ref_id).second) {
      core::errors::SetError(error, ErrorCode::kInvalidParams,
                             "duplicate skill ref_id in project config: " + skill.ref_id);
      return false;
    }
    SkillHandle handle;
    if (!LoadSkillHandle(config, skill, handle, error)) {
      return false;
    }

    // Records are keyed by (skill, case), so a case id may appear only once
    // per skill across all baselines.
    std::set<std::string> seen_cases;
    for (const auto& [baseline, cases] : baselines) {
      for (const auto& spec : cases) {
        if (!seen_cases.insert(spec.case_id).second) {
          core::errors::SetError(error, ErrorCode::kInvalidParams,
                                 "duplicate case id across baselines: " + spec.case_id);
          return false;
        }
        tasks.push_back(Task{handle, TestCase{spec.case_id, spec.input, spec.expected_output},
                             baseline});
      }
    }
  }
  return true;
}

} // namespace skillbench::eval
