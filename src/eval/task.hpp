#pragma once

#include "core/errors/error_codes.hpp"
#include "store/project_config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace skillbench::eval {

struct SkillHandle {
  std::string id;
  std::string name;
  std::string version;
  std::string content;
  // Isolated oracle working directory: `<project>/.claude/skill_<id8>`.
  std::filesystem::path working_dir;
};

struct BaselineHandle {
  std::string id;
  std::string version;
};

struct TestCase {
  std::string id;
  std::string input;
  std::string expected_output;
};

// One skill x case execution unit. Identity is (skill.id, test_case.id).
struct Task {
  SkillHandle skill;
  TestCase test_case;
  BaselineHandle baseline;
};

std::filesystem::path SkillWorkingDir(const std::filesystem::path& project_dir,
                                      const std::string& skill_id);

// Loads one skill's content into a handle.
bool LoadSkillHandle(const store::ProjectConfig& config, const store::SkillRef& skill,
                     SkillHandle& handle, core::errors::ErrorInfo& error);

// Cross product of configured skills and the cases of every configured
// baseline, in config order (skill-major, then baseline, then case).
bool BuildTaskMatrix(const store::ProjectConfig& config, std::vector<Task>& tasks,
                     core::errors::ErrorInfo& error);

} // namespace skillbench::eval
