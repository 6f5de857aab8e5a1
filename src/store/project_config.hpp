#pragma once

#include "core/errors/error_codes.hpp"
#include "core/json_dom.hpp"
#include "store/workspace.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::store {

// Persisted project lifecycle. Mirrors the run state machine:
// pending -> running -> {paused <-> running} -> {completed | interrupted}.
enum class ProjectStatus {
  kPending,
  kRunning,
  kPaused,
  kInterrupted,
  kCompleted,
};

const char* ToString(ProjectStatus status);
bool ParseProjectStatus(std::string_view text, ProjectStatus& status);

struct SkillRef {
  std::string ref_id;
  std::string name;
  std::string purpose;
  std::string provider;
  std::string version = "v1";
  // Relative to the project directory, e.g. `skills/skill_iter_v2`.
  std::string local_path;
};

struct BaselineRef {
  std::string ref_id;
  std::string name;
  std::string version = "v1";
  std::string local_path;
};

struct TestCaseSpec {
  std::string case_id;
  std::string input;
  std::string expected_output;
};

struct CliSettings {
  // Empty means "use the workspace default model".
  std::string model;
  std::uint32_t timeout_seconds = 0;
  std::optional<std::uint32_t> retry_count;
};

struct IterationDefaults {
  std::uint32_t beam_width = 1;
  double plateau_threshold = 1.0;
  std::uint32_t plateau_rounds_before_escape = 2;
};

// Checkpoint counters. `last_checkpoint` is always completed + failed.
struct ProgressCounters {
  std::uint64_t total_tasks = 0;
  std::uint64_t completed_tasks = 0;
  std::uint64_t failed_tasks = 0;
  std::uint64_t last_checkpoint = 0;
};

struct ProjectConfig {
  std::string id;
  std::string name;
  ProjectStatus status = ProjectStatus::kPending;
  std::filesystem::path project_dir;
  std::vector<SkillRef> skills;
  std::vector<BaselineRef> baselines;
  std::vector<std::string> original_skill_ids;
  CliSettings cli;
  IterationDefaults iteration;
  ProgressCounters progress;
  std::string updated_at;

  const SkillRef* FindSkill(std::string_view skill_id) const;
  bool IsOriginalSkill(std::string_view skill_id) const;
};

ProgressCounters MakeProgress(std::uint64_t total, std::uint64_t completed, std::uint64_t failed);

// Decodes a project config document. Unknown fields are ignored here and kept
// by the whole-document rewrites in ProjectStore.
bool ParseProjectConfig(const core::json::Value& root, ProjectConfig& config, std::string& error);

// Reads `<project>/<skill.local_path>/content.txt`.
bool ReadSkillContent(const std::filesystem::path& project_dir, const SkillRef& skill,
                      std::string& content, std::string& error);

// Reads `<project>/<baseline.local_path>/cases.json` (`{"cases": [...]}`).
// A baseline without a cases file contributes no cases.
bool LoadBaselineCases(const std::filesystem::path& project_dir, const BaselineRef& baseline,
                       std::vector<TestCaseSpec>& cases, std::string& error);

// Serialized access to project config documents.
//
// Every mutation is a whole-document read/modify/replace under one in-process
// lock, so concurrent skill streams can checkpoint without losing fields.
class ProjectStore {
public:
  explicit ProjectStore(std::filesystem::path workspace_root);

  const Workspace& workspace() const {
    return workspace_;
  }

  bool FindProjectDir(const std::string& project_id, std::filesystem::path& project_dir,
                      core::errors::ErrorInfo& error) const;

  bool LoadProject(const std::string& project_id, ProjectConfig& config,
                   core::errors::ErrorInfo& error) const;

  bool LoadProjectAt(const std::filesystem::path& project_dir, ProjectConfig& config,
                     core::errors::ErrorInfo& error) const;

  // Writes `progress` and `updated_at`; `status` too when provided.
  bool WriteCheckpoint(const std::filesystem::path& project_dir, const ProgressCounters& progress,
                       std::optional<ProjectStatus> status, core::errors::ErrorInfo& error);

  bool WriteStatus(const std::filesystem::path& project_dir, ProjectStatus status,
                   core::errors::ErrorInfo& error);

  // Keeps every original skill, drops any previous non-original entry and
  // appends `candidate` as the sole iteration candidate.
  bool ReplaceIterationCandidate(const std::filesystem::path& project_dir,
                                 const SkillRef& candidate, core::errors::ErrorInfo& error);

private:
  bool UpdateDocument(const std::filesystem::path& project_dir,
                      const std::function<bool(core::json::Value&, std::string&)>& mutate,
                      core::errors::ErrorInfo& error);

  Workspace workspace_;
  mutable std::mutex mu_;
};

} // namespace skillbench::store
