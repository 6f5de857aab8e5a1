#include "store/project_config.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace fs = std::filesystem;

namespace skillbench::store {

namespace {

using JsonValue = core::json::Value;
using core::errors::ErrorCode;
using core::errors::ErrorInfo;

bool ParseRequiredStringField(const JsonValue& object, std::string_view key, std::string& value,
                              std::string& error) {
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr) {
    error = "project config missing required field '" + std::string(key) + "'";
    return false;
  }
  if (!field->is_string()) {
    error = "project config field '" + std::string(key) + "' must be a string";
    return false;
  }
  value = field->string_value;
  return true;
}

bool ParseOptionalUnsigned(const JsonValue& object, std::string_view key, std::uint64_t max_value,
                           std::optional<std::uint64_t>& value, std::string& error) {
  value.reset();
  const JsonValue* field = core::json::FindField(object, key);
  if (field == nullptr || field->is_null()) {
    return true;
  }
  const double number = field->number_value;
  if (!field->is_number() || !std::isfinite(number) || number < 0.0 ||
      std::floor(number) != number || number > static_cast<double>(max_value)) {
    error = "project config field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint64_t>(number);
  return true;
}

bool ParseSkillRef(const JsonValue& item, SkillRef& skill, std::string& error) {
  if (!item.is_object()) {
    error = "project config 'skills' entries must be objects";
    return false;
  }
  if (!ParseRequiredStringField(item, "ref_id", skill.ref_id, error) ||
      !ParseRequiredStringField(item, "local_path", skill.local_path, error)) {
    return false;
  }
  skill.name = core::json::GetString(item, "name", skill.ref_id);
  skill.purpose = core::json::GetString(item, "purpose", "general");
  skill.provider = core::json::GetString(item, "provider");
  skill.version = core::json::GetString(item, "version", "v1");
  return true;
}

bool ParseBaselineRef(const JsonValue& item, BaselineRef& baseline, std::string& error) {
  if (!item.is_object()) {
    error = "project config 'baselines' entries must be objects";
    return false;
  }
  if (!ParseRequiredStringField(item, "ref_id", baseline.ref_id, error) ||
      !ParseRequiredStringField(item, "local_path", baseline.local_path, error)) {
    return false;
  }
  baseline.name = core::json::GetString(item, "name", baseline.ref_id);
  baseline.version = core::json::GetString(item, "version", "v1");
  return true;
}

JsonValue SkillRefToJson(const SkillRef& skill) {
  JsonValue object = core::json::MakeObject();
  object.object_value["ref_id"] = core::json::MakeString(skill.ref_id);
  object.object_value["name"] = core::json::MakeString(skill.name);
  object.object_value["purpose"] = core::json::MakeString(skill.purpose);
  object.object_value["provider"] = core::json::MakeString(skill.provider);
  object.object_value["version"] = core::json::MakeString(skill.version);
  object.object_value["local_path"] = core::json::MakeString(skill.local_path);
  return object;
}

JsonValue ProgressToJson(const ProgressCounters& progress) {
  JsonValue object = core::json::MakeObject();
  object.object_value["total_tasks"] =
      core::json::MakeNumber(static_cast<double>(progress.total_tasks));
  object.object_value["completed_tasks"] =
      core::json::MakeNumber(static_cast<double>(progress.completed_tasks));
  object.object_value["failed_tasks"] =
      core::json::MakeNumber(static_cast<double>(progress.failed_tasks));
  object.object_value["last_checkpoint"] =
      core::json::MakeNumber(static_cast<double>(progress.last_checkpoint));
  return object;
}

fs::path ConfigPath(const fs::path& project_dir) {
  return project_dir / "config.json";
}

} // namespace

const char* ToString(ProjectStatus status) {
  switch (status) {
  case ProjectStatus::kPending:
    return "pending";
  case ProjectStatus::kRunning:
    return "running";
  case ProjectStatus::kPaused:
    return "paused";
  case ProjectStatus::kInterrupted:
    return "interrupted";
  case ProjectStatus::kCompleted:
    return "completed";
  }
  return "pending";
}

bool ParseProjectStatus(std::string_view text, ProjectStatus& status) {
  static constexpr ProjectStatus kAll[] = {
      ProjectStatus::kPending,     ProjectStatus::kRunning,   ProjectStatus::kPaused,
      ProjectStatus::kInterrupted, ProjectStatus::kCompleted,
  };
  for (const ProjectStatus candidate : kAll) {
    if (text == ToString(candidate)) {
      status = candidate;
      return true;
    }
  }
  return false;
}

const SkillRef* ProjectConfig::FindSkill(std::string_view skill_id) const {
  const auto it = std::find_if(skills.begin(), skills.end(),
                               [&](const SkillRef& skill) { return skill.ref_id == skill_id; });
  return it == skills.end() ? nullptr : &(*it);
}

bool ProjectConfig::IsOriginalSkill(std::string_view skill_id) const {
  return std::find(original_skill_ids.begin(), original_skill_ids.end(), skill_id) !=
         original_skill_ids.end();
}

ProgressCounters MakeProgress(std::uint64_t total, std::uint64_t completed, std::uint64_t failed) {
  ProgressCounters progress;
  progress.total_tasks = total;
  progress.completed_tasks = completed;
  progress.failed_tasks = failed;
  progress.last_checkpoint = completed + failed;
  return progress;
}

bool ParseProjectConfig(const JsonValue& root, ProjectConfig& config, std::string& error) {
  config = ProjectConfig{};
  if (!root.is_object()) {
    error = "project config must be a JSON object";
    return false;
  }
  if (!ParseRequiredStringField(root, "id", config.id, error)) {
    return false;
  }
  config.name = core::json::GetString(root, "name", config.id);
  config.updated_at = core::json::GetString(root, "updated_at");

  const std::string status_text = core::json::GetString(root, "status", "pending");
  if (!ParseProjectStatus(status_text, config.status)) {
    error = "project config has unknown status '" + status_text + "'";
    return false;
  }

  if (const JsonValue* skills = core::json::FindField(root, "skills"); skills != nullptr) {
    if (!skills->is_array()) {
      error = "project config field 'skills' must be an array";
      return false;
    }
    for (const JsonValue& item : skills->array_value) {
      SkillRef skill;
      if (!ParseSkillRef(item, skill, error)) {
        return false;
      }
      config.skills.push_back(std::move(skill));
    }
  }

  if (const JsonValue* baselines = core::json::FindField(root, "baselines");
      baselines != nullptr) {
    if (!baselines->is_array()) {
      error = "project config field 'baselines' must be an array";
      return false;
    }
    for (const JsonValue& item : baselines->array_value) {
      BaselineRef baseline;
      if (!ParseBaselineRef(item, baseline, error)) {
        return false;
      }
      config.baselines.push_back(std::move(baseline));
    }
  }

  config.original_skill_ids = core::json::GetStringArray(root, "original_skill_ids");

  constexpr auto kU32Max = static_cast<std::uint64_t>(std::numeric_limits<std::uint32_t>::max());
  std::optional<std::uint64_t> number;
  if (const JsonValue* cli = core::json::FindField(root, "cli_config");
      cli != nullptr && cli->is_object()) {
    config.cli.model = core::json::GetString(*cli, "model");
    if (!ParseOptionalUnsigned(*cli, "timeout_seconds", kU32Max, number, error)) {
      return false;
    }
    config.cli.timeout_seconds = static_cast<std::uint32_t>(number.value_or(0));
    if (!ParseOptionalUnsigned(*cli, "retry_count", kU32Max, number, error)) {
      return false;
    }
    if (number.has_value()) {
      config.cli.retry_count = static_cast<std::uint32_t>(number.value());
    }
  }

  if (const JsonValue* iteration = core::json::FindField(root, "iteration_config");
      iteration != nullptr && iteration->is_object()) {
    if (!ParseOptionalUnsigned(*iteration, "beam_width", kU32Max, number, error)) {
      return false;
    }
    config.iteration.beam_width = static_cast<std::uint32_t>(number.value_or(1));
    config.iteration.plateau_threshold =
        core::json::GetNumberOr(*iteration, "plateau_threshold", 1.0);
    if (!ParseOptionalUnsigned(*iteration, "plateau_rounds_before_escape", kU32Max, number,
                               error)) {
      return false;
    }
    config.iteration.plateau_rounds_before_escape =
        static_cast<std::uint32_t>(number.value_or(2));
  }

  if (const JsonValue* progress = core::json::FindField(root, "progress");
      progress != nullptr && progress->is_object()) {
    constexpr auto kU64Max = std::numeric_limits<std::uint64_t>::max();
    std::optional<std::uint64_t> total;
    std::optional<std::uint64_t> completed;
    std::optional<std::uint64_t> failed;
    if (!ParseOptionalUnsigned(*progress, "total_tasks", kU64Max, total, error) ||
        !ParseOptionalUnsigned(*progress, "completed_tasks", kU64Max, completed, error) ||
        !ParseOptionalUnsigned(*progress, "failed_tasks", kU64Max, failed, error)) {
      return false;
    }
    config.progress = MakeProgress(total.value_or(0), completed.value_or(0), failed.value_or(0));
  }

  return true;
}

bool ReadSkillContent(const fs::path& project_dir, const SkillRef& skill, std::string& content,
                      std::string& error) {
  const fs::path path = project_dir / skill.local_path / "content.txt";
  if (!core::ReadTextFile(path, content, error)) {
    error = "skill '" + skill.ref_id + "' content unavailable: " + error;
    return false;
  }
  return true;
}

bool LoadBaselineCases(const fs::path& project_dir, const BaselineRef& baseline,
                       std::vector<TestCaseSpec>& cases, std::string& error) {
  cases.clear();
  const fs::path path = project_dir / baseline.local_path / "cases.json";
  if (!core::PathExists(path)) {
    return true;
  }

  JsonValue root;
  if (!core::ReadJsonFile(path, root, error)) {
    return false;
  }
  const JsonValue* items = core::json::FindField(root, "cases");
  if (items == nullptr) {
    return true;
  }
  if (!items->is_array()) {
    error = "baseline '" + baseline.ref_id + "' field 'cases' must be an array";
    return false;
  }

  for (const JsonValue& item : items->array_value) {
    TestCaseSpec spec;
    if (!ParseRequiredStringField(item, "case_id", spec.case_id, error)) {
      error = "baseline '" + baseline.ref_id + "': " + error;
      return false;
    }
    if (!IsSafePathComponent(spec.case_id)) {
      error = "baseline '" + baseline.ref_id + "' has invalid case_id '" + spec.case_id + "'";
      return false;
    }
    spec.input = core::json::GetString(item, "input");
    spec.expected_output = core::json::GetString(item, "expected_output");
    cases.push_back(std::move(spec));
  }
  return true;
}

ProjectStore::ProjectStore(fs::path workspace_root) : workspace_(std::move(workspace_root)) {}

bool ProjectStore::FindProjectDir(const std::string& project_id, fs::path& project_dir,
                                  ErrorInfo& error) const {
  return workspace_.FindProjectDir(project_id, project_dir, error);
}

bool ProjectStore::LoadProject(const std::string& project_id, ProjectConfig& config,
                               ErrorInfo& error) const {
  fs::path project_dir;
  if (!FindProjectDir(project_id, project_dir, error)) {
    return false;
  }
  return LoadProjectAt(project_dir, config, error);
}

bool ProjectStore::LoadProjectAt(const fs::path& project_dir, ProjectConfig& config,
                                 ErrorInfo& error) const {
  JsonValue root;
  std::string read_error;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!core::ReadJsonFile(ConfigPath(project_dir), root, read_error)) {
      core::errors::SetError(error, ErrorCode::kNotFound, read_error);
      return false;
    }
  }
  std::string parse_error;
  if (!ParseProjectConfig(root, config, parse_error)) {
    core::errors::SetError(error, ErrorCode::kIoError,
                           ConfigPath(project_dir).string() + ": " + parse_error);
    return false;
  }
  config.project_dir = project_dir;
  return true;
}

bool ProjectStore::UpdateDocument(
    const fs::path& project_dir,
    const std::function<bool(JsonValue&, std::string&)>& mutate, ErrorInfo& error) {
  std::lock_guard<std::mutex> lock(mu_);
  const fs::path path = ConfigPath(project_dir);
  JsonValue root;
  std::string io_error;
  if (!core::ReadJsonFile(path, root, io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }
  if (!root.is_object()) {
    core::errors::SetError(error, ErrorCode::kIoError,
                           "project config '" + path.string() + "' must be a JSON object");
    return false;
  }

  std::string mutate_error;
  if (!mutate(root, mutate_error)) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, mutate_error);
    return false;
  }
  root.object_value["updated_at"] = core::json::MakeString(core::NowUtcTimestamp());

  if (!core::WriteJsonFileAtomic(path, root, io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }
  return true;
}

bool ProjectStore::WriteCheckpoint(const fs::path& project_dir, const ProgressCounters& progress,
                                   std::optional<ProjectStatus> status, ErrorInfo& error) {
  return UpdateDocument(
      project_dir,
      [&](JsonValue& root, std::string&) {
        root.object_value["progress"] = ProgressToJson(progress);
        if (status.has_value()) {
          root.object_value["status"] = core::json::MakeString(ToString(status.value()));
        }
        return true;
      },
      error);
}

bool ProjectStore::WriteStatus(const fs::path& project_dir, ProjectStatus status,
                               ErrorInfo& error) {
  return UpdateDocument(
      project_dir,
      [&](JsonValue& root, std::string&) {
        root.object_value["status"] = core::json::MakeString(ToString(status));
        return true;
      },
      error);
}

bool ProjectStore::ReplaceIterationCandidate(const fs::path& project_dir,
                                             const SkillRef& candidate, ErrorInfo& error) {
  return UpdateDocument(
      project_dir,
      [&](JsonValue& root, std::string& mutate_error) {
        const std::vector<std::string> originals =
            core::json::GetStringArray(root, "original_skill_ids");
        JsonValue skills = core::json::MakeArray();
        if (const JsonValue* existing = core::json::FindField(root, "skills");
            existing != nullptr) {
          if (!existing->is_array()) {
            mutate_error = "project config field 'skills' must be an array";
            return false;
          }
          for (const JsonValue& item : existing->array_value) {
            const std::string ref_id = core::json::GetString(item, "ref_id");
            if (ref_id == candidate.ref_id) {
              continue;
            }
            if (std::find(originals.begin(), originals.end(), ref_id) != originals.end()) {
              skills.array_value.push_back(item);
            }
          }
        }
        skills.array_value.push_back(SkillRefToJson(candidate));
        root.object_value["skills"] = std::move(skills);
        return true;
      },
      error);
}

} // namespace skillbench::store
