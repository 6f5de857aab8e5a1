#include "store/workspace.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <utility>

namespace fs = std::filesystem;

namespace skillbench::store {

namespace {

bool ConfigHasId(const fs::path& config_path, const std::string& project_id) {
  core::json::Value root;
  std::string ignored;
  if (!core::ReadJsonFile(config_path, root, ignored)) {
    return false;
  }
  return core::json::GetString(root, "id") == project_id;
}

} // namespace

Workspace::Workspace(fs::path root) : root_(std::move(root)) {}

fs::path Workspace::ProjectsDir() const {
  return root_ / "projects";
}

fs::path Workspace::SkillsDir() const {
  return root_ / "skills";
}

bool Workspace::FindProjectDir(const std::string& project_id, fs::path& project_dir,
                               core::errors::ErrorInfo& error) const {
  if (project_id.empty()) {
    core::errors::SetError(error, core::errors::ErrorCode::kInvalidParams,
                           "project id cannot be empty");
    return false;
  }

  if (IsSafePathComponent(project_id)) {
    const fs::path direct = ProjectsDir() / project_id;
    if (ConfigHasId(direct / "config.json", project_id)) {
      project_dir = direct;
      return true;
    }
  }

  for (const fs::path& candidate : core::ListChildDirectories(ProjectsDir())) {
    if (ConfigHasId(candidate / "config.json", project_id)) {
      project_dir = candidate;
      return true;
    }
  }

  core::errors::SetError(error, core::errors::ErrorCode::kNotFound,
                         "project not found: " + project_id);
  return false;
}

bool IsSafePathComponent(std::string_view id) {
  if (id.empty() || id == "." || id == "..") {
    return false;
  }
  for (const char c : id) {
    if (c == '/' || c == '\\' || c == ':' || static_cast<unsigned char>(c) < 0x20U) {
      return false;
    }
  }
  return true;
}

} // namespace skillbench::store
