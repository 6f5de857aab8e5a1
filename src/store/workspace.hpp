#pragma once

#include "core/errors/error_codes.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace skillbench::store {

// Workspace layout:
//   <root>/cli/config.json                      oracle settings
//   <root>/projects/<dir>/config.json           one project per directory
//   <root>/skills/<purpose>/<provider>/skill_<id8>_<version>/
class Workspace {
public:
  explicit Workspace(std::filesystem::path root);

  const std::filesystem::path& root() const {
    return root_;
  }

  std::filesystem::path ProjectsDir() const;
  std::filesystem::path SkillsDir() const;

  // Resolves a project id to its directory. Tries `projects/<id>` first, then
  // scans every project config for a matching `id` field.
  bool FindProjectDir(const std::string& project_id, std::filesystem::path& project_dir,
                      core::errors::ErrorInfo& error) const;

private:
  std::filesystem::path root_;
};

// Ids become directory and file names; reject anything that could escape the
// project tree.
bool IsSafePathComponent(std::string_view id);

} // namespace skillbench::store
