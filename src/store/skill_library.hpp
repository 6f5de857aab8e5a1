#pragma once

#include "core/errors/error_codes.hpp"
#include "store/workspace.hpp"

#include <filesystem>
#include <string>

namespace skillbench::store {

struct SkillMeta {
  std::string id;
  std::string name;
  std::string description;
  std::string purpose = "general";
  std::string provider;
  std::string source;
  std::string version = "v1";
  std::string created_at;
};

// Workspace-level skill assets, one directory per skill version:
// `skills/<purpose>/<provider>/skill_<id8>_<version>/{content.txt,meta.json}`.
class SkillLibrary {
public:
  explicit SkillLibrary(std::filesystem::path workspace_root);

  // Stores `content` as version v1 of a new skill and returns its id.
  // `meta.name`, `meta.purpose` and `meta.provider` are required.
  bool SaveSkill(const std::string& content, SkillMeta meta, std::string& skill_id,
                 std::filesystem::path& skill_dir, core::errors::ErrorInfo& error);

  // Highest version directory for `skill_id`.
  bool FindSkillDir(const std::string& skill_id, std::filesystem::path& skill_dir,
                    core::errors::ErrorInfo& error) const;

  bool LoadMeta(const std::filesystem::path& skill_dir, SkillMeta& meta,
                core::errors::ErrorInfo& error) const;

private:
  Workspace workspace_;
};

// `skill_<first 8 chars of id>_<version>`.
std::string SkillDirName(const std::string& skill_id, const std::string& version);

// Numeric part of `vN`; 0 when malformed.
int VersionNumber(const std::string& version);

} // namespace skillbench::store
