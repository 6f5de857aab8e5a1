#include "store/skill_library.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/time_utils.hpp"

#include <cctype>
#include <utility>

namespace fs = std::filesystem;

namespace skillbench::store {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

core::json::Value MetaToJson(const SkillMeta& meta) {
  core::json::Value root = core::json::MakeObject();
  auto& fields = root.object_value;
  fields["id"] = core::json::MakeString(meta.id);
  fields["name"] = core::json::MakeString(meta.name);
  fields["description"] = core::json::MakeString(meta.description);
  fields["source"] = core::json::MakeString(meta.source);
  fields["purpose"] = core::json::MakeString(meta.purpose);
  fields["provider"] = core::json::MakeString(meta.provider);
  fields["type"] = core::json::MakeString("skill");
  fields["version"] = core::json::MakeString(meta.version);
  fields["version_count"] = core::json::MakeNumber(1);
  fields["content_file"] = core::json::MakeString("content.txt");
  fields["status"] = core::json::MakeString("active");
  fields["created_at"] = core::json::MakeString(meta.created_at);
  fields["updated_at"] = core::json::MakeString(meta.created_at);
  return root;
}

} // namespace

std::string SkillDirName(const std::string& skill_id, const std::string& version) {
  return "skill_" + skill_id.substr(0, 8) + "_" + version;
}

int VersionNumber(const std::string& version) {
  if (version.size() < 2 || version.front() != 'v') {
    return 0;
  }
  int number = 0;
  for (std::size_t i = 1; i < version.size(); ++i) {
    if (std::isdigit(static_cast<unsigned char>(version[i])) == 0) {
      return 0;
    }
    number = number * 10 + (version[i] - '0');
  }
  return number;
}

SkillLibrary::SkillLibrary(fs::path workspace_root) : workspace_(std::move(workspace_root)) {}

bool SkillLibrary::SaveSkill(const std::string& content, SkillMeta meta, std::string& skill_id,
                             fs::path& skill_dir, ErrorInfo& error) {
  if (content.empty()) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, "skill content is required");
    return false;
  }
  if (meta.name.empty() || meta.purpose.empty() || meta.provider.empty()) {
    core::errors::SetError(error, ErrorCode::kInvalidParams,
                           "skill meta requires name, purpose and provider");
    return false;
  }
  if (!IsSafePathComponent(meta.purpose) || !IsSafePathComponent(meta.provider)) {
    core::errors::SetError(error, ErrorCode::kInvalidParams,
                           "skill purpose/provider must be plain directory names");
    return false;
  }

  meta.id = core::MakeRandomUuid();
  meta.version = "v1";
  meta.created_at = core::NowUtcTimestamp();
  const fs::path dir = workspace_.SkillsDir() / meta.purpose / meta.provider /
                       SkillDirName(meta.id, meta.version);

  std::string io_error;
  if (!core::WriteTextFileAtomic(dir / "content.txt", content, io_error) ||
      !core::WriteJsonFileAtomic(dir / "meta.json", MetaToJson(meta), io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }

  skill_id = meta.id;
  skill_dir = dir;
  return true;
}

bool SkillLibrary::FindSkillDir(const std::string& skill_id, fs::path& skill_dir,
                                ErrorInfo& error) const {
  if (skill_id.size() < 8U) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, "invalid skill id: " + skill_id);
    return false;
  }
  const std::string prefix = "skill_" + skill_id.substr(0, 8) + "_";

  int best_version = -1;
  for (const fs::path& purpose_dir : core::ListChildDirectories(workspace_.SkillsDir())) {
    for (const fs::path& provider_dir : core::ListChildDirectories(purpose_dir)) {
      for (const fs::path& candidate : core::ListChildDirectories(provider_dir)) {
        const std::string name = candidate.filename().string();
        if (name.rfind(prefix, 0) != 0) {
          continue;
        }
        // Eight characters can collide; the meta id is authoritative.
        core::json::Value meta;
        std::string ignored;
        if (core::ReadJsonFile(candidate / "meta.json", meta, ignored) &&
            core::json::GetString(meta, "id", skill_id) != skill_id) {
          continue;
        }
        const int version = VersionNumber(name.substr(prefix.size()));
        if (version > best_version) {
          best_version = version;
          skill_dir = candidate;
        }
      }
    }
  }

  if (best_version < 0) {
    core::errors::SetError(error, ErrorCode::kNotFound, "skill not found: " + skill_id);
    return false;
  }
  return true;
}

bool SkillLibrary::LoadMeta(const fs::path& skill_dir, SkillMeta& meta, ErrorInfo& error) const {
  core::json::Value root;
  std::string io_error;
  if (!core::ReadJsonFile(skill_dir / "meta.json", root, io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }
  meta = SkillMeta{};
  meta.id = core::json::GetString(root, "id");
  meta.name = core::json::GetString(root, "name");
  meta.description = core::json::GetString(root, "description");
  meta.purpose = core::json::GetString(root, "purpose", "general");
  meta.provider = core::json::GetString(root, "provider");
  meta.source = core::json::GetString(root, "source");
  meta.version = core::json::GetString(root, "version", "v1");
  meta.created_at = core::json::GetString(root, "created_at");
  return true;
}

} // namespace skillbench::store
