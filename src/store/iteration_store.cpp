#include "store/iteration_store.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>

namespace fs = std::filesystem;

namespace skillbench::store {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

constexpr std::string_view kRoundDirPrefix = "round_";

bool ParseRoundDirName(const std::string& name, std::uint32_t& round) {
  if (name.rfind(kRoundDirPrefix, 0) != 0) {
    return false;
  }
  const char* begin = name.data() + kRoundDirPrefix.size();
  const char* end = name.data() + name.size();
  const auto [ptr, ec] = std::from_chars(begin, end, round);
  return ec == std::errc() && ptr == end;
}

core::json::Value SnapshotToJson(const RoundSnapshot& snapshot) {
  core::json::Value root = core::json::MakeObject();
  auto& fields = root.object_value;
  fields["round"] = core::json::MakeNumber(snapshot.round);
  fields["skill_id"] = core::json::MakeString(snapshot.skill_id);
  fields["skill_name"] = core::json::MakeString(snapshot.skill_name);
  fields["skill_version"] = core::json::MakeString(snapshot.skill_version);
  fields["retention_rules"] = core::json::MakeString(snapshot.retention_rules);
  fields["started_at"] = core::json::MakeString(snapshot.started_at);
  fields["status"] = core::json::MakeString(snapshot.status);
  if (snapshot.avg_score.has_value()) {
    fields["avg_score"] = core::json::MakeNumber(snapshot.avg_score.value());
  }
  if (!snapshot.completed_at.empty()) {
    fields["completed_at"] = core::json::MakeString(snapshot.completed_at);
  }
  return root;
}

} // namespace

fs::path IterationsDir(const fs::path& project_dir) {
  return project_dir / "iterations";
}

fs::path IterationReportPath(const fs::path& project_dir) {
  return IterationsDir(project_dir) / "iteration_report.json";
}

fs::path ExplorationLogPath(const fs::path& project_dir) {
  return IterationsDir(project_dir) / "exploration_log.json";
}

bool WriteRoundSnapshot(const fs::path& project_dir, const RoundSnapshot& snapshot,
                        ErrorInfo& error) {
  const fs::path path = IterationsDir(project_dir) /
                        (std::string(kRoundDirPrefix) + std::to_string(snapshot.round)) /
                        "config.json";
  std::string io_error;
  if (!core::WriteJsonFileAtomic(path, SnapshotToJson(snapshot), io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }
  return true;
}

std::vector<RoundSnapshot> ListRoundSnapshots(const fs::path& project_dir) {
  std::vector<RoundSnapshot> snapshots;
  for (const fs::path& dir : core::ListChildDirectories(IterationsDir(project_dir))) {
    std::uint32_t round = 0;
    if (!ParseRoundDirName(dir.filename().string(), round)) {
      continue;
    }

    RoundSnapshot snapshot;
    snapshot.round = round;
    core::json::Value root;
    std::string ignored;
    if (!core::ReadJsonFile(dir / "config.json", root, ignored)) {
      snapshot.status = "unknown";
      snapshots.push_back(snapshot);
      continue;
    }
    snapshot.skill_id = core::json::GetString(root, "skill_id");
    snapshot.skill_name = core::json::GetString(root, "skill_name");
    snapshot.skill_version = core::json::GetString(root, "skill_version", "v1");
    snapshot.retention_rules = core::json::GetString(root, "retention_rules");
    snapshot.avg_score = core::json::GetNumber(root, "avg_score");
    snapshot.started_at = core::json::GetString(root, "started_at");
    snapshot.completed_at = core::json::GetString(root, "completed_at");
    snapshot.status = core::json::GetString(root, "status", "unknown");
    snapshots.push_back(snapshot);
  }

  std::sort(snapshots.begin(), snapshots.end(),
            [](const RoundSnapshot& a, const RoundSnapshot& b) { return a.round < b.round; });
  return snapshots;
}

bool ClearIterationDocuments(const fs::path& project_dir, ErrorInfo& error) {
  std::error_code ec;
  fs::remove_all(IterationsDir(project_dir), ec);
  if (ec) {
    core::errors::SetError(error, ErrorCode::kIoError,
                           "failed to clear iteration documents: " + ec.message());
    return false;
  }
  return true;
}

bool WriteIterationDocument(const fs::path& path, const core::json::Value& document,
                            ErrorInfo& error) {
  std::string io_error;
  if (!core::WriteJsonFileAtomic(path, document, io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }
  return true;
}

bool LoadIterationDocument(const fs::path& path, core::json::Value& document, ErrorInfo& error) {
  if (!core::PathExists(path)) {
    core::errors::SetError(error, ErrorCode::kNotFound,
                           path.filename().string() + " not found; run an iteration first");
    return false;
  }
  std::string io_error;
  if (!core::ReadJsonFile(path, document, io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }
  return true;
}

} // namespace skillbench::store
