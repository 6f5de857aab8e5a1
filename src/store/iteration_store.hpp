#pragma once

#include "core/errors/error_codes.hpp"
#include "core/json_dom.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace skillbench::store {

// `iterations/round_<n>/config.json`: written "running" when a round starts
// and replaced with "completed" plus the score when it ends.
struct RoundSnapshot {
  std::uint32_t round = 0;
  std::string skill_id;
  std::string skill_name;
  std::string skill_version = "v1";
  std::string retention_rules;
  std::optional<double> avg_score;
  std::string started_at;
  std::string completed_at;
  std::string status = "running";
};

std::filesystem::path IterationsDir(const std::filesystem::path& project_dir);
std::filesystem::path IterationReportPath(const std::filesystem::path& project_dir);
std::filesystem::path ExplorationLogPath(const std::filesystem::path& project_dir);

bool WriteRoundSnapshot(const std::filesystem::path& project_dir, const RoundSnapshot& snapshot,
                        core::errors::ErrorInfo& error);

// All `round_*` snapshots sorted by round number. Unreadable snapshot files
// are reported with status "unknown" rather than failing the scan.
std::vector<RoundSnapshot> ListRoundSnapshots(const std::filesystem::path& project_dir);

// Removes stale round snapshots and final documents before a new iteration.
bool ClearIterationDocuments(const std::filesystem::path& project_dir,
                             core::errors::ErrorInfo& error);

bool WriteIterationDocument(const std::filesystem::path& path, const core::json::Value& document,
                            core::errors::ErrorInfo& error);

// NOT_FOUND when the document has not been written yet.
bool LoadIterationDocument(const std::filesystem::path& path, core::json::Value& document,
                           core::errors::ErrorInfo& error);

} // namespace skillbench::store
