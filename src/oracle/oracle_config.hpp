#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace skillbench::oracle {

// Workspace-wide oracle settings from `<workspace>/cli/config.json`.
struct OracleConfig {
  std::string cli_path = "claude";
  std::string default_model = "claude-opus-4-6";
  std::uint32_t default_timeout_seconds = 60;
  std::uint32_t default_retry_count = 2;
  std::uint32_t scoring_timeout_seconds = 30;
  std::uint32_t analysis_timeout_seconds = 60;
};

std::filesystem::path OracleConfigPath(const std::filesystem::path& workspace_root);

// Missing file yields defaults. A present but malformed file is an error so a
// typo never silently falls back to another model.
bool LoadOracleConfig(const std::filesystem::path& workspace_root, OracleConfig& config,
                      std::string& error);

} // namespace skillbench::oracle
