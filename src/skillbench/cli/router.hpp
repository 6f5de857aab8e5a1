#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::cli {

// Options every command accepts.
struct CommonOptions {
  std::filesystem::path workspace = "workspace";
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Positional arguments plus `--name value` options, with the common options
// already applied.
struct ParsedArgs {
  CommonOptions common;
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
};

// Every option takes exactly one value. Options outside `allowed` (and the
// common ones) are usage errors.
bool ParseArgs(const std::vector<std::string_view>& args,
               const std::vector<std::string_view>& allowed, ParsedArgs& parsed,
               std::string& error);

// Routes `skillbench` subcommands and returns process exit codes with a
// stable contract for scripts:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => project, record or report not found
//   20 => state conflict (already running / not running / not paused)
//   30 => run interrupted or iteration ended in error
int Dispatch(int argc, char** argv);

} // namespace skillbench::cli
