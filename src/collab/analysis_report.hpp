#pragma once

#include "core/errors/error_codes.hpp"
#include "core/json_dom.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace skillbench::collab {

// Prompt fragment judged responsible for a skill's lead on one dimension.
struct AdvantageSegment {
  std::string id;
  std::string skill_id;
  std::string skill_name;
  // role | instruction | constraint | format | example
  std::string type;
  std::string content;
  std::string reason;
  std::string dimension;
};

struct AnalysisIssue {
  std::string skill_id;
  std::string skill_name;
  std::string dimension;
  std::string description;
};

// `<project>/analysis_report.json`.
struct AnalysisReport {
  std::string project_id;
  std::string generated_at;
  std::string best_skill_id;
  std::string best_skill_name;
  // dimension key -> leading skill id
  std::map<std::string, std::string> dimension_leaders;
  std::vector<AdvantageSegment> advantage_segments;
  std::vector<AnalysisIssue> issues;
};

std::filesystem::path AnalysisReportPath(const std::filesystem::path& project_dir);

// Lenient decode: missing or mistyped fields become empty. Used both for the
// oracle's structured answer and for the stored report.
void AnalysisReportFromJson(const core::json::Value& root, AnalysisReport& report);
core::json::Value AnalysisReportToJson(const AnalysisReport& report);

bool WriteAnalysisReport(const std::filesystem::path& project_dir, const AnalysisReport& report,
                         core::errors::ErrorInfo& error);

// NOT_FOUND when analysis has not run yet.
bool LoadAnalysisReport(const std::filesystem::path& project_dir, AnalysisReport& report,
                        core::errors::ErrorInfo& error);

} // namespace skillbench::collab
