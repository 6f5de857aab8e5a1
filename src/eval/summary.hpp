#pragma once

#include "core/json_dom.hpp"
#include "eval/result_record.hpp"
#include "eval/score.hpp"
#include "eval/task.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::eval {

struct SummaryEntry {
  std::string skill_id;
  std::string skill_name;
  std::string skill_version;
  std::uint64_t completed_cases = 0;
  std::uint64_t failed_cases = 0;
  std::uint64_t scored_cases = 0;
  double avg_score = 0.0;
  DimensionScores score_breakdown{};
  std::uint32_t rank = 0;
};

struct Summary {
  std::string project_id;
  std::string generated_at;
  std::uint64_t total_cases = 0;
  std::vector<SummaryEntry> ranking;

  const SummaryEntry* FindSkill(std::string_view skill_id) const;
};

// Half-up rounding to one decimal place.
double RoundToTenth(double value);

// Pure fold of result records into a ranked summary.
//
// - only completed records with a score contribute to averages
// - averages divide by scored cases, not total cases
// - order: avg desc, then completed desc; skills with no scored case last
// - ranks are 1..k without gaps
// Skills appear in `tasks` order before sorting; records for skills with no
// task are ignored.
Summary AggregateSummary(const std::string& project_id, const std::vector<Task>& tasks,
                         const std::vector<ResultRecord>& records);

std::filesystem::path SummaryPath(const std::filesystem::path& project_dir);

core::json::Value SummaryToJson(const Summary& summary);
bool SummaryFromJson(const core::json::Value& root, Summary& summary, std::string& error);

bool WriteSummary(const std::filesystem::path& project_dir, const Summary& summary,
                  std::string& error);

// False with an error when no summary has been written yet.
bool LoadSummary(const std::filesystem::path& project_dir, Summary& summary, std::string& error);

} // namespace skillbench::eval
