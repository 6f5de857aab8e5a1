#pragma once

#include "core/json_dom.hpp"
#include "eval/score.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::eval {

enum class RecordStatus {
  kCompleted,
  kFailed,
};

const char* ToString(RecordStatus status);
bool ParseRecordStatus(std::string_view text, RecordStatus& status);

// Persisted outcome of one (skill, case) task. A failed record never carries
// a score.
struct ResultRecord {
  std::string case_id;
  std::string skill_id;
  std::string skill_version;
  std::string baseline_id;
  std::string baseline_version;
  std::string executed_at;
  RecordStatus status = RecordStatus::kFailed;
  std::string input;
  std::string expected_output;
  std::string actual_output;
  std::uint64_t duration_ms = 0;
  std::string model;
  std::optional<std::string> error;
  std::optional<std::string> error_code;
  std::optional<Score> score;
  std::string score_evaluated_at;
};

std::filesystem::path ResultsDir(const std::filesystem::path& project_dir);

// `<project>/results/<skill_id>/<case_id>.json`. Existence of this file marks
// the task as done for resume.
std::filesystem::path ResultRecordPath(const std::filesystem::path& project_dir,
                                       std::string_view skill_id, std::string_view case_id);

core::json::Value ResultRecordToJson(const ResultRecord& record);
bool ResultRecordFromJson(const core::json::Value& root, ResultRecord& record,
                          std::string& error);

// Atomic replace: a reader never observes a half-written record.
bool WriteResultRecord(const std::filesystem::path& project_dir, const ResultRecord& record,
                       std::string& error);

bool LoadResultRecord(const std::filesystem::path& path, ResultRecord& record,
                      std::string& error);

bool ResultRecordExists(const std::filesystem::path& project_dir, std::string_view skill_id,
                        std::string_view case_id);

// Records of one skill ordered by case file name. Unreadable files are
// skipped and listed in `skipped`.
std::vector<ResultRecord> LoadSkillResultRecords(const std::filesystem::path& project_dir,
                                                 std::string_view skill_id,
                                                 std::vector<std::string>& skipped);

// Every record under `results/`, ordered by skill directory then case file
// name.
std::vector<ResultRecord> LoadAllResultRecords(const std::filesystem::path& project_dir,
                                               std::vector<std::string>& skipped);

} // namespace skillbench::eval
