#include "eval/result_record.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace skillbench::eval {

namespace {

core::json::Value OptionalString(const std::optional<std::string>& value) {
  return value.has_value() ? core::json::MakeString(value.value()) : core::json::MakeNull();
}

std::optional<std::string> ReadOptionalString(const core::json::Value& root,
                                              std::string_view key) {
  const core::json::Value* field = core::json::FindField(root, key);
  if (field == nullptr || !field->is_string()) {
    return std::nullopt;
  }
  return field->string_value;
}

bool ParseRequiredStringField(const core::json::Value& root, std::string_view key,
                              std::string& value, std::string& error) {
  const core::json::Value* field = core::json::FindField(root, key);
  if (field == nullptr || !field->is_string() || field->string_value.empty()) {
    error = "result record field '" + std::string(key) + "' must be a non-empty string";
    return false;
  }
  value = field->string_value;
  return true;
}

} // namespace

const char* ToString(RecordStatus status) {
  switch (status) {
  case RecordStatus::kCompleted:
    return "completed";
  case RecordStatus::kFailed:
    return "failed";
  }
  return "failed";
}

bool ParseRecordStatus(std::string_view text, RecordStatus& status) {
  if (text == "completed") {
    status = RecordStatus::kCompleted;
    return true;
  }
  if (text == "failed") {
    status = RecordStatus::kFailed;
    return true;
  }
  return false;
}

fs::path ResultsDir(const fs::path& project_dir) {
  return project_dir / "results";
}

fs::path ResultRecordPath(const fs::path& project_dir, std::string_view skill_id,
                          std::string_view case_id) {
  return ResultsDir(project_dir) / std::string(skill_id) / (std::string(case_id) + ".json");
}

core::json::Value ResultRecordToJson(const ResultRecord& record) {
  core::json::Value root = core::json::MakeObject();
  auto& fields = root.object_value;
  fields["case_id"] = core::json::MakeString(record.case_id);
  fields["skill_id"] = core::json::MakeString(record.skill_id);
  fields["skill_version"] = core::json::MakeString(record.skill_version);
  fields["baseline_id"] = core::json::MakeString(record.baseline_id);
  fields["baseline_version"] = core::json::MakeString(record.baseline_version);
  fields["executed_at"] = core::json::MakeString(record.executed_at);
  fields["status"] = core::json::MakeString(ToString(record.status));
  fields["input"] = core::json::MakeString(record.input);
  fields["expected_output"] = core::json::MakeString(record.expected_output);
  fields["actual_output"] = core::json::MakeString(record.actual_output);
  fields["duration_ms"] = core::json::MakeNumber(static_cast<double>(record.duration_ms));
  fields["model"] = core::json::MakeString(record.model);
  fields["error"] = OptionalString(record.error);
  fields["error_code"] = OptionalString(record.error_code);

  if (record.score.has_value() && record.status == RecordStatus::kCompleted) {
    fields["scores"] = ScoresToJson(record.score.value());
    fields["score_reasoning"] = core::json::MakeString(record.score->reasoning);
    fields["score_evaluated_at"] = core::json::MakeString(record.score_evaluated_at);
  } else {
    fields["scores"] = core::json::MakeNull();
    fields["score_reasoning"] = core::json::MakeNull();
    fields["score_evaluated_at"] = core::json::MakeNull();
  }
  return root;
}

bool ResultRecordFromJson(const core::json::Value& root, ResultRecord& record,
                          std::string& error) {
  record = ResultRecord{};
  if (!root.is_object()) {
    error = "result record must be a JSON object";
    return false;
  }
  if (!ParseRequiredStringField(root, "case_id", record.case_id, error) ||
      !ParseRequiredStringField(root, "skill_id", record.skill_id, error)) {
    return false;
  }
  if (!ParseRecordStatus(core::json::GetString(root, "status"), record.status)) {
    error = "result record status must be 'completed' or 'failed'";
    return false;
  }

  record.skill_version = core::json::GetString(root, "skill_version");
  record.baseline_id = core::json::GetString(root, "baseline_id");
  record.baseline_version = core::json::GetString(root, "baseline_version");
  record.executed_at = core::json::GetString(root, "executed_at");
  record.input = core::json::GetString(root, "input");
  record.expected_output = core::json::GetString(root, "expected_output");
  record.actual_output = core::json::GetString(root, "actual_output");
  const double duration = core::json::GetNumberOr(root, "duration_ms", 0.0);
  record.duration_ms = duration > 0.0 ? static_cast<std::uint64_t>(std::llround(duration)) : 0U;
  record.model = core::json::GetString(root, "model");
  record.error = ReadOptionalString(root, "error");
  record.error_code = ReadOptionalString(root, "error_code");

  const core::json::Value* scores = core::json::FindField(root, "scores");
  if (scores != nullptr && scores->is_object() && record.status == RecordStatus::kCompleted) {
    Score score;
    if (!ScoresFromJson(*scores, score, error)) {
      return false;
    }
    score.reasoning = core::json::GetString(root, "score_reasoning");
    record.score = score;
    record.score_evaluated_at = core::json::GetString(root, "score_evaluated_at");
  }
  return true;
}

bool WriteResultRecord(const fs::path& project_dir, const ResultRecord& record,
                       std::string& error) {
  return core::WriteJsonFileAtomic(
      ResultRecordPath(project_dir, record.skill_id, record.case_id),
      ResultRecordToJson(record), error);
}

bool LoadResultRecord(const fs::path& path, ResultRecord& record, std::string& error) {
  core::json::Value root;
  if (!core::ReadJsonFile(path, root, error)) {
    return false;
  }
  if (!ResultRecordFromJson(root, record, error)) {
    error = path.string() + ": " + error;
    return false;
  }
  return true;
}

bool ResultRecordExists(const fs::path& project_dir, std::string_view skill_id,
                        std::string_view case_id) {
  return core::PathExists(ResultRecordPath(project_dir, skill_id, case_id));
}

std::vector<ResultRecord> LoadSkillResultRecords(const fs::path& project_dir,
                                                 std::string_view skill_id,
                                                 std::vector<std::string>& skipped) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(ResultsDir(project_dir) / std::string(skill_id), ec), end;
       !ec && it != end; it.increment(ec)) {
    if (it->is_regular_file(ec) && it->path().extension() == ".json") {
      files.push_back(it->path());
    }
  }
  std::sort(files.begin(), files.end());

  std::vector<ResultRecord> records;
  for (const fs::path& file : files) {
    ResultRecord record;
    std::string error;
    if (!LoadResultRecord(file, record, error)) {
      skipped.push_back(error);
      continue;
    }
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<ResultRecord> LoadAllResultRecords(const fs::path& project_dir,
                                               std::vector<std::string>& skipped) {
  std::vector<ResultRecord> records;
  for (const fs::path& skill_dir : core::ListChildDirectories(ResultsDir(project_dir))) {
    auto skill_records =
        LoadSkillResultRecords(project_dir, skill_dir.filename().string(), skipped);
    records.insert(records.end(), std::make_move_iterator(skill_records.begin()),
                   std::make_move_iterator(skill_records.end()));
  }
  return records;
}

} // namespace skillbench::eval
