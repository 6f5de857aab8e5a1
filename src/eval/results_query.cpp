#include "eval/results_query.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"

#include <sstream>

namespace fs = std::filesystem;

namespace skillbench::eval {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

bool Matches(const ResultFilter& filter, const ResultRecord& record) {
  if (filter.case_id.has_value() && record.case_id != filter.case_id.value()) {
    return false;
  }
  if (filter.status.has_value() && record.status != filter.status.value()) {
    return false;
  }
  return true;
}

bool CollectRecords(const store::ProjectStore& store, const std::string& project_id,
                    const ResultFilter& filter, fs::path& project_dir,
                    std::vector<ResultRecord>& records, ErrorInfo& error) {
  store::ProjectConfig config;
  if (!store.LoadProject(project_id, config, error)) {
    return false;
  }
  project_dir = config.project_dir;

  for (const auto& skill : config.skills) {
    if (filter.skill_id.has_value() && skill.ref_id != filter.skill_id.value()) {
      continue;
    }
    std::vector<std::string> skipped;
    for (auto& record : LoadSkillResultRecords(config.project_dir, skill.ref_id, skipped)) {
      if (Matches(filter, record)) {
        records.push_back(std::move(record));
      }
    }
  }
  return true;
}

std::string CsvField(std::string_view value) {
  std::string quoted = "\"";
  for (const char c : value) {
    if (c == '"') {
      quoted += "\"\"";
    } else {
      quoted += c;
    }
  }
  quoted += '"';
  return quoted;
}

std::string ScoreField(const ResultRecord& record, std::optional<std::size_t> dimension) {
  if (!record.score.has_value()) {
    return CsvField("");
  }
  const double value =
      dimension.has_value() ? record.score->values[dimension.value()] : record.score->total;
  return CsvField(core::FormatJsonNumber(value));
}

} // namespace

bool QueryResults(const store::ProjectStore& store, const std::string& project_id,
                  const ResultFilter& filter, std::size_t page, std::size_t page_size,
                  ResultPage& result, ErrorInfo& error) {
  if (page == 0U || page_size == 0U) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, "page and page_size must be >= 1");
    return false;
  }

  fs::path project_dir;
  std::vector<ResultRecord> records;
  if (!CollectRecords(store, project_id, filter, project_dir, records, error)) {
    return false;
  }

  result = ResultPage{};
  result.total = records.size();
  result.page = page;
  result.page_size = page_size;
  const std::size_t begin = (page - 1U) * page_size;
  for (std::size_t i = begin; i < records.size() && i < begin + page_size; ++i) {
    result.items.push_back(std::move(records[i]));
  }

  Summary summary;
  std::string summary_error;
  if (LoadSummary(project_dir, summary, summary_error)) {
    result.summary = std::move(summary);
  }
  return true;
}

const char* ToString(ExportFormat format) {
  switch (format) {
  case ExportFormat::kJson:
    return "json";
  case ExportFormat::kCsv:
    return "csv";
  }
  return "json";
}

bool ParseExportFormat(std::string_view text, ExportFormat& format) {
  if (text == "json") {
    format = ExportFormat::kJson;
    return true;
  }
  if (text == "csv") {
    format = ExportFormat::kCsv;
    return true;
  }
  return false;
}

std::string RenderResultsCsv(const std::vector<ResultRecord>& records) {
  std::ostringstream out;
  out << "case_id,skill_id,skill_version,status,duration_ms,model,scores.total";
  for (const auto& info : kScoreDimensions) {
    out << ",scores." << info.key;
  }
  out << ",error\n";

  for (const auto& record : records) {
    out << CsvField(record.case_id) << ',' << CsvField(record.skill_id) << ','
        << CsvField(record.skill_version) << ',' << CsvField(ToString(record.status)) << ','
        << CsvField(std::to_string(record.duration_ms)) << ',' << CsvField(record.model) << ','
        << ScoreField(record, std::nullopt);
    for (std::size_t i = 0; i < kDimensionCount; ++i) {
      out << ',' << ScoreField(record, i);
    }
    out << ',' << CsvField(record.error.value_or("")) << '\n';
  }
  return out.str();
}

bool ExportResults(const store::ProjectStore& store, const std::string& project_id,
                   ExportFormat format, const fs::path& dest, ErrorInfo& error) {
  if (dest.empty()) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, "export destination is required");
    return false;
  }

  fs::path project_dir;
  std::vector<ResultRecord> records;
  if (!CollectRecords(store, project_id, ResultFilter{}, project_dir, records, error)) {
    return false;
  }

  std::string contents;
  if (format == ExportFormat::kCsv) {
    contents = RenderResultsCsv(records);
  } else {
    core::json::Value array = core::json::MakeArray();
    for (const auto& record : records) {
      array.array_value.push_back(ResultRecordToJson(record));
    }
    contents = core::json::Serialize(array);
  }

  std::string io_error;
  if (!core::WriteTextFileAtomic(dest, contents, io_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, io_error);
    return false;
  }
  return true;
}

} // namespace skillbench::eval
