#pragma once

#include "core/errors/error_codes.hpp"
#include "eval/result_record.hpp"
#include "eval/summary.hpp"
#include "store/project_config.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::eval {

struct ResultFilter {
  std::optional<std::string> skill_id;
  std::optional<std::string> case_id;
  std::optional<RecordStatus> status;
};

struct ResultPage {
  std::vector<ResultRecord> items;
  std::size_t total = 0;
  std::size_t page = 1;
  std::size_t page_size = 20;
  // Absent until a run has completed once.
  std::optional<Summary> summary;
};

// Records of the configured skills (config order, then case file order) that
// match every set filter field. `page` is 1-based.
bool QueryResults(const store::ProjectStore& store, const std::string& project_id,
                  const ResultFilter& filter, std::size_t page, std::size_t page_size,
                  ResultPage& result, core::errors::ErrorInfo& error);

enum class ExportFormat {
  kJson,
  kCsv,
};

const char* ToString(ExportFormat format);
bool ParseExportFormat(std::string_view text, ExportFormat& format);

// Writes every record of the project to `dest`: a JSON array of records, or
// CSV with one quoted row per record.
bool ExportResults(const store::ProjectStore& store, const std::string& project_id,
                   ExportFormat format, const std::filesystem::path& dest,
                   core::errors::ErrorInfo& error);

// CSV rendering used by ExportResults.
std::string RenderResultsCsv(const std::vector<ResultRecord>& records);

} // namespace skillbench::eval
