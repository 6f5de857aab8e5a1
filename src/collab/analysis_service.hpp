#pragma once

#include "collab/analysis_report.hpp"
#include "core/errors/error_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/worker_set.hpp"
#include "eval/result_record.hpp"
#include "eval/summary.hpp"
#include "oracle/oracle_client.hpp"
#include "store/project_config.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace skillbench::collab {

struct OracleCallSettings {
  std::string model = "claude-opus-4-6";
  std::chrono::milliseconds timeout{60000};
};

struct AnalysisCompletion {
  std::string project_id;
  std::string task_id;
  bool succeeded = false;
  std::string error;
};

using AnalysisCallback = std::function<void(const AnalysisCompletion&)>;

// Cross-skill comparison prompt: skill texts, score summary, per-dimension
// table and the three cases with the widest score spread. `skill_contents`
// maps skill id to prompt text.
std::string BuildAnalysisPrompt(const store::ProjectConfig& config, const eval::Summary& summary,
                                const std::map<std::string, std::string>& skill_contents,
                                const std::vector<eval::ResultRecord>& records);

// Oracle-backed difference analysis of a finished test run.
class AnalysisService {
public:
  AnalysisService(std::shared_ptr<store::ProjectStore> store,
                  std::shared_ptr<oracle::IOracleClient> oracle, OracleCallSettings settings,
                  core::logging::Logger logger);
  ~AnalysisService();

  AnalysisService(const AnalysisService&) = delete;
  AnalysisService& operator=(const AnalysisService&) = delete;

  // Validates the project, then analyzes on a background thread and reports
  // through `on_complete`.
  bool RunAnalysis(const std::string& project_id, AnalysisCallback on_complete,
                   std::string& task_id, core::errors::ErrorInfo& error);

  // Blocking form; writes `analysis_report.json`.
  bool Analyze(const std::string& project_id, AnalysisReport& report,
               core::errors::ErrorInfo& error) const;

  void WaitIdle();

private:
  std::shared_ptr<store::ProjectStore> store_;
  std::shared_ptr<oracle::IOracleClient> oracle_;
  OracleCallSettings settings_;
  core::logging::Logger logger_;
  core::WorkerSet workers_;
};

} // namespace skillbench::collab
