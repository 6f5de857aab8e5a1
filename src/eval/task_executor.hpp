#pragma once

#include "core/logging/logger.hpp"
#include "eval/result_record.hpp"
#include "eval/task.hpp"
#include "oracle/oracle_client.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace skillbench::eval {

struct ExecutionSettings {
  std::string model;
  std::chrono::milliseconds timeout{60000};
  std::chrono::milliseconds scoring_timeout{30000};
};

// Runs one task against the oracle and persists its result record.
//
// Contract:
// - never throws; every oracle or parse failure becomes part of the record
// - execution failure => status failed, no scoring call
// - scoring failure => status stays completed with no score (warning logged)
// - writes exactly one record file and never touches run state
class TaskExecutor {
public:
  TaskExecutor(std::shared_ptr<oracle::IOracleClient> oracle, core::logging::Logger logger);

  ResultRecord Execute(const Task& task, const ExecutionSettings& settings,
                       const std::filesystem::path& project_dir) const;

private:
  bool ScoreOutput(const Task& task, const std::string& actual_output,
                   const ExecutionSettings& settings, Score& score, std::string& error) const;

  std::shared_ptr<oracle::IOracleClient> oracle_;
  core::logging::Logger logger_;
};

// Rubric prompt embedding the case input, expected output and actual output.
std::string BuildScoringPrompt(const std::string& input, const std::string& expected_output,
                               const std::string& actual_output);

} // namespace skillbench::eval
