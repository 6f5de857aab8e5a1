#include "eval/task_executor.hpp"

#include "core/fs_utils.hpp"
#include "core/json_utils.hpp"
#include "core/time_utils.hpp"
#include "oracle/structured_output.hpp"

#include <sstream>
#include <utility>

namespace skillbench::eval {

namespace {

constexpr std::string_view kScoringRubric = R"(You are a strict code-quality reviewer. Score the actual output below against the test input and the expected output description using this six-dimension rubric.

1. functional_correctness (0-30): does the output implement what the input asks for, is the core logic correct, are the key points of the expected output met
2. robustness (0-20): are error cases handled, are edge conditions (empty, huge, invalid input) covered
3. readability (0-15): are names meaningful, is the structure easy to follow, are comments present where they help
4. conciseness (0-15): is there redundant or repeated logic, is the implementation tight
5. complexity_control (0-10): is unnecessary nesting avoided, are functions split sensibly
6. format_compliance (0-10): does it follow the usual conventions of its language, is indentation and spacing consistent

Rules:
- Reply with JSON only, no prose and no markdown fences.
- total must equal the sum of the six dimensions.

Reply format:
{
  "scores": {
    "functional_correctness": <integer 0-30>,
    "robustness": <integer 0-20>,
    "readability": <integer 0-15>,
    "conciseness": <integer 0-15>,
    "complexity_control": <integer 0-10>,
    "format_compliance": <integer 0-10>,
    "total": <sum of the six>
  },
  "reasoning": "<one short justification per dimension>"
}
)";

} // namespace

std::string BuildScoringPrompt(const std::string& input, const std::string& expected_output,
                               const std::string& actual_output) {
  std::ostringstream prompt;
  prompt << kScoringRubric << "\n[Test input]\n"
         << input << "\n\n[Expected output]\n"
         << expected_output << "\n\n[Actual output]\n"
         << actual_output << "\n";
  return prompt.str();
}

TaskExecutor::TaskExecutor(std::shared_ptr<oracle::IOracleClient> oracle,
                           core::logging::Logger logger)
    : oracle_(std::move(oracle)), logger_(logger.WithComponent("task-executor")) {}

ResultRecord TaskExecutor::Execute(const Task& task, const ExecutionSettings& settings,
                                   const std::filesystem::path& project_dir) const {
  ResultRecord record;
  record.case_id = task.test_case.id;
  record.skill_id = task.skill.id;
  record.skill_version = task.skill.version;
  record.baseline_id = task.baseline.id;
  record.baseline_version = task.baseline.version;
  record.input = task.test_case.input;
  record.expected_output = task.test_case.expected_output;
  record.model = settings.model;

  logger_.Info("task start", {{"skill_id", task.skill.id},
                              {"case_id", task.test_case.id},
                              {"model", settings.model}});

  std::string dir_error;
  if (!core::EnsureDirectory(task.skill.working_dir, dir_error)) {
    logger_.Warn("skill working directory unavailable",
                 {{"skill_id", task.skill.id}, {"error", dir_error}});
  }

  oracle::GenerateOptions options;
  options.system_instructions = task.skill.content;
  options.working_dir = task.skill.working_dir;
  options.timeout = settings.timeout;
  options.model = settings.model;

  oracle::GenerateResult result;
  oracle::OracleError oracle_error;
  if (oracle_->Generate(task.test_case.input, options, result, oracle_error)) {
    record.status = RecordStatus::kCompleted;
    record.actual_output = std::move(result.text);
    record.duration_ms = result.duration_ms;
  } else {
    record.status = RecordStatus::kFailed;
    record.error = oracle_error.message;
    record.error_code = oracle::ToString(oracle_error.kind);
    logger_.Error("task execution failed", {{"skill_id", task.skill.id},
                                            {"case_id", task.test_case.id},
                                            {"error_code", record.error_code.value()},
                                            {"error", oracle_error.message}});
  }
  record.executed_at = core::NowUtcTimestamp();

  if (record.status == RecordStatus::kCompleted) {
    Score score;
    std::string score_error;
    if (ScoreOutput(task, record.actual_output, settings, score, score_error)) {
      record.score = score;
      record.score_evaluated_at = core::NowUtcTimestamp();
      logger_.Info("task scored", {{"skill_id", task.skill.id},
                                   {"case_id", task.test_case.id},
                                   {"total", core::FormatJsonNumber(score.total)}});
    } else {
      logger_.Warn("scoring failed (non-fatal)", {{"skill_id", task.skill.id},
                                                  {"case_id", task.test_case.id},
                                                  {"error", score_error}});
    }
  }

  std::string write_error;
  if (!WriteResultRecord(project_dir, record, write_error)) {
    logger_.Error("result record write failed",
                  {{"skill_id", task.skill.id},
                   {"case_id", task.test_case.id},
                   {"error_code", core::errors::ToString(core::errors::ErrorCode::kIoError)},
                   {"error", write_error}});
  }
  return record;
}

bool TaskExecutor::ScoreOutput(const Task& task, const std::string& actual_output,
                               const ExecutionSettings& settings, Score& score,
                               std::string& error) const {
  oracle::GenerateOptions options;
  options.working_dir = task.skill.working_dir;
  options.timeout = settings.scoring_timeout;
  options.model = settings.model;

  oracle::GenerateResult result;
  oracle::OracleError oracle_error;
  if (!oracle_->Generate(BuildScoringPrompt(task.test_case.input,
                                            task.test_case.expected_output, actual_output),
                         options, result, oracle_error)) {
    error = std::string(oracle::ToString(oracle_error.kind)) + ": " + oracle_error.message;
    return false;
  }

  core::json::Value root;
  std::string parse_error;
  if (!oracle::ParseStructuredOutput(result.text, root, parse_error)) {
    error = std::string(oracle::ToString(oracle::OracleErrorKind::kOutputParseError)) + ": " +
            parse_error;
    return false;
  }

  std::string warning;
  if (!ParseScore(root, score, warning, error)) {
    return false;
  }
  if (!warning.empty()) {
    logger_.Warn("score adjusted", {{"skill_id", task.skill.id},
                                    {"case_id", task.test_case.id},
                                    {"detail", warning}});
  }
  return true;
}

} // namespace skillbench::eval
