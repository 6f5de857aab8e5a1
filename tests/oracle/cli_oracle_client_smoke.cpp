#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "core/fs_utils.hpp"
#include "core/logging/logger.hpp"
#include "oracle/cli_oracle_client.hpp"
#include "oracle/oracle_config.hpp"
#include "oracle/retrying_oracle_client.hpp"
#include "oracle/testing/scripted_oracle_client.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using skillbench::tests::common::AssertContains;
using skillbench::tests::common::CreateUniqueTempDir;
using skillbench::tests::common::Fail;
using skillbench::tests::common::RemovePathBestEffort;

namespace {

namespace oracle = skillbench::oracle;
namespace logging = skillbench::core::logging;

fs::path WriteScript(const fs::path& dir, const std::string& name, const std::string& body) {
  const fs::path path = dir / name;
  std::string error;
  if (!skillbench::core::WriteTextFileAtomic(path, "#!/bin/sh\n" + body + "\n", error)) {
    Fail("failed to write script " + name + ": " + error);
  }
  fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace);
  return path;
}

oracle::CliOracleClient MakeClient(const fs::path& script, std::ostream& log_sink) {
  oracle::CliOracleSettings settings;
  settings.cli_path = script.string();
  settings.default_model = "fixture-model";
  return oracle::CliOracleClient(settings, logging::Logger(logging::LogLevel::kDebug, log_sink));
}

void AssertEnvelopeParsing() {
  oracle::GenerateResult result;
  oracle::OracleError error;
  if (!oracle::ParseCliEnvelope(R"({"result":"hi","duration_ms":42,"is_error":false})", 7,
                                result, error)) {
    Fail("valid envelope rejected: " + error.message);
  }
  if (result.text != "hi" || result.duration_ms != 42U) {
    Fail("envelope fields decoded incorrectly");
  }

  if (!oracle::ParseCliEnvelope(R"({"result":"no timing"})", 7, result, error) ||
      result.duration_ms != 7U) {
    Fail("missing duration_ms should fall back to the measured time");
  }

  if (oracle::ParseCliEnvelope(R"({"result":"quota exhausted","is_error":true})", 0, result,
                               error) ||
      error.kind != oracle::OracleErrorKind::kModelError) {
    Fail("is_error envelope should map to CLI_MODEL_ERROR");
  }
  AssertContains(error.message, "quota exhausted");

  if (oracle::ParseCliEnvelope("not json at all", 0, result, error) ||
      error.kind != oracle::OracleErrorKind::kOutputParseError) {
    Fail("non-JSON stdout should map to CLI_OUTPUT_PARSE_ERROR");
  }
}

void AssertRateLimitDetection() {
  if (!oracle::LooksRateLimited("HTTP 429 Too Many Requests") ||
      !oracle::LooksRateLimited("Rate Limit exceeded") ||
      !oracle::LooksRateLimited("ratelimit")) {
    Fail("rate-limit markers were not recognized");
  }
  if (oracle::LooksRateLimited("connection refused")) {
    Fail("unrelated stderr classified as rate limited");
  }
}

void AssertArguments(const fs::path& dir) {
  std::ostringstream logs;
  oracle::CliOracleClient client = MakeClient(dir / "claude-fixture", logs);

  oracle::GenerateOptions options;
  std::vector<std::string> args = client.BuildArguments(options);
  if (std::find(args.begin(), args.end(), "fixture-model") == args.end()) {
    Fail("default model missing from arguments");
  }
  if (std::find(args.begin(), args.end(), "--system-prompt") != args.end()) {
    Fail("--system-prompt passed without system instructions");
  }

  options.model = "other-model";
  options.system_instructions = "be terse";
  args = client.BuildArguments(options);
  const auto flag = std::find(args.begin(), args.end(), "--system-prompt");
  if (flag == args.end() || std::next(flag) == args.end() || *std::next(flag) != "be terse") {
    Fail("system instructions not forwarded");
  }
  if (std::find(args.begin(), args.end(), "other-model") == args.end()) {
    Fail("per-call model did not override the default");
  }
}

void AssertProcessOutcomes(const fs::path& dir) {
  std::ostringstream logs;
  oracle::GenerateResult result;
  oracle::OracleError error;

  const fs::path echo = WriteScript(
      dir, "echo.sh",
      "prompt=$(cat)\n"
      "printf '{\"result\":\"echo:%s\",\"duration_ms\":12,\"is_error\":false}' \"$prompt\"");
  oracle::CliOracleClient echo_client = MakeClient(echo, logs);
  oracle::GenerateOptions options;
  options.timeout = std::chrono::milliseconds(10000);
  if (!echo_client.Generate("ping", options, result, error)) {
    Fail("echo script failed: " + error.message);
  }
  if (result.text != "echo:ping" || result.duration_ms != 12U) {
    Fail("unexpected echo result: " + result.text);
  }

  const fs::path workdir = dir / "work";
  fs::create_directories(workdir);
  const fs::path where = WriteScript(dir, "where.sh", "printf '{\"result\":\"%s\"}' \"$(pwd -P)\"");
  oracle::CliOracleClient where_client = MakeClient(where, logs);
  options.working_dir = workdir;
  if (!where_client.Generate("", options, result, error)) {
    Fail("working-dir script failed: " + error.message);
  }
  if (fs::path(result.text) != fs::canonical(workdir)) {
    Fail("child did not run in the requested working dir: " + result.text);
  }
  options.working_dir.clear();

  const fs::path limited =
      WriteScript(dir, "limited.sh", "cat >/dev/null\necho 'error 429: rate limit' >&2\nexit 1");
  oracle::CliOracleClient limited_client = MakeClient(limited, logs);
  if (limited_client.Generate("x", options, result, error) ||
      error.kind != oracle::OracleErrorKind::kRateLimited) {
    Fail("429 on stderr should map to RATE_LIMITED");
  }

  const fs::path broken = WriteScript(dir, "broken.sh", "echo 'segfault' >&2\nexit 3");
  oracle::CliOracleClient broken_client = MakeClient(broken, logs);
  if (broken_client.Generate("x", options, result, error) ||
      error.kind != oracle::OracleErrorKind::kExecutionError) {
    Fail("nonzero exit should map to CLI_EXECUTION_ERROR");
  }
  AssertContains(error.message, "code 3");

  const fs::path garbage = WriteScript(dir, "garbage.sh", "echo 'plain text answer'");
  oracle::CliOracleClient garbage_client = MakeClient(garbage, logs);
  if (garbage_client.Generate("x", options, result, error) ||
      error.kind != oracle::OracleErrorKind::kOutputParseError) {
    Fail("plain stdout should map to CLI_OUTPUT_PARSE_ERROR");
  }

  const fs::path slow = WriteScript(dir, "slow.sh", "exec sleep 5");
  oracle::CliOracleClient slow_client = MakeClient(slow, logs);
  options.timeout = std::chrono::milliseconds(300);
  const auto started = std::chrono::steady_clock::now();
  if (slow_client.Generate("x", options, result, error) ||
      error.kind != oracle::OracleErrorKind::kTimeout) {
    Fail("slow script should map to CLI_TIMEOUT");
  }
  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(4)) {
    Fail("timeout did not kill the child promptly");
  }

  oracle::CliOracleClient missing_client = MakeClient(dir / "does-not-exist", logs);
  if (missing_client.Generate("x", options, result, error) ||
      error.kind != oracle::OracleErrorKind::kNotAvailable) {
    Fail("missing binary should map to CLI_NOT_AVAILABLE");
  }

  AssertContains(logs.str(), "oracle call failed");
  AssertContains(logs.str(), "CLI_TIMEOUT");
}

std::shared_ptr<oracle::testing::ScriptedOracleClient> FailingThen(
    std::vector<oracle::OracleErrorKind> failures) {
  auto remaining = std::make_shared<std::vector<oracle::OracleErrorKind>>(std::move(failures));
  return std::make_shared<oracle::testing::ScriptedOracleClient>(
      [remaining](const oracle::testing::OracleCall&, oracle::GenerateResult& result,
                  oracle::OracleError& error) {
        if (!remaining->empty()) {
          error.kind = remaining->front();
          error.message = "scripted failure";
          remaining->erase(remaining->begin());
          return false;
        }
        result.text = "recovered";
        return true;
      });
}

void AssertRetries() {
  std::ostringstream logs;
  const logging::Logger logger(logging::LogLevel::kWarn, logs);
  std::vector<std::chrono::milliseconds> sleeps;
  const auto record_sleep = [&sleeps](std::chrono::milliseconds delay) {
    sleeps.push_back(delay);
  };

  oracle::RetryPolicy policy;
  policy.retry_count = 2;
  policy.rate_limit_backoff = std::chrono::milliseconds(1234);

  oracle::GenerateResult result;
  oracle::OracleError error;

  auto flaky = FailingThen({oracle::OracleErrorKind::kRateLimited,
                            oracle::OracleErrorKind::kTimeout});
  oracle::RetryingOracleClient retrying(flaky, policy, logger, record_sleep);
  if (!retrying.Generate("p", {}, result, error) || result.text != "recovered") {
    Fail("third attempt should have succeeded");
  }
  if (flaky->call_count() != 3U) {
    Fail("expected 3 attempts, got " + std::to_string(flaky->call_count()));
  }
  if (sleeps.size() != 1U || sleeps.front() != std::chrono::milliseconds(1234)) {
    Fail("only the rate-limited attempt should back off");
  }
  AssertContains(logs.str(), "retrying oracle call");

  auto exhausted = FailingThen({oracle::OracleErrorKind::kExecutionError,
                                oracle::OracleErrorKind::kExecutionError,
                                oracle::OracleErrorKind::kModelError});
  oracle::RetryingOracleClient give_up(exhausted, policy, logger, record_sleep);
  if (give_up.Generate("p", {}, result, error) ||
      error.kind != oracle::OracleErrorKind::kModelError) {
    Fail("last failure should surface after retries are exhausted");
  }
  if (exhausted->call_count() != 3U) {
    Fail("retry_count 2 should make exactly 3 attempts");
  }

  auto unavailable = FailingThen({oracle::OracleErrorKind::kNotAvailable});
  oracle::RetryingOracleClient no_retry(unavailable, policy, logger, record_sleep);
  if (no_retry.Generate("p", {}, result, error) || unavailable->call_count() != 1U) {
    Fail("CLI_NOT_AVAILABLE must not be retried");
  }
}

void AssertConfigLoading(const fs::path& dir) {
  oracle::OracleConfig config;
  std::string error;
  const fs::path workspace = dir / "ws";
  if (!oracle::LoadOracleConfig(workspace, config, error) || config.cli_path != "claude" ||
      config.default_retry_count != 2U) {
    Fail("missing config should load defaults: " + error);
  }

  if (!skillbench::core::WriteTextFileAtomic(
          oracle::OracleConfigPath(workspace),
          R"({"cli_path":"/opt/bin/model","default_retry_count":5,"scoring_timeout_seconds":12})",
          error)) {
    Fail("failed to write config: " + error);
  }
  if (!oracle::LoadOracleConfig(workspace, config, error)) {
    Fail("valid config rejected: " + error);
  }
  if (config.cli_path != "/opt/bin/model" || config.default_retry_count != 5U ||
      config.scoring_timeout_seconds != 12U || config.analysis_timeout_seconds != 60U) {
    Fail("config fields decoded incorrectly");
  }

  if (!skillbench::core::WriteTextFileAtomic(oracle::OracleConfigPath(workspace),
                                             R"({"default_retry_count":-1})", error)) {
    Fail("failed to write config: " + error);
  }
  if (oracle::LoadOracleConfig(workspace, config, error)) {
    Fail("negative retry count should be rejected");
  }
  AssertContains(error, "default_retry_count");
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("skillbench-cli-oracle");
  AssertEnvelopeParsing();
  AssertRateLimitDetection();
  AssertArguments(root);
  AssertProcessOutcomes(root);
  AssertRetries();
  AssertConfigLoading(root);
  RemovePathBestEffort(root);
  std::cout << "cli_oracle_client_smoke: ok\n";
  return 0;
}
