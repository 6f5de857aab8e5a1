#pragma once

#include "core/logging/logger.hpp"
#include "oracle/oracle_client.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace skillbench::oracle {

struct CliOracleSettings {
  // Executable name or path; resolved through PATH when it has no slash.
  std::string cli_path = "claude";
  std::string default_model = "claude-opus-4-6";
};

// Oracle client backed by the model CLI in print mode.
//
// One child process per call: the prompt goes to stdin, the JSON envelope
// comes back on stdout (`result`, `duration_ms`, `is_error`). The child runs
// in `GenerateOptions::working_dir` and is killed when the timeout expires.
// Calls share no mutable state, so concurrent streams are safe.
class CliOracleClient final : public IOracleClient {
public:
  CliOracleClient(CliOracleSettings settings, core::logging::Logger logger);

  bool Generate(const std::string& prompt, const GenerateOptions& options, GenerateResult& result,
                OracleError& error) override;

  // Exposed for tests and `--log-level debug` traces.
  std::vector<std::string> BuildArguments(const GenerateOptions& options) const;

private:
  CliOracleSettings settings_;
  core::logging::Logger logger_;
};

// Decodes the CLI JSON envelope into a generate result.
bool ParseCliEnvelope(const std::string& stdout_text, std::uint64_t measured_duration_ms,
                      GenerateResult& result, OracleError& error);

// True when stderr text carries a rate-limit signal (`rate limit`, `rate-limit`,
// `ratelimit`, `429`), case-insensitive.
bool LooksRateLimited(const std::string& stderr_text);

} // namespace skillbench::oracle
