#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace skillbench::oracle {

// Typed oracle failure categories. Every caller converts these into a failed
// result record or a round-level error; none of them crash a stream.
enum class OracleErrorKind {
  kTimeout,
  kRateLimited,
  kExecutionError,
  kModelError,
  kOutputParseError,
  kNotAvailable,
};

// Stable wire strings persisted in result records (`error_code`).
const char* ToString(OracleErrorKind kind);
bool ParseOracleErrorKind(std::string_view text, OracleErrorKind& kind);

struct OracleError {
  OracleErrorKind kind = OracleErrorKind::kExecutionError;
  std::string message;
};

struct GenerateOptions {
  std::optional<std::string> system_instructions;
  std::filesystem::path working_dir;
  std::chrono::milliseconds timeout{60000};
  std::string model;
};

struct GenerateResult {
  std::string text;
  std::uint64_t duration_ms = 0;
};

// Shared oracle contract used for task execution, rubric scoring, analysis and
// recomposition.
//
// Implementations must tolerate concurrent calls from several skill streams.
// A call blocks its caller until the oracle answers or the timeout expires;
// there is no other cancellation.
class IOracleClient {
public:
  virtual ~IOracleClient() = default;

  virtual bool Generate(const std::string& prompt, const GenerateOptions& options,
                        GenerateResult& result, OracleError& error) = 0;
};

} // namespace skillbench::oracle
