#include "oracle/oracle_client.hpp"

namespace skillbench::oracle {

const char* ToString(OracleErrorKind kind) {
  switch (kind) {
  case OracleErrorKind::kTimeout:
    return "CLI_TIMEOUT";
  case OracleErrorKind::kRateLimited:
    return "RATE_LIMITED";
  case OracleErrorKind::kExecutionError:
    return "CLI_EXECUTION_ERROR";
  case OracleErrorKind::kModelError:
    return "CLI_MODEL_ERROR";
  case OracleErrorKind::kOutputParseError:
    return "CLI_OUTPUT_PARSE_ERROR";
  case OracleErrorKind::kNotAvailable:
    return "CLI_NOT_AVAILABLE";
  }
  return "CLI_EXECUTION_ERROR";
}

bool ParseOracleErrorKind(std::string_view text, OracleErrorKind& kind) {
  static constexpr OracleErrorKind kAll[] = {
      OracleErrorKind::kTimeout,          OracleErrorKind::kRateLimited,
      OracleErrorKind::kExecutionError,   OracleErrorKind::kModelError,
      OracleErrorKind::kOutputParseError, OracleErrorKind::kNotAvailable,
  };
  for (const OracleErrorKind candidate : kAll) {
    if (text == ToString(candidate)) {
      kind = candidate;
      return true;
    }
  }
  return false;
}

} // namespace skillbench::oracle
