#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace skillbench::core::errors {

// Typed failure categories surfaced by service boundaries (scheduler, round
// controller, stores). State errors are caller-contract violations and are
// reported synchronously.
enum class ErrorCode {
  kAlreadyRunning,
  kNotRunning,
  kNotPaused,
  kNotFound,
  kInvalidParams,
  kIoError,
  kOracleFailure,
  kInterrupted,
  kInternal,
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
  case ErrorCode::kAlreadyRunning:
    return "ALREADY_RUNNING";
  case ErrorCode::kNotRunning:
    return "NOT_RUNNING";
  case ErrorCode::kNotPaused:
    return "NOT_PAUSED";
  case ErrorCode::kNotFound:
    return "NOT_FOUND";
  case ErrorCode::kInvalidParams:
    return "INVALID_PARAMS";
  case ErrorCode::kIoError:
    return "FILE_IO_ERROR";
  case ErrorCode::kOracleFailure:
    return "ORACLE_FAILURE";
  case ErrorCode::kInterrupted:
    return "INTERRUPTED";
  case ErrorCode::kInternal:
    return "INTERNAL";
  }
  return "INTERNAL";
}

struct ErrorInfo {
  ErrorCode code = ErrorCode::kInternal;
  std::string message;
};

inline void SetError(ErrorInfo& error, ErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
}

// `CODE: message`, the form every CLI command prints on failure.
inline std::string Describe(const ErrorInfo& error) {
  return std::string(ToString(error.code)) + ": " + error.message;
}

inline ExitCode ToExitCode(ErrorCode code) {
  switch (code) {
  case ErrorCode::kNotFound:
    return ExitCode::kNotFound;
  case ErrorCode::kAlreadyRunning:
  case ErrorCode::kNotRunning:
  case ErrorCode::kNotPaused:
    return ExitCode::kStateConflict;
  case ErrorCode::kInterrupted:
    return ExitCode::kInterrupted;
  case ErrorCode::kInvalidParams:
    return ExitCode::kUsage;
  case ErrorCode::kIoError:
  case ErrorCode::kOracleFailure:
  case ErrorCode::kInternal:
    return ExitCode::kFailure;
  }
  return ExitCode::kFailure;
}

} // namespace skillbench::core::errors
