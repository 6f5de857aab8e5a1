#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace skillbench::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
    return true;
  }
  if (normalized == "info") {
    level = LogLevel::kInfo;
    return true;
  }
  if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
    return true;
  }
  if (normalized == "error") {
    level = LogLevel::kError;
    return true;
  }

  error = "invalid --log-level '" + std::string(raw) + "' (expected " + ExpectedLogLevelList() +
          ")";
  return false;
}

// Single-line key=value logger.
//
// Copies share one sink (stream, mutex and level), so a logger handed to
// several skill streams never interleaves partial lines. `WithComponent` and
// `WithProject` return cheap child views that stamp extra context on every
// record.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : sink_(std::make_shared<Sink>(min_level, out)) {}

  void SetMinLevel(LogLevel level) {
    sink_->min_level.store(static_cast<int>(level));
  }

  LogLevel MinLevel() const {
    return static_cast<LogLevel>(sink_->min_level.load());
  }

  Logger WithComponent(std::string component) const {
    Logger child = *this;
    child.component_ = std::move(component);
    return child;
  }

  Logger WithProject(std::string project_id) const {
    Logger child = *this;
    child.project_id_ = std::move(project_id);
    return child;
  }

  const std::string& ProjectId() const {
    return project_id_;
  }

  const std::string& Component() const {
    return component_;
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= sink_->min_level.load();
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) const {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line;
    line.reserve(128);
    line += "ts_utc=";
    line += FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " project_id=";
    line += Quote(project_id_);
    line += " component=";
    line += Quote(component_);
    line += " msg=";
    line += Quote(message);
    for (const auto& field : fields) {
      line += ' ';
      line += field.key;
      line += '=';
      line += Quote(field.value);
    }
    line += '\n';

    std::lock_guard<std::mutex> lock(sink_->mu);
    (*sink_->out) << line;
    sink_->out->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) const {
    Log(LogLevel::kError, message, fields);
  }

private:
  struct Sink {
    Sink(LogLevel level, std::ostream& stream)
        : min_level(static_cast<int>(level)), out(&stream) {}

    std::mutex mu;
    std::atomic<int> min_level;
    std::ostream* out;
  };

  static std::string EscapeForQuoted(std::string_view raw) {
    std::string escaped;
    escaped.reserve(raw.size());

    for (const char c : raw) {
      switch (c) {
      case '\\':
        escaped += "\\\\";
        break;
      case '"':
        escaped += "\\\"";
        break;
      case '\n':
        escaped += "\\n";
        break;
      case '\r':
        escaped += "\\r";
        break;
      case '\t':
        escaped += "\\t";
        break;
      default:
        escaped.push_back(c);
        break;
      }
    }

    return escaped;
  }

  static std::string Quote(std::string_view raw) {
    return std::string("\"") + EscapeForQuoted(raw) + "\"";
  }

  std::shared_ptr<Sink> sink_;
  std::string project_id_ = "-";
  std::string component_ = "-";
};

} // namespace skillbench::core::logging
