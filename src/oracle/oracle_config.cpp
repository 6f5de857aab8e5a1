#include "oracle/oracle_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <limits>
#include <string_view>

namespace fs = std::filesystem;

namespace skillbench::oracle {

namespace {

using JsonValue = core::json::Value;

bool ReadOptionalString(const JsonValue& root, std::string_view key, std::string& value,
                        std::string& error) {
  const JsonValue* field = core::json::FindField(root, key);
  if (field == nullptr || field->is_null()) {
    return true;
  }
  if (!field->is_string() || field->string_value.empty()) {
    error = "oracle config field '" + std::string(key) + "' must be a non-empty string";
    return false;
  }
  value = field->string_value;
  return true;
}

bool ReadOptionalUnsigned(const JsonValue& root, std::string_view key, std::uint32_t& value,
                          std::string& error) {
  const JsonValue* field = core::json::FindField(root, key);
  if (field == nullptr || field->is_null()) {
    return true;
  }
  const double number = field->number_value;
  if (!field->is_number() || number < 0.0 || std::floor(number) != number ||
      number > static_cast<double>(std::numeric_limits<std::uint32_t>::max())) {
    error = "oracle config field '" + std::string(key) + "' must be a non-negative integer";
    return false;
  }
  value = static_cast<std::uint32_t>(number);
  return true;
}

} // namespace

fs::path OracleConfigPath(const fs::path& workspace_root) {
  return workspace_root / "cli" / "config.json";
}

bool LoadOracleConfig(const fs::path& workspace_root, OracleConfig& config, std::string& error) {
  config = OracleConfig{};
  error.clear();

  const fs::path path = OracleConfigPath(workspace_root);
  if (!core::PathExists(path)) {
    return true;
  }

  JsonValue root;
  if (!core::ReadJsonFile(path, root, error)) {
    return false;
  }
  if (!root.is_object()) {
    error = "oracle config '" + path.string() + "' must be a JSON object";
    return false;
  }

  return ReadOptionalString(root, "cli_path", config.cli_path, error) &&
         ReadOptionalString(root, "default_model", config.default_model, error) &&
         ReadOptionalUnsigned(root, "default_timeout_seconds", config.default_timeout_seconds,
                              error) &&
         ReadOptionalUnsigned(root, "default_retry_count", config.default_retry_count, error) &&
         ReadOptionalUnsigned(root, "scoring_timeout_seconds", config.scoring_timeout_seconds,
                              error) &&
         ReadOptionalUnsigned(root, "analysis_timeout_seconds", config.analysis_timeout_seconds,
                              error);
}

} // namespace skillbench::oracle
