#include "collab/analysis_report.hpp"

#include "core/fs_utils.hpp"

#include <utility>

namespace skillbench::collab {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;
using core::json::Value;

const std::vector<Value>& ArrayField(const Value& root, std::string_view key) {
  static const std::vector<Value> kEmpty;
  const Value* field = core::json::FindField(root, key);
  if (field == nullptr || !field->is_array()) {
    return kEmpty;
  }
  return field->array_value;
}

Value StringField(const std::string& text) {
  return core::json::MakeString(text);
}

} // namespace

std::filesystem::path AnalysisReportPath(const std::filesystem::path& project_dir) {
  return project_dir / "analysis_report.json";
}

void AnalysisReportFromJson(const Value& root, AnalysisReport& report) {
  report.project_id = core::json::GetString(root, "project_id");
  report.generated_at = core::json::GetString(root, "generated_at");
  report.best_skill_id = core::json::GetString(root, "best_skill_id");
  report.best_skill_name = core::json::GetString(root, "best_skill_name");

  report.dimension_leaders.clear();
  if (const Value* leaders = core::json::FindField(root, "dimension_leaders");
      leaders != nullptr && leaders->is_object()) {
    for (const auto& [dimension, skill] : leaders->object_value) {
      if (skill.type == Value::Type::kString) {
        report.dimension_leaders[dimension] = skill.string_value;
      }
    }
  }

  report.advantage_segments.clear();
  for (const Value& item : ArrayField(root, "advantage_segments")) {
    if (!item.is_object()) {
      continue;
    }
    AdvantageSegment segment;
    segment.id = core::json::GetString(item, "id");
    segment.skill_id = core::json::GetString(item, "skill_id");
    segment.skill_name = core::json::GetString(item, "skill_name");
    segment.type = core::json::GetString(item, "type");
    segment.content = core::json::GetString(item, "content");
    segment.reason = core::json::GetString(item, "reason");
    segment.dimension = core::json::GetString(item, "dimension");
    report.advantage_segments.push_back(std::move(segment));
  }

  report.issues.clear();
  for (const Value& item : ArrayField(root, "issues")) {
    if (!item.is_object()) {
      continue;
    }
    AnalysisIssue issue;
    issue.skill_id = core::json::GetString(item, "skill_id");
    issue.skill_name = core::json::GetString(item, "skill_name");
    issue.dimension = core::json::GetString(item, "dimension");
    issue.description = core::json::GetString(item, "description");
    report.issues.push_back(std::move(issue));
  }
}

Value AnalysisReportToJson(const AnalysisReport& report) {
  Value root = core::json::MakeObject();
  auto& fields = root.object_value;
  fields["project_id"] = StringField(report.project_id);
  fields["generated_at"] = StringField(report.generated_at);
  fields["best_skill_id"] = StringField(report.best_skill_id);
  fields["best_skill_name"] = StringField(report.best_skill_name);

  Value leaders = core::json::MakeObject();
  for (const auto& [dimension, skill_id] : report.dimension_leaders) {
    leaders.object_value[dimension] = StringField(skill_id);
  }
  fields["dimension_leaders"] = std::move(leaders);

  Value segments = core::json::MakeArray();
  for (const auto& segment : report.advantage_segments) {
    Value item = core::json::MakeObject();
    item.object_value["id"] = StringField(segment.id);
    item.object_value["skill_id"] = StringField(segment.skill_id);
    item.object_value["skill_name"] = StringField(segment.skill_name);
    item.object_value["type"] = StringField(segment.type);
    item.object_value["content"] = StringField(segment.content);
    item.object_value["reason"] = StringField(segment.reason);
    item.object_value["dimension"] = StringField(segment.dimension);
    segments.array_value.push_back(std::move(item));
  }
  fields["advantage_segments"] = std::move(segments);

  Value issues = core::json::MakeArray();
  for (const auto& issue : report.issues) {
    Value item = core::json::MakeObject();
    item.object_value["skill_id"] = StringField(issue.skill_id);
    item.object_value["skill_name"] = StringField(issue.skill_name);
    item.object_value["dimension"] = StringField(issue.dimension);
    item.object_value["description"] = StringField(issue.description);
    issues.array_value.push_back(std::move(item));
  }
  fields["issues"] = std::move(issues);
  return root;
}

bool WriteAnalysisReport(const std::filesystem::path& project_dir, const AnalysisReport& report,
                         ErrorInfo& error) {
  std::string write_error;
  if (!core::WriteJsonFileAtomic(AnalysisReportPath(project_dir), AnalysisReportToJson(report),
                                 write_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, write_error);
    return false;
  }
  return true;
}

bool LoadAnalysisReport(const std::filesystem::path& project_dir, AnalysisReport& report,
                        ErrorInfo& error) {
  const std::filesystem::path path = AnalysisReportPath(project_dir);
  if (!core::PathExists(path)) {
    core::errors::SetError(error, ErrorCode::kNotFound,
                           "analysis report not found; run analysis first");
    return false;
  }
  Value root;
  std::string read_error;
  if (!core::ReadJsonFile(path, root, read_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, read_error);
    return false;
  }
  AnalysisReportFromJson(root, report);
  return true;
}

} // namespace skillbench::collab
