#include "eval/summary.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <map>

namespace fs = std::filesystem;

namespace skillbench::eval {

namespace {

struct Accumulator {
  SummaryEntry entry;
  double total_score = 0.0;
  DimensionScores dimension_totals{};
};

} // namespace

const SummaryEntry* Summary::FindSkill(std::string_view skill_id) const {
  for (const auto& entry : ranking) {
    if (entry.skill_id == skill_id) {
      return &entry;
    }
  }
  return nullptr;
}

double RoundToTenth(double value) {
  return std::floor(value * 10.0 + 0.5) / 10.0;
}

Summary AggregateSummary(const std::string& project_id, const std::vector<Task>& tasks,
                         const std::vector<ResultRecord>& records) {
  std::vector<Accumulator> accumulators;
  std::map<std::string, std::size_t> index_by_skill;
  std::map<std::string, std::uint64_t> task_count_by_skill;
  for (const Task& task : tasks) {
    ++task_count_by_skill[task.skill.id];
    if (index_by_skill.count(task.skill.id) != 0U) {
      continue;
    }
    index_by_skill[task.skill.id] = accumulators.size();
    Accumulator accumulator;
    accumulator.entry.skill_id = task.skill.id;
    accumulator.entry.skill_name = task.skill.name;
    accumulator.entry.skill_version = task.skill.version;
    accumulators.push_back(accumulator);
  }

  for (const ResultRecord& record : records) {
    const auto it = index_by_skill.find(record.skill_id);
    if (it == index_by_skill.end()) {
      continue;
    }
    Accumulator& accumulator = accumulators[it->second];
    if (record.status == RecordStatus::kFailed) {
      ++accumulator.entry.failed_cases;
      continue;
    }
    ++accumulator.entry.completed_cases;
    if (!record.score.has_value()) {
      continue;
    }
    ++accumulator.entry.scored_cases;
    accumulator.total_score += record.score->total;
    for (std::size_t i = 0; i < kDimensionCount; ++i) {
      accumulator.dimension_totals[i] += record.score->values[i];
    }
  }

  Summary summary;
  summary.project_id = project_id;
  summary.generated_at = core::NowUtcTimestamp();
  for (Accumulator& accumulator : accumulators) {
    SummaryEntry& entry = accumulator.entry;
    const double divisor =
        entry.scored_cases > 0U ? static_cast<double>(entry.scored_cases) : 1.0;
    entry.avg_score = entry.scored_cases > 0U ? RoundToTenth(accumulator.total_score / divisor)
                                              : 0.0;
    for (std::size_t i = 0; i < kDimensionCount; ++i) {
      entry.score_breakdown[i] = RoundToTenth(accumulator.dimension_totals[i] / divisor);
    }
    summary.ranking.push_back(entry);
  }

  std::stable_sort(summary.ranking.begin(), summary.ranking.end(),
                   [](const SummaryEntry& a, const SummaryEntry& b) {
                     const bool a_scored = a.scored_cases > 0U;
                     const bool b_scored = b.scored_cases > 0U;
                     if (a_scored != b_scored) {
                       return a_scored;
                     }
                     if (a.avg_score != b.avg_score) {
                       return a.avg_score > b.avg_score;
                     }
                     return a.completed_cases > b.completed_cases;
                   });
  for (std::size_t i = 0; i < summary.ranking.size(); ++i) {
    summary.ranking[i].rank = static_cast<std::uint32_t>(i + 1U);
  }

  if (!summary.ranking.empty()) {
    summary.total_cases = task_count_by_skill[summary.ranking.front().skill_id];
  }
  return summary;
}

fs::path SummaryPath(const fs::path& project_dir) {
  return ResultsDir(project_dir) / "summary.json";
}

core::json::Value SummaryToJson(const Summary& summary) {
  core::json::Value root = core::json::MakeObject();
  root.object_value["project_id"] = core::json::MakeString(summary.project_id);
  root.object_value["generated_at"] = core::json::MakeString(summary.generated_at);
  root.object_value["total_cases"] =
      core::json::MakeNumber(static_cast<double>(summary.total_cases));

  core::json::Value ranking = core::json::MakeArray();
  for (const auto& entry : summary.ranking) {
    core::json::Value item = core::json::MakeObject();
    auto& fields = item.object_value;
    fields["skill_id"] = core::json::MakeString(entry.skill_id);
    fields["skill_name"] = core::json::MakeString(entry.skill_name);
    fields["skill_version"] = core::json::MakeString(entry.skill_version);
    fields["completed_cases"] = core::json::MakeNumber(static_cast<double>(entry.completed_cases));
    fields["failed_cases"] = core::json::MakeNumber(static_cast<double>(entry.failed_cases));
    fields["scored_cases"] = core::json::MakeNumber(static_cast<double>(entry.scored_cases));
    fields["avg_score"] = core::json::MakeNumber(entry.avg_score);
    fields["score_breakdown"] = BreakdownToJson(entry.score_breakdown);
    fields["rank"] = core::json::MakeNumber(entry.rank);
    ranking.array_value.push_back(std::move(item));
  }
  root.object_value["ranking"] = std::move(ranking);
  return root;
}

bool SummaryFromJson(const core::json::Value& root, Summary& summary, std::string& error) {
  summary = Summary{};
  const core::json::Value* ranking = core::json::FindField(root, "ranking");
  if (ranking == nullptr || !ranking->is_array()) {
    error = "summary is missing the 'ranking' array";
    return false;
  }
  summary.project_id = core::json::GetString(root, "project_id");
  summary.generated_at = core::json::GetString(root, "generated_at");
  summary.total_cases =
      static_cast<std::uint64_t>(core::json::GetNumberOr(root, "total_cases", 0.0));

  for (const auto& item : ranking->array_value) {
    if (!item.is_object()) {
      error = "summary ranking entries must be objects";
      return false;
    }
    SummaryEntry entry;
    entry.skill_id = core::json::GetString(item, "skill_id");
    entry.skill_name = core::json::GetString(item, "skill_name");
    entry.skill_version = core::json::GetString(item, "skill_version");
    entry.completed_cases =
        static_cast<std::uint64_t>(core::json::GetNumberOr(item, "completed_cases", 0.0));
    entry.failed_cases =
        static_cast<std::uint64_t>(core::json::GetNumberOr(item, "failed_cases", 0.0));
    entry.scored_cases =
        static_cast<std::uint64_t>(core::json::GetNumberOr(item, "scored_cases", 0.0));
    entry.avg_score = core::json::GetNumberOr(item, "avg_score", 0.0);
    if (const auto* breakdown = core::json::FindField(item, "score_breakdown");
        breakdown != nullptr) {
      entry.score_breakdown = BreakdownFromJson(*breakdown);
    }
    entry.rank = static_cast<std::uint32_t>(core::json::GetNumberOr(item, "rank", 0.0));
    summary.ranking.push_back(entry);
  }
  return true;
}

bool WriteSummary(const fs::path& project_dir, const Summary& summary, std::string& error) {
  return core::WriteJsonFileAtomic(SummaryPath(project_dir), SummaryToJson(summary), error);
}

bool LoadSummary(const fs::path& project_dir, Summary& summary, std::string& error) {
  const fs::path path = SummaryPath(project_dir);
  if (!core::PathExists(path)) {
    error = "summary not found: " + path.string();
    return false;
  }
  core::json::Value root;
  if (!core::ReadJsonFile(path, root, error)) {
    return false;
  }
  return SummaryFromJson(root, summary, error);
}

} // namespace skillbench::eval
