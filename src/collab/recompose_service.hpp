#pragma once

#include "collab/analysis_report.hpp"
#include "collab/analysis_service.hpp"
#include "core/errors/error_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/worker_set.hpp"
#include "eval/summary.hpp"
#include "iteration/ports.hpp"
#include "oracle/oracle_client.hpp"
#include "store/project_config.hpp"
#include "store/skill_library.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skillbench::collab {

struct RecomposeCompletion {
  std::string project_id;
  std::string task_id;
  bool succeeded = false;
  std::string content;
  std::size_t segment_count = 0;
  std::size_t source_skill_count = 0;
  std::string error;
};

using RecomposeCallback = std::function<void(const RecomposeCompletion&)>;

// Dimensions that did not improve between the two newest rounds.
std::vector<eval::ScoreDimension> DetectStagnantDimensions(
    const std::vector<iteration::RoundRecord>& history);

// Score trend and strategy directive appended to the recompose prompt. Empty
// without history.
std::string BuildScoreHistoryTail(const std::vector<iteration::RoundRecord>& history,
                                  iteration::Strategy strategy,
                                  const std::optional<eval::ScoreDimension>& focus);

// Segments named by `request.selected_segment_ids` (all of them when none are
// named) go to `selected`.
std::string BuildRecomposePrompt(const AnalysisReport& report, const eval::Summary& summary,
                                 const iteration::RecomposeRequest& request,
                                 std::vector<AdvantageSegment>& selected);

// Merges advantage segments of analyzed skills into new skill text and saves
// the result as a workspace skill with provenance.
class RecomposeService {
public:
  RecomposeService(std::shared_ptr<store::ProjectStore> store,
                   std::shared_ptr<oracle::IOracleClient> oracle, OracleCallSettings settings,
                   core::logging::Logger logger);
  ~RecomposeService();

  RecomposeService(const RecomposeService&) = delete;
  RecomposeService& operator=(const RecomposeService&) = delete;

  bool ExecuteRecompose(const std::string& project_id, const iteration::RecomposeRequest& request,
                        RecomposeCallback on_complete, std::string& task_id,
                        core::errors::ErrorInfo& error);

  // Blocking form of ExecuteRecompose.
  bool Recompose(const std::string& project_id, const iteration::RecomposeRequest& request,
                 RecomposeCompletion& completion, core::errors::ErrorInfo& error) const;

  // Stores `content` in the skill library and writes `provenance.json` beside
  // it.
  bool SaveRecomposedSkill(const std::string& project_id, const std::string& content,
                           const iteration::SkillDraft& draft, std::string& skill_id,
                           core::errors::ErrorInfo& error);

  void WaitIdle();

private:
  std::shared_ptr<store::ProjectStore> store_;
  std::shared_ptr<oracle::IOracleClient> oracle_;
  OracleCallSettings settings_;
  store::SkillLibrary library_;
  core::logging::Logger logger_;
  core::WorkerSet workers_;
};

} // namespace skillbench::collab
