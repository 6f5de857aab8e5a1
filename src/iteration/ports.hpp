#pragma once

#include "core/errors/error_codes.hpp"
#include "eval/score.hpp"
#include "iteration/strategy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace skillbench::iteration {

// Blocking capabilities the iteration loop needs from the rest of the system.
// Concrete adapters are wired at composition time so the loop never depends
// on the scheduler or the collaborators directly.

class ITestRunPort {
public:
  virtual ~ITestRunPort() = default;

  // Runs the project's current skill x case matrix and returns once the run
  // completed. An interrupted run is an error.
  virtual bool RunTests(const std::string& project_id, core::errors::ErrorInfo& error) = 0;
};

class IAnalysisPort {
public:
  virtual ~IAnalysisPort() = default;

  virtual bool RunAnalysis(const std::string& project_id, core::errors::ErrorInfo& error) = 0;
};

struct RecomposeRequest {
  Strategy strategy = Strategy::kGreedy;
  std::optional<eval::ScoreDimension> focus_dimension;
  std::vector<RoundRecord> score_history;
  std::string retention_rules;
  std::vector<std::string> selected_segment_ids;
};

struct SkillDraft {
  std::string name;
  std::string purpose = "general";
  std::string provider = "iteration";
  // Provenance of the recomposition that produced the content.
  Strategy strategy = Strategy::kGreedy;
  std::string retention_rules;
};

class IRecomposePort {
public:
  virtual ~IRecomposePort() = default;

  // Produces new skill text.
  virtual bool Recompose(const std::string& project_id, const RecomposeRequest& request,
                         std::string& content, core::errors::ErrorInfo& error) = 0;

  // Persists `content` as a new skill asset and returns its id.
  virtual bool SaveSkill(const std::string& project_id, const std::string& content,
                         const SkillDraft& draft, std::string& skill_id,
                         core::errors::ErrorInfo& error) = 0;
};

class ISkillRegistryPort {
public:
  virtual ~ISkillRegistryPort() = default;

  // Makes `skill_id` the project's sole non-original skill, stored locally as
  // `skills/skill_iter_v<round>`.
  virtual bool RegisterCandidate(const std::string& project_id, const std::string& skill_id,
                                 std::uint32_t round, core::errors::ErrorInfo& error) = 0;
};

struct IterationPorts {
  std::shared_ptr<ITestRunPort> test_run;
  std::shared_ptr<IAnalysisPort> analysis;
  std::shared_ptr<IRecomposePort> recompose;
  std::shared_ptr<ISkillRegistryPort> registry;
};

} // namespace skillbench::iteration
