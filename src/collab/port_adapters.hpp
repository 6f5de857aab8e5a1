#pragma once

#include "collab/analysis_service.hpp"
#include "collab/recompose_service.hpp"
#include "core/logging/logger.hpp"
#include "eval/run_scheduler.hpp"
#include "iteration/ports.hpp"
#include "store/project_config.hpp"
#include "store/skill_library.hpp"

#include <memory>
#include <string>

namespace skillbench::collab {

// Blocking bridges from the iteration loop's ports to the asynchronous
// services. Each call starts the service and waits on a future the service
// callback fulfils.

class SchedulerTestRunPort : public iteration::ITestRunPort {
public:
  explicit SchedulerTestRunPort(std::shared_ptr<eval::RunScheduler> scheduler);

  // Waits for the run's terminal event. Only `completed` succeeds; a paused
  // or interrupted run fails with INTERRUPTED and stays as the scheduler left
  // it.
  bool RunTests(const std::string& project_id, core::errors::ErrorInfo& error) override;

private:
  std::shared_ptr<eval::RunScheduler> scheduler_;
};

class AnalysisPortAdapter : public iteration::IAnalysisPort {
public:
  explicit AnalysisPortAdapter(std::shared_ptr<AnalysisService> service);

  bool RunAnalysis(const std::string& project_id, core::errors::ErrorInfo& error) override;

private:
  std::shared_ptr<AnalysisService> service_;
};

class RecomposePortAdapter : public iteration::IRecomposePort {
public:
  explicit RecomposePortAdapter(std::shared_ptr<RecomposeService> service);

  bool Recompose(const std::string& project_id, const iteration::RecomposeRequest& request,
                 std::string& content, core::errors::ErrorInfo& error) override;

  bool SaveSkill(const std::string& project_id, const std::string& content,
                 const iteration::SkillDraft& draft, std::string& skill_id,
                 core::errors::ErrorInfo& error) override;

private:
  std::shared_ptr<RecomposeService> service_;
};

// Copies a library skill into `<project>/skills/skill_iter_v<round>/` and makes
// it the project's sole non-original skill.
class ProjectSkillRegistry : public iteration::ISkillRegistryPort {
public:
  ProjectSkillRegistry(std::shared_ptr<store::ProjectStore> store, core::logging::Logger logger);

  bool RegisterCandidate(const std::string& project_id, const std::string& skill_id,
                         std::uint32_t round, core::errors::ErrorInfo& error) override;

private:
  std::shared_ptr<store::ProjectStore> store_;
  store::SkillLibrary library_;
  core::logging::Logger logger_;
};

// Wires the four adapters over the given services.
iteration::IterationPorts MakeIterationPorts(std::shared_ptr<store::ProjectStore> store,
                                             std::shared_ptr<eval::RunScheduler> scheduler,
                                             std::shared_ptr<AnalysisService> analysis,
                                             std::shared_ptr<RecomposeService> recompose,
                                             core::logging::Logger logger);

} // namespace skillbench::collab
