#include "collab/port_adapters.hpp"

#include "core/fs_utils.hpp"

#include <atomic>
#include <future>
#include <utility>

namespace skillbench::collab {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

// One-shot result handed from a service callback to the blocked caller.
// Later deliveries are ignored.
template <typename T>
class OneShot {
public:
  OneShot() : future_(promise_.get_future()) {}

  void Deliver(T value) {
    if (!delivered_.exchange(true)) {
      promise_.set_value(std::move(value));
    }
  }

  T Wait() {
    return future_.get();
  }

private:
  std::promise<T> promise_;
  std::future<T> future_;
  std::atomic<bool> delivered_{false};
};

struct Outcome {
  bool ok = false;
  std::string message;
  std::string content;
};

} // namespace

SchedulerTestRunPort::SchedulerTestRunPort(std::shared_ptr<eval::RunScheduler> scheduler)
    : scheduler_(std::move(scheduler)) {}

bool SchedulerTestRunPort::RunTests(const std::string& project_id, ErrorInfo& error) {
  auto done = std::make_shared<OneShot<Outcome>>();
  std::string run_id;
  if (!scheduler_->Start(
          project_id,
          [done](const eval::ProgressEvent& event) {
            if (event.last_result.has_value()) {
              return;
            }
            if (event.project_status == eval::RunStatus::kCompleted) {
              done->Deliver(Outcome{true, "", ""});
            } else if (event.project_status == eval::RunStatus::kInterrupted) {
              done->Deliver(Outcome{false, "test run interrupted", ""});
            } else if (event.project_status == eval::RunStatus::kPaused) {
              done->Deliver(Outcome{false, "test run paused", ""});
            }
          },
          run_id, error)) {
    return false;
  }

  const Outcome outcome = done->Wait();
  if (!outcome.ok) {
    core::errors::SetError(error, ErrorCode::kInterrupted, outcome.message);
    return false;
  }
  return true;
}

AnalysisPortAdapter::AnalysisPortAdapter(std::shared_ptr<AnalysisService> service)
    : service_(std::move(service)) {}

bool AnalysisPortAdapter::RunAnalysis(const std::string& project_id, ErrorInfo& error) {
  auto done = std::make_shared<OneShot<Outcome>>();
  std::string task_id;
  if (!service_->RunAnalysis(
          project_id,
          [done](const AnalysisCompletion& completion) {
            done->Deliver(Outcome{completion.succeeded, completion.error, ""});
          },
          task_id, error)) {
    return false;
  }

  const Outcome outcome = done->Wait();
  if (!outcome.ok) {
    core::errors::SetError(error, ErrorCode::kOracleFailure,
                           "analysis failed: " + outcome.message);
    return false;
  }
  return true;
}

RecomposePortAdapter::RecomposePortAdapter(std::shared_ptr<RecomposeService> service)
    : service_(std::move(service)) {}

bool RecomposePortAdapter::Recompose(const std::string& project_id,
                                     const iteration::RecomposeRequest& request,
                                     std::string& content, ErrorInfo& error) {
  auto done = std::make_shared<OneShot<Outcome>>();
  std::string task_id;
  if (!service_->ExecuteRecompose(
          project_id, request,
          [done](const RecomposeCompletion& completion) {
            done->Deliver(Outcome{completion.succeeded, completion.error, completion.content});
          },
          task_id, error)) {
    return false;
  }

  Outcome outcome = done->Wait();
  if (!outcome.ok) {
    core::errors::SetError(error, ErrorCode::kOracleFailure,
                           "recompose failed: " + outcome.message);
    return false;
  }
  content = std::move(outcome.content);
  return true;
}

bool RecomposePortAdapter::SaveSkill(const std::string& project_id, const std::string& content,
                                     const iteration::SkillDraft& draft, std::string& skill_id,
                                     ErrorInfo& error) {
  return service_->SaveRecomposedSkill(project_id, content, draft, skill_id, error);
}

ProjectSkillRegistry::ProjectSkillRegistry(std::shared_ptr<store::ProjectStore> store,
                                           core::logging::Logger logger)
    : store_(std::move(store)), library_(store_->workspace().root()),
      logger_(logger.WithComponent("skill-registry")) {}

bool ProjectSkillRegistry::RegisterCandidate(const std::string& project_id,
                                             const std::string& skill_id, std::uint32_t round,
                                             ErrorInfo& error) {
  std::filesystem::path project_dir;
  if (!store_->FindProjectDir(project_id, project_dir, error)) {
    return false;
  }
  std::filesystem::path skill_dir;
  if (!library_.FindSkillDir(skill_id, skill_dir, error)) {
    error.message = "iteration candidate skill not found: " + error.message;
    return false;
  }
  store::SkillMeta meta;
  if (!library_.LoadMeta(skill_dir, meta, error)) {
    return false;
  }

  const std::string local_dir = "skill_iter_v" + std::to_string(round);
  const std::filesystem::path dest = project_dir / "skills" / local_dir;
  std::error_code remove_ec;
  std::filesystem::remove_all(dest, remove_ec);
  if (remove_ec) {
    core::errors::SetError(error, ErrorCode::kIoError,
                           "failed to clear '" + dest.string() + "': " + remove_ec.message());
    return false;
  }
  std::string copy_error;
  if (!core::CopyDirectory(skill_dir, dest, copy_error)) {
    core::errors::SetError(error, ErrorCode::kIoError, copy_error);
    return false;
  }

  store::SkillRef candidate;
  candidate.ref_id = skill_id;
  candidate.name = meta.name.empty() ? "Iteration Skill v" + std::to_string(round) : meta.name;
  candidate.purpose = meta.purpose.empty() ? "general" : meta.purpose;
  candidate.provider = meta.provider.empty() ? "iteration" : meta.provider;
  candidate.version = meta.version.empty() ? "v1" : meta.version;
  candidate.local_path = "skills/" + local_dir;
  if (!store_->ReplaceIterationCandidate(project_dir, candidate, error)) {
    return false;
  }

  logger_.Info("iteration candidate registered", {{"project_id", project_id},
                                                  {"skill_id", skill_id},
                                                  {"round", std::to_string(round)},
                                                  {"local_path", candidate.local_path}});
  return true;
}

iteration::IterationPorts MakeIterationPorts(std::shared_ptr<store::ProjectStore> store,
                                             std::shared_ptr<eval::RunScheduler> scheduler,
                                             std::shared_ptr<AnalysisService> analysis,
                                             std::shared_ptr<RecomposeService> recompose,
                                             core::logging::Logger logger) {
  iteration::IterationPorts ports;
  ports.test_run = std::make_shared<SchedulerTestRunPort>(std::move(scheduler));
  ports.analysis = std::make_shared<AnalysisPortAdapter>(std::move(analysis));
  ports.recompose = std::make_shared<RecomposePortAdapter>(std::move(recompose));
  ports.registry = std::make_shared<ProjectSkillRegistry>(std::move(store), logger);
  return ports;
}

} // namespace skillbench::collab
