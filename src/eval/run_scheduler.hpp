#pragma once

#include "core/errors/error_codes.hpp"
#include "core/logging/logger.hpp"
#include "core/worker_set.hpp"
#include "eval/result_record.hpp"
#include "eval/task.hpp"
#include "eval/task_executor.hpp"
#include "oracle/oracle_client.hpp"
#include "oracle/oracle_config.hpp"
#include "store/project_config.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace skillbench::eval {

using RunStatus = store::ProjectStatus;

struct LastResult {
  std::string skill_id;
  std::string case_id;
  RecordStatus status = RecordStatus::kFailed;
  std::optional<double> score;
};

// Delivered after every executed task and once when a run ends. Terminal
// events (completed, paused, interrupted) carry no last_result.
struct ProgressEvent {
  std::string project_id;
  std::string task_id;
  std::uint64_t completed = 0;
  std::uint64_t failed = 0;
  std::uint64_t total = 0;
  RunStatus project_status = RunStatus::kRunning;
  std::optional<LastResult> last_result;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct RunProgress {
  std::string project_id;
  RunStatus status = RunStatus::kPending;
  std::uint64_t total_tasks = 0;
  std::uint64_t completed_tasks = 0;
  std::uint64_t failed_tasks = 0;
  // True when answered from the in-memory registry, false for the persisted
  // checkpoint.
  bool active = false;
};

struct SchedulerSettings {
  std::string default_model = "claude-opus-4-6";
  std::uint32_t default_timeout_seconds = 60;
  std::uint32_t default_retry_count = 2;
  std::uint32_t scoring_timeout_seconds = 30;
  std::chrono::milliseconds rate_limit_backoff{30000};
};

SchedulerSettings MakeSchedulerSettings(const oracle::OracleConfig& config);

// Concurrent skill x case runner with checkpointing.
//
// One driver thread per run launches one stream thread per skill. Streams run
// their cases strictly in order and check the shared run status before each
// task; pause and stop never preempt an oracle call in flight. Existing
// result records are skipped, which makes every start and resume idempotent.
//
// All public methods return immediately; progress and terminal state arrive
// through the callback, which may be invoked from any stream thread (calls
// are serialized per run).
class RunScheduler {
public:
  RunScheduler(std::shared_ptr<store::ProjectStore> store,
               std::shared_ptr<oracle::IOracleClient> oracle, SchedulerSettings settings,
               core::logging::Logger logger);
  ~RunScheduler();

  RunScheduler(const RunScheduler&) = delete;
  RunScheduler& operator=(const RunScheduler&) = delete;

  // ALREADY_RUNNING when the project has an active (running or paused) run,
  // or a stopped run whose streams are still draining.
  bool Start(const std::string& project_id, ProgressCallback callback, std::string& run_id,
             core::errors::ErrorInfo& error);

  // `checkpoint` = completed + failed at the moment of the pause.
  bool Pause(const std::string& project_id, std::uint64_t& checkpoint,
             core::errors::ErrorInfo& error);

  // Resumes an in-memory paused run, or rebuilds one from a persisted
  // `paused` checkpoint after a restart. `remaining` = tasks not yet counted.
  bool Resume(const std::string& project_id, ProgressCallback callback,
              std::uint64_t& remaining, core::errors::ErrorInfo& error);

  // Terminal. Returns immediately; the project stays locked against Start and
  // RetryCase until in-flight tasks drain. Records on disk stay.
  bool Stop(const std::string& project_id, core::errors::ErrorInfo& error);

  bool GetProgress(const std::string& project_id, RunProgress& progress,
                   core::errors::ErrorInfo& error) const;

  // Re-executes one task in the background and overwrites its record.
  // Rejected with ALREADY_RUNNING while the project has an active run.
  bool RetryCase(const std::string& project_id, const std::string& skill_id,
                 const std::string& case_id, ProgressCallback callback, std::string& task_id,
                 core::errors::ErrorInfo& error);

  // Blocks until every background driver and retry has exited.
  void WaitIdle();

private:
  struct ActiveRun {
    std::string project_id;
    std::string run_id;
    std::filesystem::path project_dir;
    std::vector<Task> tasks;
    ExecutionSettings execution;
    std::shared_ptr<TaskExecutor> executor;
    std::atomic<RunStatus> status{RunStatus::kRunning};

    std::mutex counters_mu;
    std::uint64_t completed = 0;
    std::uint64_t failed = 0;

    std::mutex callback_mu;
    ProgressCallback callback;

    std::mutex drain_mu;
    std::condition_variable drained_cv;
    bool driver_active = false;
    std::optional<RunStatus> reported_status;
  };

  bool PrepareRun(const store::ProjectConfig& config, ProgressCallback callback,
                  std::shared_ptr<ActiveRun>& run, core::errors::ErrorInfo& error);
  std::shared_ptr<TaskExecutor> MakeExecutor(const store::ProjectConfig& config) const;
  ExecutionSettings MakeExecutionSettings(const store::ProjectConfig& config) const;

  void LaunchDriver(const std::shared_ptr<ActiveRun>& run);
  void DriveRun(const std::shared_ptr<ActiveRun>& run);
  void RunStream(const std::shared_ptr<ActiveRun>& run, const std::vector<const Task*>& tasks);
  void FinishCompletedRun(const std::shared_ptr<ActiveRun>& run);
  void ReleaseRun(const std::shared_ptr<ActiveRun>& run);
  void Emit(ActiveRun& run, const ProgressEvent& event);
  ProgressEvent MakeEvent(ActiveRun& run, RunStatus status);

  std::shared_ptr<store::ProjectStore> store_;
  std::shared_ptr<oracle::IOracleClient> oracle_;
  SchedulerSettings settings_;
  core::logging::Logger logger_;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<ActiveRun>> runs_;

  core::WorkerSet workers_;
};

} // namespace skillbench::eval
