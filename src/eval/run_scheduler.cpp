#include "eval/run_scheduler.hpp"

#include "core/fs_utils.hpp"
#include "core/time_utils.hpp"
#include "eval/summary.hpp"
#include "oracle/retrying_oracle_client.hpp"

#include <chrono>
#include <iterator>
#include <thread>
#include <utility>

namespace skillbench::eval {

namespace {

using core::errors::ErrorCode;
using core::errors::ErrorInfo;

std::vector<std::pair<std::string, std::vector<const Task*>>> GroupBySkill(
    const std::vector<Task>& tasks) {
  std::vector<std::pair<std::string, std::vector<const Task*>>> groups;
  for (const Task& task : tasks) {
    auto it = groups.begin();
    for (; it != groups.end(); ++it) {
      if (it->first == task.skill.id) {
        break;
      }
    }
    if (it == groups.end()) {
      groups.push_back({task.skill.id, {}});
      it = std::prev(groups.end());
    }
    it->second.push_back(&task);
  }
  return groups;
}

std::string MakeRetryTaskId(const std::string& skill_id, const std::string& case_id) {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  return "retry_" + skill_id + "_" + case_id + "_" + std::to_string(millis);
}

} // namespace

SchedulerSettings MakeSchedulerSettings(const oracle::OracleConfig& config) {
  SchedulerSettings settings;
  settings.default_model = config.default_model;
  settings.default_timeout_seconds = config.default_timeout_seconds;
  settings.default_retry_count = config.default_retry_count;
  settings.scoring_timeout_seconds = config.scoring_timeout_seconds;
  return settings;
}

RunScheduler::RunScheduler(std::shared_ptr<store::ProjectStore> store,
                           std::shared_ptr<oracle::IOracleClient> oracle,
                           SchedulerSettings settings, core::logging::Logger logger)
    : store_(std::move(store)), oracle_(std::move(oracle)), settings_(std::move(settings)),
      logger_(logger.WithComponent("run-scheduler")) {}

RunScheduler::~RunScheduler() {
  std::vector<std::shared_ptr<ActiveRun>> runs;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& [project_id, run] : runs_) {
      runs.push_back(run);
    }
  }
  // Streams finish their in-flight task, then stop at the next boundary.
  for (const auto& run : runs) {
    RunStatus expected = RunStatus::kRunning;
    if (!run->status.compare_exchange_strong(expected, RunStatus::kPaused)) {
      continue;
    }
    std::lock_guard<std::mutex> counters_lock(run->counters_mu);
    ErrorInfo error;
    if (!store_->WriteCheckpoint(run->project_dir,
                                 store::MakeProgress(run->tasks.size(), run->completed,
                                                     run->failed),
                                 RunStatus::kPaused, error)) {
      logger_.Error("shutdown checkpoint failed", {{"project_id", run->project_id},
                                                   {"error_code", ToString(error.code)},
                                                   {"error", error.message}});
    }
  }
  WaitIdle();
}

ExecutionSettings RunScheduler::MakeExecutionSettings(const store::ProjectConfig& config) const {
  ExecutionSettings execution;
  execution.model = config.cli.model.empty() ? settings_.default_model : config.cli.model;
  const std::uint32_t timeout_seconds = config.cli.timeout_seconds > 0U
                                            ? config.cli.timeout_seconds
                                            : settings_.default_timeout_seconds;
  execution.timeout = std::chrono::seconds(timeout_seconds);
  execution.scoring_timeout = std::chrono::seconds(settings_.scoring_timeout_seconds);
  return execution;
}

std::shared_ptr<TaskExecutor> RunScheduler::MakeExecutor(
    const store::ProjectConfig& config) const {
  oracle::RetryPolicy policy;
  policy.retry_count =
      static_cast<int>(config.cli.retry_count.value_or(settings_.default_retry_count));
  policy.rate_limit_backoff = settings_.rate_limit_backoff;
  const core::logging::Logger project_logger = logger_.WithProject(config.id);
  auto retrying =
      std::make_shared<oracle::RetryingOracleClient>(oracle_, policy, project_logger);
  return std::make_shared<TaskExecutor>(retrying, project_logger);
}

bool RunScheduler::PrepareRun(const store::ProjectConfig& config, ProgressCallback callback,
                              std::shared_ptr<ActiveRun>& run, ErrorInfo& error) {
  std::vector<Task> tasks;
  if (!BuildTaskMatrix(config, tasks, error)) {
    return false;
  }

  run = std::make_shared<ActiveRun>();
  run->project_id = config.id;
  run->run_id = core::MakePrefixedId("run");
  run->project_dir = config.project_dir;
  run->execution = MakeExecutionSettings(config);
  run->executor = MakeExecutor(config);
  run->callback = std::move(callback);

  // Records already on disk count toward progress so completed + failed
  // always reaches the task total.
  for (const Task& task : tasks) {
    const auto path = ResultRecordPath(config.project_dir, task.skill.id, task.test_case.id);
    if (!core::PathExists(path)) {
      continue;
    }
    ResultRecord existing;
    std::string load_error;
    if (LoadResultRecord(path, existing, load_error) &&
        existing.status == RecordStatus::kCompleted) {
      ++run->completed;
    } else {
      ++run->failed;
    }
  }
  run->tasks = std::move(tasks);
  return true;
}

bool RunScheduler::Start(const std::string& project_id, ProgressCallback callback,
                         std::string& run_id, ErrorInfo& error) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (runs_.count(project_id) != 0U) {
      core::errors::SetError(error, ErrorCode::kAlreadyRunning,
                             "project already has an active run: " + project_id);
      return false;
    }
  }

  store::ProjectConfig config;
  if (!store_->LoadProject(project_id, config, error)) {
    return false;
  }
  std::shared_ptr<ActiveRun> run;
  if (!PrepareRun(config, std::move(callback), run, error)) {
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!runs_.emplace(project_id, run).second) {
      core::errors::SetError(error, ErrorCode::kAlreadyRunning,
                             "project already has an active run: " + project_id);
      return false;
    }
  }

  if (!store_->WriteCheckpoint(run->project_dir,
                               store::MakeProgress(run->tasks.size(), run->completed,
                                                   run->failed),
                               RunStatus::kRunning, error)) {
    std::lock_guard<std::mutex> lock(mu_);
    runs_.erase(project_id);
    return false;
  }

  run_id = run->run_id;
  logger_.Info("run started", {{"project_id", project_id},
                               {"run_id", run_id},
                               {"total_tasks", std::to_string(run->tasks.size())},
                               {"already_done", std::to_string(run->completed + run->failed)}});
  LaunchDriver(run);
  return true;
}

bool RunScheduler::Pause(const std::string& project_id, std::uint64_t& checkpoint,
                         ErrorInfo& error) {
  std::shared_ptr<ActiveRun> run;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = runs_.find(project_id);
    if (it != runs_.end()) {
      run = it->second;
    }
  }
  RunStatus expected = RunStatus::kRunning;
  if (run == nullptr || !run->status.compare_exchange_strong(expected, RunStatus::kPaused)) {
    core::errors::SetError(error, ErrorCode::kNotRunning,
                           "no running test for project: " + project_id);
    return false;
  }

  std::lock_guard<std::mutex> counters_lock(run->counters_mu);
  checkpoint = run->completed + run->failed;
  ErrorInfo write_error;
  if (!store_->WriteCheckpoint(run->project_dir,
                               store::MakeProgress(run->tasks.size(), run->completed,
                                                   run->failed),
                               RunStatus::kPaused, write_error)) {
    logger_.Error("pause checkpoint failed", {{"project_id", project_id},
                                              {"error_code", ToString(write_error.code)},
                                              {"error", write_error.message}});
  }
  logger_.Info("run paused", {{"project_id", project_id},
                              {"checkpoint", std::to_string(checkpoint)},
                              {"total_tasks", std::to_string(run->tasks.size())}});
  return true;
}

bool RunScheduler::Resume(const std::string& project_id, ProgressCallback callback,
                          std::uint64_t& remaining, ErrorInfo& error) {
  std::shared_ptr<ActiveRun> run;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = runs_.find(project_id);
    if (it != runs_.end()) {
      run = it->second;
    }
  }

  if (run != nullptr) {
    if (run->status.load() != RunStatus::kPaused) {
      core::errors::SetError(error, ErrorCode::kNotPaused,
                             "no paused test for project: " + project_id);
      return false;
    }
    // The previous driver must drain its in-flight tasks first.
    {
      std::unique_lock<std::mutex> drain_lock(run->drain_mu);
      run->drained_cv.wait(drain_lock, [&run] { return !run->driver_active; });
    }
    RunStatus expected = RunStatus::kPaused;
    if (!run->status.compare_exchange_strong(expected, RunStatus::kRunning)) {
      core::errors::SetError(error, ErrorCode::kNotPaused,
                             "no paused test for project: " + project_id);
      return false;
    }
    std::lock_guard<std::mutex> callback_lock(run->callback_mu);
    run->callback = std::move(callback);
  } else {
    store::ProjectConfig config;
    if (!store_->LoadProject(project_id, config, error)) {
      return false;
    }
    if (config.status != RunStatus::kPaused) {
      core::errors::SetError(error, ErrorCode::kNotPaused,
                             "no paused test for project: " + project_id);
      return false;
    }
    if (!PrepareRun(config, std::move(callback), run, error)) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mu_);
    if (!runs_.emplace(project_id, run).second) {
      core::errors::SetError(error, ErrorCode::kNotPaused,
                             "no paused test for project: " + project_id);
      return false;
    }
  }

  store::ProgressCounters progress;
  {
    std::lock_guard<std::mutex> counters_lock(run->counters_mu);
    progress = store::MakeProgress(run->tasks.size(), run->completed, run->failed);
  }
  remaining = progress.total_tasks - progress.last_checkpoint;
  ErrorInfo write_error;
  if (!store_->WriteCheckpoint(run->project_dir, progress, RunStatus::kRunning, write_error)) {
    logger_.Error("resume checkpoint failed", {{"project_id", project_id},
                                               {"error_code", ToString(write_error.code)},
                                               {"error", write_error.message}});
  }

  logger_.Info("run resumed",
               {{"project_id", project_id}, {"remaining_tasks", std::to_string(remaining)}});
  LaunchDriver(run);
  return true;
}

bool RunScheduler::Stop(const std::string& project_id, ErrorInfo& error) {
  std::shared_ptr<ActiveRun> run;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = runs_.find(project_id);
    if (it != runs_.end()) {
      RunStatus current = it->second->status.load();
      while (current != RunStatus::kCompleted && current != RunStatus::kInterrupted &&
             !it->second->status.compare_exchange_weak(current, RunStatus::kInterrupted)) {
      }
      if (current != RunStatus::kCompleted && current != RunStatus::kInterrupted) {
        run = it->second;
      }
    }
  }
  if (run == nullptr) {
    core::errors::SetError(error, ErrorCode::kNotRunning,
                           "no active test for project: " + project_id);
    return false;
  }

  {
    std::lock_guard<std::mutex> counters_lock(run->counters_mu);
    ErrorInfo write_error;
    if (!store_->WriteCheckpoint(run->project_dir,
                                 store::MakeProgress(run->tasks.size(), run->completed,
                                                     run->failed),
                                 RunStatus::kInterrupted, write_error)) {
      logger_.Error("stop checkpoint failed", {{"project_id", project_id},
                                               {"error_code", ToString(write_error.code)},
                                               {"error", write_error.message}});
    }
  }
  logger_.Info("run stopped", {{"project_id", project_id}});

  // A live driver reports the interruption and releases the project itself
  // once its streams drain; until then Start and RetryCase stay rejected.
  bool drained = false;
  bool emit = false;
  {
    std::lock_guard<std::mutex> drain_lock(run->drain_mu);
    drained = !run->driver_active;
    emit = drained && run->reported_status != RunStatus::kInterrupted;
    if (emit) {
      run->reported_status = RunStatus::kInterrupted;
    }
  }
  if (drained) {
    ReleaseRun(run);
  }
  if (emit) {
    Emit(*run, MakeEvent(*run, RunStatus::kInterrupted));
  }
  return true;
}

bool RunScheduler::GetProgress(const std::string& project_id, RunProgress& progress,
                               ErrorInfo& error) const {
  std::shared_ptr<ActiveRun> run;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = runs_.find(project_id);
    if (it != runs_.end()) {
      run = it->second;
    }
  }

  progress = RunProgress{};
  progress.project_id = project_id;
  if (run != nullptr) {
    std::lock_guard<std::mutex> counters_lock(run->counters_mu);
    progress.status = run->status.load();
    progress.total_tasks = run->tasks.size();
    progress.completed_tasks = run->completed;
    progress.failed_tasks = run->failed;
    progress.active = true;
    return true;
  }

  store::ProjectConfig config;
  if (!store_->LoadProject(project_id, config, error)) {
    return false;
  }
  progress.status = config.status;
  progress.total_tasks = config.progress.total_tasks;
  progress.completed_tasks = config.progress.completed_tasks;
  progress.failed_tasks = config.progress.failed_tasks;
  return true;
}

bool RunScheduler::RetryCase(const std::string& project_id, const std::string& skill_id,
                             const std::string& case_id, ProgressCallback callback,
                             std::string& task_id, ErrorInfo& error) {
  if (skill_id.empty() || case_id.empty()) {
    core::errors::SetError(error, ErrorCode::kInvalidParams, "skill_id and case_id are required");
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (runs_.count(project_id) != 0U) {
      core::errors::SetError(error, ErrorCode::kAlreadyRunning,
                             "cannot retry while a run is active: " + project_id);
      return false;
    }
  }

  store::ProjectConfig config;
  if (!store_->LoadProject(project_id, config, error)) {
    return false;
  }
  std::vector<Task> tasks;
  if (!BuildTaskMatrix(config, tasks, error)) {
    return false;
  }
  const Task* found = nullptr;
  for (const Task& task : tasks) {
    if (task.skill.id == skill_id && task.test_case.id == case_id) {
      found = &task;
      break;
    }
  }
  if (found == nullptr) {
    core::errors::SetError(error, ErrorCode::kNotFound,
                           "task not found: skill=" + skill_id + " case=" + case_id);
    return false;
  }

  task_id = MakeRetryTaskId(skill_id, case_id);
  const Task task = *found;
  const auto executor = MakeExecutor(config);
  const ExecutionSettings execution = MakeExecutionSettings(config);
  logger_.Info("retry started", {{"project_id", project_id},
                                 {"task_id", task_id},
                                 {"skill_id", skill_id},
                                 {"case_id", case_id}});

  workers_.Launch([this, config, tasks, task, executor, execution, task_id,
                callback = std::move(callback)]() {
    const ResultRecord record = executor->Execute(task, execution, config.project_dir);

    // A retry changes one record; keep an existing summary in step with it.
    if (core::PathExists(SummaryPath(config.project_dir))) {
      std::vector<std::string> skipped;
      const Summary summary =
          AggregateSummary(config.id, tasks, LoadAllResultRecords(config.project_dir, skipped));
      std::string write_error;
      if (!WriteSummary(config.project_dir, summary, write_error)) {
        logger_.Error("summary refresh failed",
                      {{"project_id", config.id}, {"task_id", task_id}, {"error", write_error}});
      }
    }

    if (callback) {
      ProgressEvent event;
      event.project_id = config.id;
      event.task_id = task_id;
      event.total = 1;
      event.completed = record.status == RecordStatus::kCompleted ? 1U : 0U;
      event.failed = record.status == RecordStatus::kFailed ? 1U : 0U;
      event.project_status = RunStatus::kCompleted;
      LastResult last;
      last.skill_id = record.skill_id;
      last.case_id = record.case_id;
      last.status = record.status;
      if (record.score.has_value()) {
        last.score = record.score->total;
      }
      event.last_result = last;
      callback(event);
    }
  });
  return true;
}

void RunScheduler::LaunchDriver(const std::shared_ptr<ActiveRun>& run) {
  {
    std::lock_guard<std::mutex> drain_lock(run->drain_mu);
    run->driver_active = true;
    run->reported_status.reset();
  }
  workers_.Launch([this, run]() { DriveRun(run); });
}

void RunScheduler::DriveRun(const std::shared_ptr<ActiveRun>& run) {
  const auto groups = GroupBySkill(run->tasks);
  logger_.Info("skill streams launched", {{"project_id", run->project_id},
                                          {"run_id", run->run_id},
                                          {"stream_count", std::to_string(groups.size())}});

  std::vector<std::thread> streams;
  streams.reserve(groups.size());
  for (const auto& group : groups) {
    streams.emplace_back([this, run, &group]() { RunStream(run, group.second); });
  }
  for (std::thread& stream : streams) {
    stream.join();
  }

  RunStatus expected = RunStatus::kRunning;
  if (run->status.compare_exchange_strong(expected, RunStatus::kCompleted)) {
    FinishCompletedRun(run);
    return;
  }

  // Paused or interrupted: the checkpoint stays for a future resume. Stop may
  // land while the first terminal event is being delivered, so report until
  // the status settles.
  RunStatus reported = run->status.load();
  for (;;) {
    Emit(*run, MakeEvent(*run, reported));
    std::lock_guard<std::mutex> drain_lock(run->drain_mu);
    const RunStatus now = run->status.load();
    if (now == reported) {
      run->driver_active = false;
      run->reported_status = reported;
      break;
    }
    reported = now;
  }
  run->drained_cv.notify_all();
  if (reported == RunStatus::kInterrupted) {
    ReleaseRun(run);
  }
  logger_.Info("run halted", {{"project_id", run->project_id},
                              {"run_id", run->run_id},
                              {"status", store::ToString(reported)}});
}

void RunScheduler::RunStream(const std::shared_ptr<ActiveRun>& run,
                             const std::vector<const Task*>& tasks) {
  const std::string& skill_id = tasks.front()->skill.id;
  logger_.Debug("skill stream started", {{"project_id", run->project_id},
                                         {"skill_id", skill_id},
                                         {"task_count", std::to_string(tasks.size())}});

  for (const Task* task : tasks) {
    if (run->status.load() != RunStatus::kRunning) {
      break;
    }
    if (ResultRecordExists(run->project_dir, task->skill.id, task->test_case.id)) {
      continue;
    }

    const ResultRecord record = run->executor->Execute(*task, run->execution, run->project_dir);

    ProgressEvent event;
    {
      std::lock_guard<std::mutex> counters_lock(run->counters_mu);
      if (record.status == RecordStatus::kCompleted) {
        ++run->completed;
      } else {
        ++run->failed;
      }
      ErrorInfo write_error;
      if (!store_->WriteCheckpoint(run->project_dir,
                                   store::MakeProgress(run->tasks.size(), run->completed,
                                                       run->failed),
                                   std::nullopt, write_error)) {
        logger_.Error("checkpoint write failed", {{"project_id", run->project_id},
                                                  {"skill_id", task->skill.id},
                                                  {"case_id", task->test_case.id},
                                                  {"error_code", ToString(write_error.code)},
                                                  {"error", write_error.message}});
      }
      event.project_id = run->project_id;
      event.task_id = run->run_id;
      event.completed = run->completed;
      event.failed = run->failed;
      event.total = run->tasks.size();
    }
    event.project_status = run->status.load();
    LastResult last;
    last.skill_id = record.skill_id;
    last.case_id = record.case_id;
    last.status = record.status;
    if (record.score.has_value()) {
      last.score = record.score->total;
    }
    event.last_result = last;
    Emit(*run, event);
  }

  logger_.Debug("skill stream finished",
                {{"project_id", run->project_id}, {"skill_id", skill_id}});
}

void RunScheduler::FinishCompletedRun(const std::shared_ptr<ActiveRun>& run) {
  store::ProgressCounters progress;
  {
    std::lock_guard<std::mutex> counters_lock(run->counters_mu);
    progress = store::MakeProgress(run->tasks.size(), run->completed, run->failed);
  }
  ErrorInfo write_error;
  if (!store_->WriteCheckpoint(run->project_dir, progress, RunStatus::kCompleted, write_error)) {
    logger_.Error("completion checkpoint failed", {{"project_id", run->project_id},
                                                   {"error_code", ToString(write_error.code)},
                                                   {"error", write_error.message}});
  }

  std::vector<std::string> skipped;
  const std::vector<ResultRecord> records = LoadAllResultRecords(run->project_dir, skipped);
  for (const std::string& reason : skipped) {
    logger_.Warn("unreadable result record skipped",
                 {{"project_id", run->project_id}, {"error", reason}});
  }
  const Summary summary = AggregateSummary(run->project_id, run->tasks, records);
  std::string summary_error;
  if (!WriteSummary(run->project_dir, summary, summary_error)) {
    logger_.Error("summary write failed",
                  {{"project_id", run->project_id},
                   {"error_code", ToString(ErrorCode::kIoError)},
                   {"error", summary_error}});
  }

  ReleaseRun(run);

  logger_.Info("run completed", {{"project_id", run->project_id},
                                 {"run_id", run->run_id},
                                 {"completed", std::to_string(progress.completed_tasks)},
                                 {"failed", std::to_string(progress.failed_tasks)}});
  Emit(*run, MakeEvent(*run, RunStatus::kCompleted));

  {
    std::lock_guard<std::mutex> drain_lock(run->drain_mu);
    run->driver_active = false;
    run->reported_status = RunStatus::kCompleted;
  }
  run->drained_cv.notify_all();
}

void RunScheduler::ReleaseRun(const std::shared_ptr<ActiveRun>& run) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = runs_.find(run->project_id);
  if (it != runs_.end() && it->second == run) {
    runs_.erase(it);
  }
}

ProgressEvent RunScheduler::MakeEvent(ActiveRun& run, RunStatus status) {
  ProgressEvent event;
  event.project_id = run.project_id;
  event.task_id = run.run_id;
  event.project_status = status;
  std::lock_guard<std::mutex> counters_lock(run.counters_mu);
  event.completed = run.completed;
  event.failed = run.failed;
  event.total = run.tasks.size();
  return event;
}

void RunScheduler::Emit(ActiveRun& run, const ProgressEvent& event) {
  std::lock_guard<std::mutex> callback_lock(run.callback_mu);
  if (run.callback) {
    run.callback(event);
  }
}

void RunScheduler::WaitIdle() {
  workers_.WaitIdle();
}

} // namespace skillbench::eval
