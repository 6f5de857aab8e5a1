#include "skillbench/cli/router.hpp"

#include "collab/analysis_service.hpp"
#include "collab/port_adapters.hpp"
#include "collab/recompose_service.hpp"
#include "core/errors/error_codes.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "eval/result_record.hpp"
#include "eval/results_query.hpp"
#include "eval/run_scheduler.hpp"
#include "eval/summary.hpp"
#include "iteration/round_controller.hpp"
#include "oracle/cli_oracle_client.hpp"
#include "oracle/oracle_config.hpp"
#include "oracle/retrying_oracle_client.hpp"
#include "store/iteration_store.hpp"
#include "store/project_config.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <cstdint>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace skillbench::cli {

namespace {

using core::errors::ErrorInfo;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInterrupted = core::errors::ToInt(core::errors::ExitCode::kInterrupted);

constexpr auto kInterruptPollInterval = std::chrono::milliseconds(200);

volatile std::sig_atomic_t g_interrupt_requested = 0;

void HandleInterrupt(int /*signal*/) {
  g_interrupt_requested = 1;
}

// Ctrl-C turns into a cooperative pause request for the duration of one
// command.
class ScopedInterruptHandler {
public:
  ScopedInterruptHandler() {
    g_interrupt_requested = 0;
    previous_ = std::signal(SIGINT, HandleInterrupt);
  }
  ~ScopedInterruptHandler() {
    std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
  }

  ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
  ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;

  bool Requested() const {
    return g_interrupt_requested != 0;
  }

private:
  using Handler = void (*)(int);
  Handler previous_ = SIG_DFL;
};

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  skillbench run <project_id>\n"
      << "  skillbench resume <project_id>\n"
      << "  skillbench progress <project_id>\n"
      << "  skillbench results <project_id> [--skill <id>] [--case <id>] "
         "[--status <completed|failed>] [--page <n>] [--page-size <n>]\n"
      << "  skillbench export <project_id> --format <json|csv> --out <file>\n"
      << "  skillbench retry <project_id> <skill_id> <case_id>\n"
      << "  skillbench iterate <project_id> --skill <id> [--max-rounds <n>] "
         "[--stop-threshold <x>] [--beam-width <n>] [--plateau-threshold <x>] "
         "[--plateau-rounds <n>] [--retention-rules <text>] [--segments <id,id,...>]\n"
      << "  skillbench report <project_id> [--exploration-log]\n"
      << "  skillbench version\n"
      << "  skillbench help\n"
      << "common options: --workspace <dir> (default: workspace) "
         "--log-level <debug|info|warn|error>\n";
}

int ReportError(const ErrorInfo& error) {
  std::cerr << "error: " << core::errors::Describe(error) << '\n';
  return core::errors::ToInt(core::errors::ToExitCode(error.code));
}

int UsageError(const std::string& message) {
  std::cerr << "error: " << message << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

bool ParseUint(std::string_view text, std::uint32_t& value) {
  const auto* begin = text.data();
  const auto* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  return !text.empty() && ec == std::errc() && ptr == end;
}

bool ParseDouble(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* parse_end = nullptr;
  const double parsed = std::strtod(text.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0' || !std::isfinite(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

std::vector<std::string> SplitList(const std::string& text) {
  std::vector<std::string> items;
  std::size_t start = 0;
  while (start <= text.size()) {
    const std::size_t comma = text.find(',', start);
    const std::size_t stop = comma == std::string::npos ? text.size() : comma;
    if (stop > start) {
      items.push_back(text.substr(start, stop - start));
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  return items;
}

std::optional<std::string> Option(const ParsedArgs& parsed, const std::string& name) {
  const auto it = parsed.options.find(name);
  if (it == parsed.options.end()) {
    return std::nullopt;
  }
  return it->second;
}

// Everything one command invocation needs, wired over the CLI oracle.
struct Services {
  std::shared_ptr<store::ProjectStore> store;
  std::shared_ptr<eval::RunScheduler> scheduler;
  std::shared_ptr<collab::AnalysisService> analysis;
  std::shared_ptr<collab::RecomposeService> recompose;
  std::unique_ptr<iteration::RoundController> controller;
};

bool BuildServices(const CommonOptions& common, const core::logging::Logger& logger,
                   Services& services, std::string& error) {
  oracle::OracleConfig config;
  if (!oracle::LoadOracleConfig(common.workspace, config, error)) {
    return false;
  }

  oracle::CliOracleSettings cli_settings;
  cli_settings.cli_path = config.cli_path;
  cli_settings.default_model = config.default_model;
  auto cli = std::make_shared<oracle::CliOracleClient>(cli_settings, logger);

  oracle::RetryPolicy policy;
  policy.retry_count = static_cast<int>(config.default_retry_count);
  auto collaborator_oracle = std::make_shared<oracle::RetryingOracleClient>(cli, policy, logger);

  collab::OracleCallSettings call_settings;
  call_settings.model = config.default_model;
  call_settings.timeout = std::chrono::seconds(config.analysis_timeout_seconds);

  services.store = std::make_shared<store::ProjectStore>(common.workspace);
  services.scheduler = std::make_shared<eval::RunScheduler>(
      services.store, cli, eval::MakeSchedulerSettings(config), logger);
  services.analysis = std::make_shared<collab::AnalysisService>(
      services.store, collaborator_oracle, call_settings, logger);
  services.recompose = std::make_shared<collab::RecomposeService>(
      services.store, collaborator_oracle, call_settings, logger);
  services.controller = std::make_unique<iteration::RoundController>(
      services.store,
      collab::MakeIterationPorts(services.store, services.scheduler, services.analysis,
                                 services.recompose, logger),
      logger);
  return true;
}

// Collects scheduler events for a foreground command and hands the terminal
// one to the waiting thread.
class RunWatcher {
public:
  // A retry reports through one event that carries its result.
  explicit RunWatcher(bool single_event = false) : single_event_(single_event) {}

  eval::ProgressCallback Callback() {
    return [state = state_, single_event = single_event_](const eval::ProgressEvent& event) {
      if (event.last_result.has_value()) {
        const auto& last = event.last_result.value();
        std::cout << "[" << (event.completed + event.failed) << "/" << event.total << "] skill="
                  << last.skill_id << " case=" << last.case_id
                  << " status=" << eval::ToString(last.status);
        if (last.score.has_value()) {
          std::cout << " score=" << core::FormatJsonNumber(last.score.value());
        }
        std::cout << std::endl;
        if (!single_event) {
          return;
        }
      }
      std::lock_guard<std::mutex> lock(state->mu);
      state->terminal = event;
      state->cv.notify_all();
    };
  }

  // Waits for the terminal event, turning Ctrl-C into one `on_interrupt`
  // call.
  template <typename OnInterrupt>
  eval::ProgressEvent Wait(const ScopedInterruptHandler& interrupt, OnInterrupt on_interrupt) {
    bool interrupt_sent = false;
    std::unique_lock<std::mutex> lock(state_->mu);
    for (;;) {
      if (state_->cv.wait_for(lock, kInterruptPollInterval,
                              [this]() { return state_->terminal.has_value(); })) {
        return state_->terminal.value();
      }
      if (interrupt.Requested() && !interrupt_sent) {
        interrupt_sent = true;
        lock.unlock();
        on_interrupt();
        lock.lock();
      }
    }
  }

private:
  struct State {
    std::mutex mu;
    std::condition_variable cv;
    std::optional<eval::ProgressEvent> terminal;
  };
  bool single_event_ = false;
  std::shared_ptr<State> state_ = std::make_shared<State>();
};

void PrintRanking(const store::ProjectStore& store, const std::string& project_id) {
  fs::path project_dir;
  ErrorInfo error;
  if (!store.FindProjectDir(project_id, project_dir, error)) {
    return;
  }
  eval::Summary summary;
  std::string summary_error;
  if (!eval::LoadSummary(project_dir, summary, summary_error)) {
    return;
  }
  for (const auto& entry : summary.ranking) {
    std::cout << "rank " << entry.rank << ": " << entry.skill_name << " (" << entry.skill_id
              << ") avg=" << core::FormatJsonNumber(entry.avg_score)
              << " completed=" << entry.completed_cases << " failed=" << entry.failed_cases
              << '\n';
  }
}

int FinishRunCommand(const Services& services, const std::string& project_id,
                     const CommonOptions& common, const eval::ProgressEvent& terminal) {
  const std::uint64_t counted = terminal.completed + terminal.failed;
  switch (terminal.project_status) {
  case eval::RunStatus::kCompleted:
    std::cout << "run completed: " << terminal.completed << " completed, " << terminal.failed
              << " failed, " << terminal.total << " total\n";
    PrintRanking(*services.store, project_id);
    return kExitSuccess;
  case eval::RunStatus::kPaused:
    std::cout << "run paused at checkpoint " << counted << "/" << terminal.total
              << "; continue with: skillbench resume " << project_id << " --workspace "
              << common.workspace.string() << '\n';
    return kExitSuccess;
  case eval::RunStatus::kInterrupted:
    std::cout << "run interrupted at " << counted << "/" << terminal.total << '\n';
    return kExitInterrupted;
  default:
    break;
  }
  std::cerr << "error: run ended in unexpected state: "
            << store::ToString(terminal.project_status) << '\n';
  return kExitFailure;
}

int PrepareCommand(const std::vector<std::string_view>& args,
                   const std::vector<std::string_view>& allowed, std::size_t positional_count,
                   const char* usage, ParsedArgs& parsed) {
  std::string error;
  if (!ParseArgs(args, allowed, parsed, error)) {
    return UsageError(error);
  }
  if (parsed.positional.size() != positional_count) {
    return UsageError(usage);
  }
  return kExitSuccess;
}

core::logging::Logger MakeLogger(const CommonOptions& common) {
  return core::logging::Logger(common.log_level, std::cerr).WithComponent("cli");
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "skillbench 0.1.0\n";
  return kExitSuccess;
}

// `run` and `resume` share the foreground wait and Ctrl-C handling.
int CommandRunOrResume(const std::vector<std::string_view>& args, bool resume) {
  ParsedArgs parsed;
  if (const int rc = PrepareCommand(args, {}, 1,
                                    resume ? "resume requires exactly 1 argument: <project_id>"
                                           : "run requires exactly 1 argument: <project_id>",
                                    parsed);
      rc != kExitSuccess) {
    return rc;
  }
  const std::string& project_id = parsed.positional.front();
  const core::logging::Logger logger = MakeLogger(parsed.common);

  Services services;
  std::string build_error;
  if (!BuildServices(parsed.common, logger, services, build_error)) {
    std::cerr << "error: " << build_error << '\n';
    return kExitFailure;
  }

  ScopedInterruptHandler interrupt;
  RunWatcher watcher;
  ErrorInfo error;
  if (resume) {
    std::uint64_t remaining = 0;
    if (!services.scheduler->Resume(project_id, watcher.Callback(), remaining, error)) {
      return ReportError(error);
    }
    std::cout << "run resumed: " << remaining << " tasks remaining\n";
  } else {
    std::string run_id;
    if (!services.scheduler->Start(project_id, watcher.Callback(), run_id, error)) {
      return ReportError(error);
    }
    std::cout << "run started: " << run_id << '\n';
  }

  const eval::ProgressEvent terminal = watcher.Wait(interrupt, [&]() {
    std::cout << "pausing after in-flight tasks finish..." << std::endl;
    std::uint64_t checkpoint = 0;
    ErrorInfo pause_error;
    if (!services.scheduler->Pause(project_id, checkpoint, pause_error)) {
      std::cerr << "warning: " << core::errors::Describe(pause_error) << '\n';
    }
  });
  return FinishRunCommand(services, project_id, parsed.common, terminal);
}

int CommandRun(const std::vector<std::string_view>& args) {
  return CommandRunOrResume(args, false);
}

int CommandResume(const std::vector<std::string_view>& args) {
  return CommandRunOrResume(args, true);
}

int CommandProgress(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  if (const int rc =
          PrepareCommand(args, {}, 1, "progress requires exactly 1 argument: <project_id>", parsed);
      rc != kExitSuccess) {
    return rc;
  }
  const std::string& project_id = parsed.positional.front();
  const core::logging::Logger logger = MakeLogger(parsed.common);
  Services services;
  std::string build_error;
  if (!BuildServices(parsed.common, logger, services, build_error)) {
    std::cerr << "error: " << build_error << '\n';
    return kExitFailure;
  }

  ErrorInfo error;
  eval::RunProgress progress;
  if (!services.scheduler->GetProgress(project_id, progress, error)) {
    return ReportError(error);
  }
  std::cout << "project_id: " << progress.project_id << '\n'
            << "status: " << store::ToString(progress.status) << '\n'
            << "total_tasks: " << progress.total_tasks << '\n'
            << "completed_tasks: " << progress.completed_tasks << '\n'
            << "failed_tasks: " << progress.failed_tasks << '\n';

  iteration::IterationProgress iteration_progress;
  if (!services.controller->GetProgress(project_id, iteration_progress, error)) {
    return ReportError(error);
  }
  if (!iteration_progress.rounds.empty()) {
    std::cout << "iteration_status: " << iteration_progress.status << '\n'
              << "iteration_round: " << iteration_progress.current_round << '\n'
              << "iteration_phase: " << iteration_progress.current_phase << '\n';
    for (const auto& round : iteration_progress.rounds) {
      std::cout << "  round " << round.round << ": " << round.status;
      if (round.avg_score.has_value()) {
        std::cout << " avg=" << core::FormatJsonNumber(round.avg_score.value());
      }
      std::cout << '\n';
    }
  }
  return kExitSuccess;
}

int CommandResults(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  if (const int rc = PrepareCommand(args, {"--skill", "--case", "--status", "--page", "--page-size"},
                                    1, "results requires exactly 1 argument: <project_id>",
                                    parsed);
      rc != kExitSuccess) {
    return rc;
  }

  eval::ResultFilter filter;
  filter.skill_id = Option(parsed, "--skill");
  filter.case_id = Option(parsed, "--case");
  if (const auto status = Option(parsed, "--status"); status.has_value()) {
    eval::RecordStatus record_status = eval::RecordStatus::kCompleted;
    if (!eval::ParseRecordStatus(status.value(), record_status)) {
      return UsageError("invalid --status '" + status.value() + "' (expected completed|failed)");
    }
    filter.status = record_status;
  }
  std::uint32_t page = 1;
  std::uint32_t page_size = 20;
  if (const auto text = Option(parsed, "--page"); text.has_value() && !ParseUint(*text, page)) {
    return UsageError("invalid --page '" + *text + "'");
  }
  if (const auto text = Option(parsed, "--page-size");
      text.has_value() && !ParseUint(*text, page_size)) {
    return UsageError("invalid --page-size '" + *text + "'");
  }

  const store::ProjectStore store(parsed.common.workspace);
  eval::ResultPage result;
  ErrorInfo error;
  if (!eval::QueryResults(store, parsed.positional.front(), filter, page, page_size, result,
                          error)) {
    return ReportError(error);
  }

  core::json::Value root = core::json::MakeObject();
  root.object_value["total"] = core::json::MakeNumber(static_cast<double>(result.total));
  root.object_value["page"] = core::json::MakeNumber(static_cast<double>(result.page));
  root.object_value["page_size"] = core::json::MakeNumber(static_cast<double>(result.page_size));
  core::json::Value items = core::json::MakeArray();
  for (const auto& record : result.items) {
    items.array_value.push_back(eval::ResultRecordToJson(record));
  }
  root.object_value["items"] = std::move(items);
  root.object_value["summary"] = result.summary.has_value()
                                     ? eval::SummaryToJson(result.summary.value())
                                     : core::json::MakeNull();
  std::cout << core::json::Serialize(root) << '\n';
  return kExitSuccess;
}

int CommandExport(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  if (const int rc = PrepareCommand(args, {"--format", "--out"}, 1,
                                    "export requires exactly 1 argument: <project_id>", parsed);
      rc != kExitSuccess) {
    return rc;
  }
  const auto format_text = Option(parsed, "--format");
  const auto out = Option(parsed, "--out");
  if (!format_text.has_value() || !out.has_value()) {
    return UsageError("export requires --format <json|csv> and --out <file>");
  }
  eval::ExportFormat format = eval::ExportFormat::kJson;
  if (!eval::ParseExportFormat(format_text.value(), format)) {
    return UsageError("invalid --format '" + format_text.value() + "' (expected json|csv)");
  }

  const store::ProjectStore store(parsed.common.workspace);
  ErrorInfo error;
  if (!eval::ExportResults(store, parsed.positional.front(), format, out.value(), error)) {
    return ReportError(error);
  }
  std::cout << "exported: " << out.value() << '\n';
  return kExitSuccess;
}

int CommandRetry(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  if (const int rc = PrepareCommand(
          args, {}, 3, "retry requires exactly 3 arguments: <project_id> <skill_id> <case_id>",
          parsed);
      rc != kExitSuccess) {
    return rc;
  }
  const core::logging::Logger logger = MakeLogger(parsed.common);
  Services services;
  std::string build_error;
  if (!BuildServices(parsed.common, logger, services, build_error)) {
    std::cerr << "error: " << build_error << '\n';
    return kExitFailure;
  }

  ScopedInterruptHandler interrupt;
  RunWatcher watcher(true);
  std::string task_id;
  ErrorInfo error;
  if (!services.scheduler->RetryCase(parsed.positional[0], parsed.positional[1],
                                     parsed.positional[2], watcher.Callback(), task_id, error)) {
    return ReportError(error);
  }
  std::cout << "retry started: " << task_id << '\n';
  const eval::ProgressEvent terminal = watcher.Wait(interrupt, []() {
    std::cout << "retry finishes its oracle call before exiting..." << std::endl;
  });
  return terminal.failed == 0U ? kExitSuccess : kExitFailure;
}

bool ParseIterationParams(const ParsedArgs& parsed, iteration::IterationParams& params,
                          std::string& error) {
  const auto skill = Option(parsed, "--skill");
  if (!skill.has_value() || skill->empty()) {
    error = "iterate requires --skill <id>";
    return false;
  }
  params.initial_skill_id = skill.value();

  if (const auto text = Option(parsed, "--max-rounds");
      text.has_value() && (!ParseUint(*text, params.max_rounds) || params.max_rounds == 0U)) {
    error = "invalid --max-rounds '" + *text + "' (expected integer >= 1)";
    return false;
  }
  if (const auto text = Option(parsed, "--stop-threshold"); text.has_value()) {
    double value = 0.0;
    if (!ParseDouble(*text, value)) {
      error = "invalid --stop-threshold '" + *text + "'";
      return false;
    }
    params.stop_threshold = value;
  }
  if (const auto text = Option(parsed, "--beam-width"); text.has_value()) {
    std::uint32_t value = 0;
    if (!ParseUint(*text, value) || value == 0U) {
      error = "invalid --beam-width '" + *text + "' (expected integer >= 1)";
      return false;
    }
    params.beam_width = value;
  }
  if (const auto text = Option(parsed, "--plateau-threshold"); text.has_value()) {
    double value = 0.0;
    if (!ParseDouble(*text, value) || value < 0.0) {
      error = "invalid --plateau-threshold '" + *text + "'";
      return false;
    }
    params.plateau_threshold = value;
  }
  if (const auto text = Option(parsed, "--plateau-rounds"); text.has_value()) {
    std::uint32_t value = 0;
    if (!ParseUint(*text, value) || value == 0U) {
      error = "invalid --plateau-rounds '" + *text + "' (expected integer >= 1)";
      return false;
    }
    params.plateau_rounds_before_escape = value;
  }
  params.retention_rules = Option(parsed, "--retention-rules").value_or("");
  if (const auto text = Option(parsed, "--segments"); text.has_value()) {
    params.selected_segment_ids = SplitList(*text);
  }
  return true;
}

int CommandIterate(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  if (const int rc = PrepareCommand(
          args,
          {"--skill", "--max-rounds", "--stop-threshold", "--beam-width", "--plateau-threshold",
           "--plateau-rounds", "--retention-rules", "--segments"},
          1, "iterate requires exactly 1 argument: <project_id>", parsed);
      rc != kExitSuccess) {
    return rc;
  }
  iteration::IterationParams params;
  std::string params_error;
  if (!ParseIterationParams(parsed, params, params_error)) {
    return UsageError(params_error);
  }
  const std::string& project_id = parsed.positional.front();
  const core::logging::Logger logger = MakeLogger(parsed.common);
  Services services;
  std::string build_error;
  if (!BuildServices(parsed.common, logger, services, build_error)) {
    std::cerr << "error: " << build_error << '\n';
    return kExitFailure;
  }

  struct Done {
    std::mutex mu;
    std::condition_variable cv;
    std::optional<iteration::IterationOutcome> outcome;
  };
  auto done = std::make_shared<Done>();
  iteration::IterationCallbacks callbacks;
  callbacks.on_round = [](const iteration::RoundEvent& event) {
    std::cout << "round " << event.round << ": skill=" << event.skill_id
              << " avg=" << core::FormatJsonNumber(event.avg_score);
    if (event.score_delta.has_value()) {
      std::cout << " delta=" << core::FormatJsonNumber(event.score_delta.value());
    }
    std::cout << " plateau_level=" << event.plateau_level << std::endl;
  };
  callbacks.on_complete = [done](const iteration::IterationOutcome& outcome) {
    std::lock_guard<std::mutex> lock(done->mu);
    done->outcome = outcome;
    done->cv.notify_all();
  };

  ScopedInterruptHandler interrupt;
  std::string iteration_id;
  ErrorInfo error;
  if (!services.controller->StartIteration(project_id, params, std::move(callbacks),
                                           iteration_id, error)) {
    return ReportError(error);
  }
  std::cout << "iteration started: " << iteration_id << '\n';

  bool pause_sent = false;
  std::unique_lock<std::mutex> lock(done->mu);
  while (!done->cv.wait_for(lock, kInterruptPollInterval,
                            [&done]() { return done->outcome.has_value(); })) {
    if (interrupt.Requested() && !pause_sent) {
      pause_sent = true;
      lock.unlock();
      std::cout << "pausing at the next round boundary..." << std::endl;
      ErrorInfo pause_error;
      if (!services.controller->PauseIteration(project_id, pause_error)) {
        std::cerr << "warning: " << core::errors::Describe(pause_error) << '\n';
      }
      lock.lock();
    }
  }
  const iteration::IterationOutcome outcome = done->outcome.value();
  lock.unlock();

  std::cout << core::json::Serialize(iteration::IterationReportToJson(outcome.report)) << '\n';
  if (outcome.stop_reason == iteration::StopReason::kError) {
    std::cerr << "error: iteration ended in error: " << outcome.error << '\n';
    return kExitInterrupted;
  }
  return kExitSuccess;
}

int CommandReport(const std::vector<std::string_view>& args) {
  std::vector<std::string_view> remaining;
  bool exploration_log = false;
  for (const std::string_view arg : args) {
    if (arg == "--exploration-log") {
      exploration_log = true;
    } else {
      remaining.push_back(arg);
    }
  }
  ParsedArgs parsed;
  if (const int rc = PrepareCommand(remaining, {}, 1,
                                    "report requires exactly 1 argument: <project_id>", parsed);
      rc != kExitSuccess) {
    return rc;
  }
  const core::logging::Logger logger = MakeLogger(parsed.common);
  Services services;
  std::string build_error;
  if (!BuildServices(parsed.common, logger, services, build_error)) {
    std::cerr << "error: " << build_error << '\n';
    return kExitFailure;
  }

  core::json::Value document;
  ErrorInfo error;
  const bool ok =
      exploration_log
          ? services.controller->GetExplorationLog(parsed.positional.front(), document, error)
          : services.controller->GetReport(parsed.positional.front(), document, error);
  if (!ok) {
    return ReportError(error);
  }
  std::cout << core::json::Serialize(document) << '\n';
  return kExitSuccess;
}

} // namespace

bool ParseArgs(const std::vector<std::string_view>& args,
               const std::vector<std::string_view>& allowed, ParsedArgs& parsed,
               std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (token.size() < 2U || token.substr(0, 2) != "--") {
      parsed.positional.emplace_back(token);
      continue;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    const std::string_view value = args[i + 1];
    ++i;

    if (token == "--workspace") {
      if (value.empty()) {
        error = "--workspace cannot be empty";
        return false;
      }
      parsed.common.workspace = fs::path(value);
      continue;
    }
    if (token == "--log-level") {
      if (!core::logging::ParseLogLevel(value, parsed.common.log_level, error)) {
        return false;
      }
      continue;
    }
    if (std::find(allowed.begin(), allowed.end(), token) == allowed.end()) {
      error = "unknown option: " + std::string(token);
      return false;
    }
    parsed.options[std::string(token)] = std::string(value);
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "run") {
    return CommandRun(args);
  }
  if (command == "resume") {
    return CommandResume(args);
  }
  if (command == "progress") {
    return CommandProgress(args);
  }
  if (command == "results") {
    return CommandResults(args);
  }
  if (command == "export") {
    return CommandExport(args);
  }
  if (command == "retry") {
    return CommandRetry(args);
  }
  if (command == "iterate") {
    return CommandIterate(args);
  }
  if (command == "report") {
    return CommandReport(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace skillbench::cli
