#include "oracle/cli_oracle_client.hpp"

#include "core/json_dom.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string_view>
#include <utility>

#if !defined(_WIN32)
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace skillbench::oracle {

namespace {

std::string ToLower(std::string_view raw) {
  std::string lowered(raw);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

std::string Truncate(const std::string& text, std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

struct ProcessOutcome {
  int exec_errno = 0;
  bool timed_out = false;
  int exit_code = -1;
  std::string stdout_text;
  std::string stderr_text;
};

#if !defined(_WIN32)

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool MakePipe(int fds[2], std::string& error) {
  if (::pipe(fds) != 0) {
    error = std::string("pipe() failed: ") + std::strerror(errno);
    return false;
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

void IgnoreSigpipeOnce() {
  // Writing the prompt to a child that already exited must surface as EPIPE,
  // not terminate the process.
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

[[noreturn]] void ReportExecFailure(int fd) {
  const int saved = errno;
  const ssize_t ignored = ::write(fd, &saved, sizeof(saved));
  (void)ignored;
  ::_exit(127);
}

bool RunProcess(const std::vector<std::string>& args, const std::filesystem::path& working_dir,
                const std::string& stdin_text, std::chrono::milliseconds timeout,
                ProcessOutcome& outcome, std::string& error) {
  IgnoreSigpipeOnce();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};
  if (!MakePipe(in_pipe, error) || !MakePipe(out_pipe, error) || !MakePipe(err_pipe, error) ||
      !MakePipe(exec_pipe, error)) {
    for (int* fds : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      CloseFd(fds[0]);
      CloseFd(fds[1]);
    }
    return false;
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 1U);
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const std::string cwd = working_dir.string();

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork() failed: ") + std::strerror(errno);
    for (int* fds : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
      CloseFd(fds[0]);
      CloseFd(fds[1]);
    }
    return false;
  }

  if (pid == 0) {
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      ReportExecFailure(exec_pipe[1]);
    }
    ::dup2(in_pipe[0], STDIN_FILENO);
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    ::execvp(argv[0], argv.data());
    ReportExecFailure(exec_pipe[1]);
  }

  CloseFd(in_pipe[0]);
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  CloseFd(exec_pipe[1]);

  // The exec pipe closes on successful exec (CLOEXEC); data means exec failed.
  int child_errno = 0;
  ssize_t exec_read = 0;
  do {
    exec_read = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
  } while (exec_read < 0 && errno == EINTR);
  CloseFd(exec_pipe[0]);
  if (exec_read == static_cast<ssize_t>(sizeof(child_errno))) {
    CloseFd(in_pipe[1]);
    CloseFd(out_pipe[0]);
    CloseFd(err_pipe[0]);
    int status = 0;
    ::waitpid(pid, &status, 0);
    outcome.exec_errno = child_errno;
    return true;
  }

  ::fcntl(in_pipe[1], F_SETFL, ::fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);
  std::size_t written = 0;
  if (stdin_text.empty()) {
    CloseFd(in_pipe[1]);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[8192];
  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      outcome.timed_out = true;
      ::kill(pid, SIGKILL);
      break;
    }
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();

    pollfd fds[3];
    nfds_t count = 0;
    int* owners[3] = {nullptr, nullptr, nullptr};
    for (int* fd : {&out_pipe[0], &err_pipe[0]}) {
      if (*fd >= 0) {
        fds[count] = pollfd{*fd, POLLIN, 0};
        owners[count] = fd;
        ++count;
      }
    }
    if (in_pipe[1] >= 0) {
      fds[count] = pollfd{in_pipe[1], POLLOUT, 0};
      owners[count] = &in_pipe[1];
      ++count;
    }

    const int ready = ::poll(fds, count, static_cast<int>(std::max<long long>(1, remaining)));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = std::string("poll() failed: ") + std::strerror(errno);
      ::kill(pid, SIGKILL);
      break;
    }

    for (nfds_t i = 0; i < count; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      int* owner = owners[i];
      if (owner == &in_pipe[1]) {
        const ssize_t n = ::write(in_pipe[1], stdin_text.data() + written,
                                  stdin_text.size() - written);
        if (n > 0) {
          written += static_cast<std::size_t>(n);
        }
        if ((n < 0 && errno != EAGAIN && errno != EINTR) || written >= stdin_text.size()) {
          CloseFd(in_pipe[1]);
        }
        continue;
      }

      const ssize_t n = ::read(*owner, buffer, sizeof(buffer));
      if (n > 0) {
        std::string& sink = owner == &out_pipe[0] ? outcome.stdout_text : outcome.stderr_text;
        sink.append(buffer, static_cast<std::size_t>(n));
      } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
        CloseFd(*owner);
      }
    }
  }

  CloseFd(in_pipe[1]);
  CloseFd(out_pipe[0]);
  CloseFd(err_pipe[0]);

  int status = 0;
  pid_t waited = 0;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);
  if (waited == pid && WIFEXITED(status)) {
    outcome.exit_code = WEXITSTATUS(status);
  } else if (waited == pid && WIFSIGNALED(status)) {
    outcome.exit_code = 128 + WTERMSIG(status);
  }
  return error.empty();
}

#else

bool RunProcess(const std::vector<std::string>&, const std::filesystem::path&, const std::string&,
                std::chrono::milliseconds, ProcessOutcome& outcome, std::string&) {
  outcome.exec_errno = ENOENT;
  return true;
}

#endif

} // namespace

bool LooksRateLimited(const std::string& stderr_text) {
  const std::string lowered = ToLower(stderr_text);
  for (const std::string_view needle : {"rate limit", "rate-limit", "ratelimit", "rate_limit",
                                        "429"}) {
    if (lowered.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

bool ParseCliEnvelope(const std::string& stdout_text, std::uint64_t measured_duration_ms,
                      GenerateResult& result, OracleError& error) {
  core::json::Value envelope;
  std::string parse_error;
  if (!core::json::Parse(stdout_text, envelope, parse_error) || !envelope.is_object()) {
    error.kind = OracleErrorKind::kOutputParseError;
    error.message = "CLI output is not a JSON object: " +
                    (parse_error.empty() ? Truncate(stdout_text, 200) : parse_error);
    return false;
  }

  const core::json::Value* is_error = core::json::FindField(envelope, "is_error");
  if (is_error != nullptr && is_error->type == core::json::Value::Type::kBool &&
      is_error->bool_value) {
    error.kind = OracleErrorKind::kModelError;
    error.message = core::json::GetString(envelope, "result", "model reported an error");
    return false;
  }

  result.text = core::json::GetString(envelope, "result");
  const auto reported = core::json::GetNumber(envelope, "duration_ms");
  result.duration_ms = reported.has_value() && reported.value() >= 0.0
                           ? static_cast<std::uint64_t>(reported.value())
                           : measured_duration_ms;
  return true;
}

CliOracleClient::CliOracleClient(CliOracleSettings settings, core::logging::Logger logger)
    : settings_(std::move(settings)), logger_(logger.WithComponent("oracle")) {}

std::vector<std::string> CliOracleClient::BuildArguments(const GenerateOptions& options) const {
  std::vector<std::string> args = {
      settings_.cli_path, "--print", "--output-format", "json", "--model",
      options.model.empty() ? settings_.default_model : options.model,
      "--dangerously-skip-permissions",
  };
  if (options.system_instructions.has_value() && !options.system_instructions->empty()) {
    args.emplace_back("--system-prompt");
    args.push_back(options.system_instructions.value());
  }
  return args;
}

bool CliOracleClient::Generate(const std::string& prompt, const GenerateOptions& options,
                               GenerateResult& result, OracleError& error) {
  result = GenerateResult{};
  const auto started = std::chrono::steady_clock::now();

  ProcessOutcome outcome;
  std::string spawn_error;
  const bool ran =
      RunProcess(BuildArguments(options), options.working_dir, prompt, options.timeout, outcome,
                 spawn_error);
  const auto elapsed_ms = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started)
          .count());

  if (!ran) {
    error.kind = OracleErrorKind::kExecutionError;
    error.message = "failed to run oracle CLI: " + spawn_error;
  } else if (outcome.exec_errno == ENOENT) {
    error.kind = OracleErrorKind::kNotAvailable;
    error.message = "oracle CLI not found: " + settings_.cli_path;
  } else if (outcome.exec_errno != 0) {
    error.kind = OracleErrorKind::kExecutionError;
    error.message = "failed to start oracle CLI: " + std::string(std::strerror(outcome.exec_errno));
  } else if (outcome.timed_out) {
    error.kind = OracleErrorKind::kTimeout;
    error.message = "oracle CLI timed out after " + std::to_string(options.timeout.count()) + "ms";
  } else if (outcome.exit_code != 0) {
    error.kind = LooksRateLimited(outcome.stderr_text) ? OracleErrorKind::kRateLimited
                                                       : OracleErrorKind::kExecutionError;
    error.message = "oracle CLI exited with code " + std::to_string(outcome.exit_code) + ": " +
                    Truncate(outcome.stderr_text, 500);
  } else if (ParseCliEnvelope(outcome.stdout_text, elapsed_ms, result, error)) {
    logger_.Debug("oracle call completed",
                  {{"duration_ms", std::to_string(result.duration_ms)},
                   {"working_dir", options.working_dir.string()}});
    return true;
  }

  logger_.Warn("oracle call failed", {{"error_code", ToString(error.kind)},
                                      {"error", error.message},
                                      {"working_dir", options.working_dir.string()}});
  return false;
}

} // namespace skillbench::oracle
