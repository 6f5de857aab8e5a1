#pragma once

#include "core/errors/error_codes.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "core/worker_set.hpp"
#include "iteration/beam_explorer.hpp"
#include "iteration/exploration_log.hpp"
#include "iteration/ports.hpp"
#include "iteration/stop_conditions.hpp"
#include "store/iteration_store.hpp"
#include "store/project_config.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skillbench::iteration {

struct IterationParams {
  std::string initial_skill_id;
  std::uint32_t max_rounds = 3;
  std::optional<double> stop_threshold;
  std::string retention_rules;
  std::vector<std::string> selected_segment_ids;
  // Unset values come from the project's iteration_config.
  std::optional<std::uint32_t> beam_width;
  std::optional<double> plateau_threshold;
  std::optional<std::uint32_t> plateau_rounds_before_escape;
};

// Step of the round currently executing.
enum class IterationPhase {
  kIdle,
  kTesting,
  kAnalyzing,
  kExploring,
};

const char* ToString(IterationPhase phase);

struct RoundEvent {
  std::string project_id;
  std::uint32_t round = 0;
  std::string skill_id;
  double avg_score = 0.0;
  std::optional<double> score_delta;
  int plateau_level = 0;
};

struct IterationOutcome {
  std::string project_id;
  std::string iteration_id;
  StopReason stop_reason = StopReason::kMaxRounds;
  IterationReport report;
  // Set when the loop ended with `error`.
  std::string error;
};

using RoundCallback = std::function<void(const RoundEvent&)>;
using CompletionCallback = std::function<void(const IterationOutcome&)>;

struct IterationCallbacks {
  RoundCallback on_round;
  CompletionCallback on_complete;
};

struct IterationProgress {
  std::string project_id;
  // running | paused | stopped | completed | idle
  std::string status = "idle";
  std::uint32_t current_round = 0;
  std::uint32_t total_rounds = 0;
  std::string current_phase = "idle";
  std::vector<store::RoundSnapshot> rounds;
};

// Round-based search loop over skill variants.
//
// Each round tests the current candidate, analyzes the results, reads its
// score and then asks the beam explorer for the next candidate. Pause and
// stop requests are observed at round and candidate boundaries; a round in
// progress always finishes its blocking steps. The report and exploration log
// are written once when the loop exits and never touched afterwards.
class RoundController {
public:
  RoundController(std::shared_ptr<store::ProjectStore> store, IterationPorts ports,
                  core::logging::Logger logger);
  ~RoundController();

  RoundController(const RoundController&) = delete;
  RoundController& operator=(const RoundController&) = delete;

  // Returns immediately; the loop runs on a background thread.
  bool StartIteration(const std::string& project_id, const IterationParams& params,
                      IterationCallbacks callbacks, std::string& iteration_id,
                      core::errors::ErrorInfo& error);

  bool PauseIteration(const std::string& project_id, core::errors::ErrorInfo& error);
  bool StopIteration(const std::string& project_id, core::errors::ErrorInfo& error);

  bool GetProgress(const std::string& project_id, IterationProgress& progress,
                   core::errors::ErrorInfo& error) const;

  // NOT_FOUND until an iteration has finished for the project.
  bool GetReport(const std::string& project_id, core::json::Value& report,
                 core::errors::ErrorInfo& error) const;
  bool GetExplorationLog(const std::string& project_id, core::json::Value& log,
                         core::errors::ErrorInfo& error) const;

  // Blocks until every background loop has exited.
  void WaitIdle();

private:
  struct ResolvedParams {
    std::string initial_skill_id;
    std::uint32_t max_rounds = 3;
    std::optional<double> stop_threshold;
    std::string retention_rules;
    std::vector<std::string> selected_segment_ids;
    std::uint32_t beam_width = 1;
    double plateau_threshold = 1.0;
    std::uint32_t plateau_rounds_before_escape = 2;
  };

  struct ActiveIteration {
    std::string project_id;
    std::string iteration_id;
    std::filesystem::path project_dir;
    std::vector<std::string> original_skill_ids;
    bool initial_skill_configured = false;
    ResolvedParams params;
    IterationCallbacks callbacks;
    HaltFlags halt;
    std::atomic<IterationPhase> phase{IterationPhase::kIdle};
  };

  void RunLoop(const std::shared_ptr<ActiveIteration>& iteration);
  bool RunRound(ActiveIteration& iteration, std::uint32_t round, const std::string& skill_id,
                RoundRecord& record, core::errors::ErrorInfo& error);
  bool ReadRoundScore(const ActiveIteration& iteration, const std::string& skill_id,
                      RoundRecord& record, core::errors::ErrorInfo& error) const;
  void Finish(const std::shared_ptr<ActiveIteration>& iteration, StopReason reason,
              const std::string& error_message, std::vector<RoundRecord> rounds,
              ExplorationLog log);

  std::shared_ptr<ActiveIteration> FindActive(const std::string& project_id) const;

  std::shared_ptr<store::ProjectStore> store_;
  IterationPorts ports_;
  BeamExplorer explorer_;
  core::logging::Logger logger_;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<ActiveIteration>> iterations_;

  core::WorkerSet workers_;
};

} // namespace skillbench::iteration
