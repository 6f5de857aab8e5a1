#pragma once

#include "core/errors/error_codes.hpp"
#include "core/logging/logger.hpp"
#include "iteration/exploration_log.hpp"
#include "iteration/ports.hpp"
#include "iteration/strategy.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace skillbench::iteration {

// Cooperative halt requests shared by the loop and the explorer. Checked at
// round and candidate boundaries only.
struct HaltFlags {
  std::atomic<bool> pause_requested{false};
  std::atomic<bool> stop_requested{false};

  bool Halted() const {
    return pause_requested.load() || stop_requested.load();
  }
};

struct ExploreRequest {
  std::string project_id;
  std::filesystem::path project_dir;
  // Round that just finished; candidates are built for round + 1.
  std::uint32_t round = 0;
  int plateau_level = 0;
  std::uint32_t beam_width = 1;
  std::vector<RoundRecord> history;
  std::string retention_rules;
  std::vector<std::string> selected_segment_ids;
  std::vector<std::string> original_skill_ids;
};

// Produces the next round's skill by trying one candidate per selected
// strategy.
//
// Candidates run strictly one after another so each full test run owns the
// project's working context. The highest average wins and is registered again
// as the project's candidate; losers and failures stay in the log. When every
// candidate fails the winner is left empty and the caller carries the previous
// skill forward.
class BeamExplorer {
public:
  BeamExplorer(IterationPorts ports, core::logging::Logger logger);

  // Fills `log` with every attempted candidate. Returns false only when the
  // chosen winner cannot be registered for the next round.
  bool Explore(const ExploreRequest& request, const HaltFlags& halt, ExplorationRound& log,
               core::errors::ErrorInfo& error) const;

private:
  bool RunCandidate(const ExploreRequest& request, std::size_t candidate_number,
                    Strategy strategy, eval::ScoreDimension focus, CandidateOutcome& outcome,
                    core::errors::ErrorInfo& error) const;

  IterationPorts ports_;
  core::logging::Logger logger_;
};

} // namespace skillbench::iteration
