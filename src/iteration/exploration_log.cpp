#include "iteration/exploration_log.hpp"

#include <utility>

namespace skillbench::iteration {

namespace {

core::json::Value OptionalNumber(const std::optional<double>& value) {
  return value.has_value() ? core::json::MakeNumber(value.value()) : core::json::MakeNull();
}

core::json::Value StringArray(const std::vector<std::string>& items) {
  core::json::Value array = core::json::MakeArray();
  for (const auto& item : items) {
    array.array_value.push_back(core::json::MakeString(item));
  }
  return array;
}

std::string IterationSkillName(std::uint32_t round) {
  return "Iteration Skill v" + std::to_string(round);
}

core::json::Value CandidateToJson(const CandidateOutcome& candidate) {
  core::json::Value object = core::json::MakeObject();
  auto& fields = object.object_value;
  fields["strategy"] = core::json::MakeString(ToString(candidate.strategy));
  fields["skill_id"] = candidate.skill_id.empty() ? core::json::MakeNull()
                                                  : core::json::MakeString(candidate.skill_id);
  fields["avg_score"] = OptionalNumber(candidate.avg_score);
  fields["won"] = core::json::MakeBool(candidate.won);
  if (candidate.error.empty()) {
    fields["score_breakdown"] = eval::BreakdownToJson(candidate.score_breakdown);
  } else {
    fields["error"] = core::json::MakeString(candidate.error);
  }
  return object;
}

core::json::Value ExplorationRoundToJson(const ExplorationRound& round) {
  core::json::Value object = core::json::MakeObject();
  auto& fields = object.object_value;
  fields["round"] = core::json::MakeNumber(round.round);
  fields["plateau_level"] = core::json::MakeNumber(round.plateau_level);

  core::json::Value strategies = core::json::MakeArray();
  for (const Strategy strategy : round.strategies_tried) {
    strategies.array_value.push_back(core::json::MakeString(ToString(strategy)));
  }
  fields["strategies_tried"] = std::move(strategies);

  core::json::Value candidates = core::json::MakeArray();
  for (const auto& candidate : round.candidates) {
    candidates.array_value.push_back(CandidateToJson(candidate));
  }
  fields["candidates"] = std::move(candidates);
  fields["winner_skill_id"] = round.winner_skill_id.empty()
                                  ? core::json::MakeNull()
                                  : core::json::MakeString(round.winner_skill_id);
  return object;
}

} // namespace

BestRound SelectBestRound(const std::vector<RoundRecord>& rounds,
                          const std::string& fallback_skill_id) {
  BestRound best;
  if (rounds.empty()) {
    best.skill_id = fallback_skill_id;
    best.skill_name = IterationSkillName(1);
    return best;
  }

  const RoundRecord* winner = &rounds.front();
  for (const auto& record : rounds) {
    if (record.avg_score > winner->avg_score) {
      winner = &record;
    }
  }
  best.round = winner->round;
  best.strategy = winner->strategy;
  best.skill_id = winner->skill_id;
  best.skill_name =
      winner->skill_name.empty() ? IterationSkillName(winner->round) : winner->skill_name;
  best.avg_score = winner->avg_score;
  return best;
}

core::json::Value RoundRecordToJson(const RoundRecord& record) {
  core::json::Value object = core::json::MakeObject();
  auto& fields = object.object_value;
  fields["round"] = core::json::MakeNumber(record.round);
  fields["strategy"] = core::json::MakeString(ToString(record.strategy));
  fields["skill_id"] = core::json::MakeString(record.skill_id);
  fields["skill_name"] = core::json::MakeString(record.skill_name);
  fields["avg_score"] = core::json::MakeNumber(record.avg_score);
  fields["score_delta"] = OptionalNumber(record.score_delta);
  fields["score_breakdown"] = eval::BreakdownToJson(record.score_breakdown);
  return object;
}

core::json::Value ExplorationLogToJson(const ExplorationLog& log) {
  core::json::Value root = core::json::MakeObject();
  auto& fields = root.object_value;
  fields["project_id"] = core::json::MakeString(log.project_id);
  fields["started_at"] = core::json::MakeString(log.started_at);

  core::json::Value params = core::json::MakeObject();
  params.object_value["maxRounds"] = core::json::MakeNumber(log.params.max_rounds);
  params.object_value["beamWidth"] = core::json::MakeNumber(log.params.beam_width);
  params.object_value["plateauThreshold"] = core::json::MakeNumber(log.params.plateau_threshold);
  params.object_value["stopThreshold"] = OptionalNumber(log.params.stop_threshold);
  fields["params"] = std::move(params);

  fields["original_skill_ids"] = StringArray(log.original_skill_ids);

  core::json::Value rounds = core::json::MakeArray();
  for (const auto& round : log.rounds) {
    rounds.array_value.push_back(ExplorationRoundToJson(round));
  }
  fields["rounds"] = std::move(rounds);

  core::json::Value best = core::json::MakeObject();
  best.object_value["round"] = core::json::MakeNumber(log.best_ever.round);
  best.object_value["strategy"] = core::json::MakeString(ToString(log.best_ever.strategy));
  best.object_value["skill_id"] = core::json::MakeString(log.best_ever.skill_id);
  best.object_value["avg_score"] = core::json::MakeNumber(log.best_ever.avg_score);
  fields["best_ever"] = std::move(best);
  fields["completed_at"] = core::json::MakeString(log.completed_at);
  return root;
}

core::json::Value IterationReportToJson(const IterationReport& report) {
  core::json::Value root = core::json::MakeObject();
  auto& fields = root.object_value;
  fields["project_id"] = core::json::MakeString(report.project_id);
  fields["generated_at"] = core::json::MakeString(report.generated_at);
  fields["total_rounds"] = core::json::MakeNumber(static_cast<double>(report.rounds.size()));
  fields["stop_reason"] = core::json::MakeString(ToString(report.stop_reason));
  fields["stop_threshold"] = OptionalNumber(report.stop_threshold);
  fields["best_round"] = core::json::MakeNumber(report.best.round);
  fields["best_skill_id"] = core::json::MakeString(report.best.skill_id);
  fields["best_skill_name"] = core::json::MakeString(report.best.skill_name);
  fields["best_avg_score"] = core::json::MakeNumber(report.best.avg_score);

  core::json::Value rounds = core::json::MakeArray();
  for (const auto& record : report.rounds) {
    rounds.array_value.push_back(RoundRecordToJson(record));
  }
  fields["rounds"] = std::move(rounds);
  return root;
}

} // namespace skillbench::iteration
