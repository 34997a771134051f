#include <pitwall/trigger.hpp>
#include <array>
#include <string>

#include <pitwall/errors.hpp>

namespace pitwall {

namespace {

struct TriggerRule {
  TriggerReason reason;
  int priority;
  bool reduced; // active under Cadence::Reduced
};

constexpr std::array<TriggerRule, 6> kRules{{
  {TriggerReason::RaceStart,              0, true},
  {TriggerReason::CriticalPastCliff,      1, true},
  {TriggerReason::UrgentApproachingCliff, 2, true},
  {TriggerReason::StrategicMidstint,      3, false},
  {TriggerReason::FinalLaps,              4, true},
  {TriggerReason::TacticalInterval,       5, false},
}};

constexpr bool priorities_unique() {
  for (std::size_t i = 0; i < kRules.size(); ++i) {
    for (std::size_t j = i + 1; j < kRules.size(); ++j) {
      if (kRules[i].priority == kRules[j].priority) return false;
    }
  }
  return true;
}

static_assert(priorities_unique(), "trigger priorities must be unique");

double ratio(int age, int cliff) {
  return static_cast<double>(age) / static_cast<double>(cliff);
}

bool holds(TriggerReason r, const TriggerParams& p, const RaceState& s, const TyreState& t) {
  const int cliff = t.cliff_lap > 0 ? t.cliff_lap : 1;
  const double life = ratio(t.age, cliff);
  switch (r) {
    case TriggerReason::RaceStart:
      return s.current_lap == 1;
    case TriggerReason::CriticalPastCliff:
      return t.age >= cliff;
    case TriggerReason::UrgentApproachingCliff:
      if (p.cadence == Cadence::Reduced) {
        // First crossing only: last lap's age was still under the ratio.
        return life >= p.urgent_ratio && (t.age == 0 || ratio(t.age - 1, cliff) < p.urgent_ratio);
      }
      return life >= p.urgent_ratio;
    case TriggerReason::StrategicMidstint:
      return life >= p.strategic_ratio && t.age >= p.strategic_min_age;
    case TriggerReason::FinalLaps:
      return s.total_laps - s.current_lap <= p.final_laps_window;
    case TriggerReason::TacticalInterval:
      return p.tactical_interval > 0 && s.current_lap % p.tactical_interval == 0;
  }
  return false;
}

} // namespace

int trigger_priority(TriggerReason r) {
  for (const auto& rule : kRules) {
    if (rule.reason == r) return rule.priority;
  }
  return static_cast<int>(kRules.size());
}

std::optional<TriggerReason> evaluate_trigger(const TriggerParams& params,
                                              const RaceState& state,
                                              const TyreState& tyre) {
  if (state.finished()) {
    throw InvalidStateError("trigger evaluated after the final lap (lap " +
                            std::to_string(state.current_lap) + ")");
  }

  const TriggerRule* winner = nullptr;
  int winners = 0;
  for (const auto& rule : kRules) {
    if (params.cadence == Cadence::Reduced && !rule.reduced) continue;
    if (!holds(rule.reason, params, state, tyre)) continue;
    if (winner == nullptr || rule.priority < winner->priority) {
      winner = &rule;
      winners = 1;
    } else if (rule.priority == winner->priority) {
      ++winners;
    }
  }

  if (winner == nullptr) return std::nullopt;
  if (winners != 1) {
    throw AmbiguousTrigger(std::string("multiple top-priority trigger reasons at ") +
                           to_string(winner->reason));
  }
  return winner->reason;
}

} // namespace pitwall
