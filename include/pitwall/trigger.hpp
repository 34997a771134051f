#pragma once
#include <optional>
#include <pitwall/config.hpp>
#include <pitwall/state.hpp>

namespace pitwall {

// Stateless per-lap predicate. Rules are checked in priority order:
//   RACE_START, CRITICAL_PAST_CLIFF, URGENT_APPROACHING_CLIFF,
//   STRATEGIC_MIDSTINT, FINAL_LAPS, TACTICAL_INTERVAL
// and the first one that holds is reported. nullopt means no decision this lap.
// Reduced cadence keeps RACE_START, the first lap at or over the urgent ratio,
// CRITICAL_PAST_CLIFF and FINAL_LAPS.
// Throws InvalidStateError on a finished race.
std::optional<TriggerReason> evaluate_trigger(const TriggerParams& params,
                                              const RaceState& state,
                                              const TyreState& tyre);

// Priority rank of a reason (0 = highest).
int trigger_priority(TriggerReason r);

} // namespace pitwall
