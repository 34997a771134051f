#include <pitwall/state.hpp>
#include <algorithm>
#include <string>

namespace pitwall {

const char* to_string(TriggerReason r) {
  switch (r) {
    case TriggerReason::RaceStart:              return "RACE_START";
    case TriggerReason::CriticalPastCliff:      return "CRITICAL_PAST_CLIFF";
    case TriggerReason::UrgentApproachingCliff: return "URGENT_APPROACHING_CLIFF";
    case TriggerReason::StrategicMidstint:      return "STRATEGIC_MIDSTINT";
    case TriggerReason::FinalLaps:              return "FINAL_LAPS";
    case TriggerReason::TacticalInterval:       return "TACTICAL_INTERVAL";
  }
  return "UNKNOWN";
}

bool RaceState::used(Compound c) const {
  return std::find(compounds_used.begin(), compounds_used.end(), c) != compounds_used.end();
}

bool operator==(const Choice& a, const Choice& b) {
  if (a.kind != b.kind) return false;
  return a.kind == ChoiceKind::StayOut || a.compound == b.compound;
}

std::string describe(const Choice& c) {
  if (!c.is_pit()) return "STAY_OUT";
  return std::string("PIT_TO(") + to_string(c.compound) + ")";
}

} // namespace pitwall
