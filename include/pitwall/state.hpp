#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/pit.hpp>
#include <pitwall/style.hpp>

namespace pitwall {

// Why a decision point was raised on a lap. Declaration order is priority order.
enum class TriggerReason : int {
  RaceStart = 0,
  CriticalPastCliff = 1,
  UrgentApproachingCliff = 2,
  StrategicMidstint = 3,
  FinalLaps = 4,
  TacticalInterval = 5,
};

const char* to_string(TriggerReason r);

struct TyreState {
  Compound compound = Compound::Medium;
  int age = 0;        // laps since fitted
  int cliff_lap = 1;  // copied from the compound table when fitted

  double life_ratio() const {
    return cliff_lap > 0 ? static_cast<double>(age) / static_cast<double>(cliff_lap) : 0.0;
  }
  bool past_cliff() const { return age >= cliff_lap; }
};

struct PitRecord {
  int lap = 0;
  Compound from = Compound::Medium;
  Compound to = Compound::Medium;
  double time_loss_s = 0.0;
  TrackStatus status = TrackStatus::Green;
};

// One completed lap.
struct LapRecord {
  int lap = 0;
  Compound compound = Compound::Medium; // compound the lap was driven on
  int tyre_age = 0;                     // age at the start of the lap
  double lap_time_s = 0.0;              // includes pit loss on a pit lap
  double cumulative_time_s = 0.0;
  bool pitted = false;
  std::optional<TriggerReason> decision; // set when the lap was resolved by a decision
};

// Per-lap information from outside the engine. Every field may be absent or stale.
struct LapContext {
  std::optional<int> position;
  std::optional<double> gap_ahead_s;
  std::optional<double> gap_behind_s;
  TrackStatus track_status = TrackStatus::Green;
};

struct RaceState {
  int current_lap = 1;             // lap about to be driven (1-based)
  int total_laps = 0;
  double cumulative_time_s = 0.0;
  std::vector<PitRecord> pit_history;
  int position = 1;
  std::optional<double> gap_ahead_s;   // informational only
  std::optional<double> gap_behind_s;  // informational only
  TrackStatus track_status = TrackStatus::Green;
  DrivingStyle style = DrivingStyle::Balanced;
  std::vector<Compound> compounds_used; // distinct, in order first fitted
  std::vector<LapRecord> timeline;

  bool finished() const { return current_lap > total_laps; }
  int laps_remaining() const { return finished() ? 0 : total_laps - current_lap + 1; }
  bool used(Compound c) const;
  int distinct_compounds() const { return static_cast<int>(compounds_used.size()); }
};

enum class ChoiceKind : int { StayOut = 0, PitTo = 1 };

// What the caller can do on a decision lap. compound is meaningful for PitTo only.
struct Choice {
  ChoiceKind kind = ChoiceKind::StayOut;
  Compound compound = Compound::Medium;

  static Choice stay_out() { return Choice{ChoiceKind::StayOut, Compound::Medium}; }
  static Choice pit_to(Compound c) { return Choice{ChoiceKind::PitTo, c}; }

  bool is_pit() const { return kind == ChoiceKind::PitTo; }
};

bool operator==(const Choice& a, const Choice& b);
inline bool operator!=(const Choice& a, const Choice& b) { return !(a == b); }

std::string describe(const Choice& c); // "STAY_OUT" or "PIT_TO(HARD)"

} // namespace pitwall
