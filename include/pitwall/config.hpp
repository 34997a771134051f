#pragma once
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/compound.hpp>
#include <pitwall/pit.hpp>
#include <pitwall/track.hpp>

namespace pitwall {

// How often decision points are offered. Never changes the option set.
enum class Cadence : int {
  Full = 0,     // every rule of the trigger policy
  Reduced = 1,  // race start, first urgent crossing, past cliff, final laps
};

const char* to_string(Cadence c);

// How far the projector looks ahead. laps == 0 means to the end of the race.
struct ProjectionHorizon {
  int laps = 0;

  static ProjectionHorizon end_of_race() { return ProjectionHorizon{0}; }
  static ProjectionHorizon fixed(int n) { return ProjectionHorizon{n}; }
  bool to_end() const { return laps <= 0; }
};

struct FuelParams {
  double load_kg = 110.0;       // start fuel
  double time_per_kg_s = 0.035; // lap time cost per kg carried
};

struct TriggerParams {
  double urgent_ratio = 0.70;    // age / cliff for URGENT_APPROACHING_CLIFF
  double strategic_ratio = 0.40; // age / cliff for STRATEGIC_MIDSTINT
  int strategic_min_age = 0;     // extra age floor for STRATEGIC_MIDSTINT
  int final_laps_window = 3;     // total - lap <= window -> FINAL_LAPS
  int tactical_interval = 10;    // lap % interval == 0 -> TACTICAL_INTERVAL
  Cadence cadence = Cadence::Full;
};

// Reference driver for post-race scoring only; never read by decisions.
struct BaselineRun {
  std::string driver;
  std::optional<double> total_time_s;
  std::vector<int> pit_laps;
};

// Immutable per-race configuration. Engines copy it on construction.
struct RaceConfig {
  int total_laps = 57;
  CompoundTable compounds = dry_compound_table();
  PitParams pit{2.5, 22.5};
  double sc_lane_factor = 0.45;
  double vsc_lane_factor = 0.75;
  FuelParams fuel;
  TriggerParams trigger;
  ProjectionHorizon horizon;
  int max_projected_stops = 1;          // further stops the projector may plan
  bool require_compound_diversity = true;
  double tie_epsilon_s = 0.05;
  std::optional<BaselineRun> baseline;
};

// Seconds gained per lap as fuel burns off.
double fuel_correction_per_lap(const RaceConfig& cfg);

// Pit loss for a stop made under the given track status.
double pit_loss_under(const RaceConfig& cfg, TrackStatus status);

// Defaults with lap count and pit lane taken from the track.
RaceConfig race_config_for_track(const Track& track, const CompoundTable& compounds = dry_compound_table());

// Throws ConfigError describing the first invalid field.
void validate(const RaceConfig& cfg);

// "key = value" lines; '#' starts a comment. Recognised keys:
//   total_laps, pit_stationary_s, pit_lane_delta_s, sc_lane_factor,
//   vsc_lane_factor, fuel_load_kg, fuel_time_per_kg_s, urgent_ratio,
//   strategic_ratio, strategic_min_age, final_laps_window, tactical_interval,
//   cadence (full|reduced), horizon_laps (0 = end of race),
//   max_projected_stops, require_compound_diversity (true|false),
//   tie_epsilon_s, compounds (dry|wet), compounds_csv, baseline_driver,
//   baseline_time_s, baseline_pit_laps.
// Unknown keys and malformed values raise ConfigError. The result is validated.
RaceConfig race_config_from_stream(std::istream& in, RaceConfig base = {});
RaceConfig load_race_config(const std::string& path, RaceConfig base = {});

// "12, 34" -> {12, 34}; nullopt on any bad entry.
std::optional<std::vector<int>> parse_lap_list(const std::string& s);

} // namespace pitwall
