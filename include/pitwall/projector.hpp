#pragma once
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/state.hpp>
#include <pitwall/tyre_model.hpp>

namespace pitwall {

struct PlannedStop {
  int lap = 0;
  Compound compound = Compound::Medium;
};

// What-if result for one choice over the projection horizon.
// Signed seconds: negative is faster than the baseline, positive slower.
struct Projection {
  int first_lap = 0;               // lap the choice applies to
  int last_lap = 0;                // last lap inside the horizon
  double race_time_s = 0.0;        // projected time for [first_lap, last_lap]
  double baseline_s = 0.0;         // same laps at the best fresh-tyre pace, no stops
  double race_time_impact_s = 0.0; // race_time_s - baseline_s
  double lap_time_impact_s = 0.0;  // next lap under the choice vs best fresh lap
  double wear_multiplier = 1.0;    // tyre wear on the next lap
  bool compliant = true;           // a two-compound race is still reachable
  std::vector<PlannedStop> stops;  // stops of the winning plan, including a pit now
};

// Simulates the remaining laps under a hypothetical choice. After the choice it
// plans up to max_projected_stops further stops optimally inside the horizon.
// Holds its own copy of the configuration; project() is const and pure.
class Projector {
public:
  explicit Projector(RaceConfig cfg);

  // Throws InvalidStateError on a finished race and InvalidCompound for a pit
  // to a compound outside the table.
  Projection project(const RaceState& state, const TyreState& tyre, const Choice& choice) const;

  // Last lap covered when projecting from `lap`.
  int horizon_end(int lap) const;

  const RaceConfig& config() const { return cfg_; }
  const TyreModel& model() const { return model_; }

private:
  RaceConfig cfg_;
  TyreModel model_;
};

// One-shot convenience over Projector.
Projection project_impact(const RaceConfig& cfg, const RaceState& state,
                          const TyreState& tyre, const Choice& choice);

} // namespace pitwall
