#pragma once
#include <optional>
#include <pitwall/config.hpp>
#include <pitwall/state.hpp>
#include <pitwall/stint.hpp>
#include <pitwall/tyre_model.hpp>

namespace pitwall {

// Single writer of RaceState and TyreState. Every mutation is all-or-nothing:
// the next state is built on a copy and committed only once complete.
class RaceTracker {
public:
  // Throws InvalidCompound if the start compound is not in the table.
  RaceTracker(RaceConfig cfg, Compound start_compound, int grid_position = 1);

  // Drives the current lap under `choice` and advances to the next lap.
  // `decision` tags the timeline record when the lap came from a decision point.
  // Throws InvalidStateError once finished and InvalidCompound for unknown pits.
  const RaceState& apply(const Choice& choice, std::optional<TriggerReason> decision = std::nullopt);

  // External per-lap context. Absent optional fields keep their last value;
  // track_status always replaces the current one.
  void set_context(const LapContext& ctx);
  void set_style(DrivingStyle style);

  const RaceState& state() const { return state_; }
  const TyreState& tyre() const { return tyre_; }
  bool finished() const { return state_.finished(); }
  const RaceConfig& config() const { return cfg_; }

  // Time the current lap would take under `choice`, pit loss included.
  double lap_time_for(const Choice& choice) const;

private:
  RaceConfig cfg_;
  TyreModel model_;
  RaceState state_;
  TyreState tyre_;
};

} // namespace pitwall
