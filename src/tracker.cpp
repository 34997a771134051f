#include <pitwall/tracker.hpp>
#include <string>
#include <utility>

#include <pitwall/errors.hpp>

namespace pitwall {

RaceTracker::RaceTracker(RaceConfig cfg, Compound start_compound, int grid_position)
  : cfg_(std::move(cfg)), model_(cfg_.compounds) {
  tyre_.compound = start_compound;
  tyre_.age = 0;
  tyre_.cliff_lap = model_.cliff_lap(start_compound);

  state_.current_lap = 1;
  state_.total_laps = cfg_.total_laps;
  state_.position = grid_position;
  state_.compounds_used.push_back(start_compound);
}

double RaceTracker::lap_time_for(const Choice& choice) const {
  const LapClock clock(model_, fuel_correction_per_lap(cfg_), conditions_for(state_.style));
  const int lap = state_.current_lap;
  if (choice.is_pit()) {
    return pit_loss_under(cfg_, state_.track_status) + clock.lap_time(choice.compound, 0, lap);
  }
  return clock.lap_time(tyre_.compound, tyre_.age, lap);
}

const RaceState& RaceTracker::apply(const Choice& choice, std::optional<TriggerReason> decision) {
  if (state_.finished()) {
    throw InvalidStateError("race finished after lap " + std::to_string(state_.total_laps));
  }

  RaceState next = state_;
  TyreState tyre = tyre_;
  const int lap = state_.current_lap;

  LapRecord rec;
  rec.lap = lap;
  rec.decision = decision;

  if (choice.is_pit()) {
    const int cliff = model_.cliff_lap(choice.compound); // throws InvalidCompound
    const double loss = pit_loss_under(cfg_, state_.track_status);
    next.pit_history.push_back(PitRecord{lap, tyre_.compound, choice.compound, loss, state_.track_status});
    if (!next.used(choice.compound)) next.compounds_used.push_back(choice.compound);

    rec.compound = choice.compound;
    rec.tyre_age = 0;
    rec.pitted = true;
    rec.lap_time_s = lap_time_for(choice);

    tyre.compound = choice.compound;
    tyre.age = 0;
    tyre.cliff_lap = cliff;
  } else {
    rec.compound = tyre_.compound;
    rec.tyre_age = tyre_.age;
    rec.lap_time_s = lap_time_for(choice);
    tyre.age += 1;
  }

  next.cumulative_time_s += rec.lap_time_s;
  rec.cumulative_time_s = next.cumulative_time_s;
  next.timeline.push_back(rec);
  next.current_lap = lap + 1;

  state_ = std::move(next);
  tyre_ = tyre;
  return state_;
}

void RaceTracker::set_context(const LapContext& ctx) {
  if (state_.finished()) throw InvalidStateError("race finished; context ignored");
  if (ctx.position.has_value()) state_.position = *ctx.position;
  if (ctx.gap_ahead_s.has_value()) state_.gap_ahead_s = ctx.gap_ahead_s;
  if (ctx.gap_behind_s.has_value()) state_.gap_behind_s = ctx.gap_behind_s;
  state_.track_status = ctx.track_status;
}

void RaceTracker::set_style(DrivingStyle style) {
  if (state_.finished()) throw InvalidStateError("race finished; style ignored");
  state_.style = style;
}

} // namespace pitwall
