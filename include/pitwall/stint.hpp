#pragma once
#include <pitwall/compound.hpp>
#include <pitwall/style.hpp>
#include <pitwall/tyre_model.hpp>

namespace pitwall {

// Full lap times: base pace + tyre delta + style offset - fuel burn-off.
// Ages follow the tracker: a pit lap runs at age 0 and does not age the set.
// Holds a non-owning pointer to the model; the model must outlive the clock.
class LapClock {
public:
  LapClock(const TyreModel& model, double fuel_correction_s, Conditions cond = {})
    : model_(&model), fuel_correction_s_(fuel_correction_s), cond_(cond) {}

  double lap_time(Compound c, int age, int lap) const;
  // Fastest lap any compound in the table could do on fresh tyres on this lap.
  double best_fresh_lap(int lap) const;

  const TyreModel& model() const { return *model_; }
  const Conditions& conditions() const { return cond_; }

private:
  const TyreModel* model_;
  double fuel_correction_s_;
  Conditions cond_;
};

} // namespace pitwall
