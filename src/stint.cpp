#include <pitwall/stint.hpp>
#include <algorithm>
#include <limits>

namespace pitwall {

double LapClock::lap_time(Compound c, int age, int lap) const {
  const double fuel = fuel_correction_s_ * static_cast<double>(std::max(0, lap - 1));
  return model_->fresh_lap_s(c) + model_->lap_time_delta(c, age, cond_) + cond_.pace_offset_s - fuel;
}

double LapClock::best_fresh_lap(int lap) const {
  double best = std::numeric_limits<double>::infinity();
  for (const auto& p : model_->table()) {
    best = std::min(best, lap_time(p.compound, 0, lap));
  }
  return best;
}

} // namespace pitwall
