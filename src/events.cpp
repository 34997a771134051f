#include <pitwall/events.hpp>
#include <algorithm>
#include <random>

namespace pitwall {

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

std::vector<TrackStatus> simulate_track_status(std::size_t laps,
                                               double p_sc,
                                               double p_vsc,
                                               std::mt19937& rng,
                                               int period_laps) {
  double sc  = clamp01(p_sc);
  double vsc = clamp01(p_vsc);
  const double total = sc + vsc;
  if (total > 1.0) {
    // keep the SC:VSC ratio
    sc  /= total;
    vsc /= total;
  }
  const int period = std::max(1, period_laps);

  std::uniform_real_distribution<double> U(0.0, 1.0);
  std::vector<TrackStatus> out;
  out.reserve(laps);
  TrackStatus current = TrackStatus::Green;
  int left = 0;
  for (std::size_t i = 0; i < laps; ++i) {
    if (left == 0) {
      const double u = U(rng);
      if (u < sc) current = TrackStatus::SafetyCar;
      else if (u < sc + vsc) current = TrackStatus::VirtualSafetyCar;
      else current = TrackStatus::Green;
      left = current == TrackStatus::Green ? 1 : period;
    }
    out.push_back(current);
    --left;
  }
  return out;
}

std::size_t neutralised_laps(const std::vector<TrackStatus>& statuses) {
  return static_cast<std::size_t>(std::count_if(statuses.begin(), statuses.end(),
      [](TrackStatus s) { return s != TrackStatus::Green; }));
}

} // namespace pitwall
