#include <pitwall/scoring.hpp>
#include <cstdlib>

namespace pitwall {

BaselineComparison compare_with_baseline(const std::vector<PitRecord>& pits,
                                         double final_time_s,
                                         const BaselineRun& baseline) {
  BaselineComparison out;
  out.driver = baseline.driver;
  out.our_stops = static_cast<int>(pits.size());
  out.baseline_stops = static_cast<int>(baseline.pit_laps.size());
  if (baseline.total_time_s.has_value()) {
    out.time_delta_s = final_time_s - *baseline.total_time_s;
  }

  const auto& laps = baseline.pit_laps;
  std::vector<bool> ours_taken(pits.size(), false);
  std::vector<bool> base_taken(laps.size(), false);
  int error_sum = 0;
  for (;;) {
    int best_p = -1, best_b = -1, best_d = 0;
    for (std::size_t i = 0; i < pits.size(); ++i) {
      if (ours_taken[i]) continue;
      for (std::size_t j = 0; j < laps.size(); ++j) {
        if (base_taken[j]) continue;
        const int d = std::abs(laps[j] - pits[i].lap);
        const bool better = best_p < 0 || d < best_d ||
          (d == best_d && laps[j] < laps[static_cast<std::size_t>(best_b)]);
        if (better) {
          best_p = static_cast<int>(i);
          best_b = static_cast<int>(j);
          best_d = d;
        }
      }
    }
    if (best_p < 0) break;
    ours_taken[static_cast<std::size_t>(best_p)] = true;
    base_taken[static_cast<std::size_t>(best_b)] = true;
    error_sum += best_d;
    ++out.matched_stops;
  }

  if (out.matched_stops > 0) {
    out.mean_pit_lap_error = static_cast<double>(error_sum) / static_cast<double>(out.matched_stops);
  }
  return out;
}

} // namespace pitwall
