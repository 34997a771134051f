#pragma once
#include <optional>
#include <string>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/state.hpp>

namespace pitwall {

struct BaselineComparison {
  std::string driver;
  std::optional<double> time_delta_s;    // ours - baseline; negative = we were faster
  int our_stops = 0;
  int baseline_stops = 0;
  int matched_stops = 0;
  std::optional<double> mean_pit_lap_error; // over matched stops, in laps
};

// Pairs stops closest-first: the (ours, baseline) pair with the smallest lap
// distance is matched, then the next among the unmatched, and so on. Equal
// distances go to the earlier baseline lap.
BaselineComparison compare_with_baseline(const std::vector<PitRecord>& pits,
                                         double final_time_s,
                                         const BaselineRun& baseline);

} // namespace pitwall
