#pragma once
#include <cstddef>
#include <random>
#include <vector>
#include <pitwall/pit.hpp>

namespace pitwall {

// One status per lap: SafetyCar, VirtualSafetyCar, or Green.
// Probabilities are clamped to [0,1]; a total above 1 is renormalised.
// A neutralisation lasts `period_laps` laps once it starts.
// Deterministic with caller-provided rng.
std::vector<TrackStatus> simulate_track_status(std::size_t laps,
                                               double p_sc,
                                               double p_vsc,
                                               std::mt19937& rng,
                                               int period_laps = 3);

// Number of laps under SC or VSC.
std::size_t neutralised_laps(const std::vector<TrackStatus>& statuses);

} // namespace pitwall
