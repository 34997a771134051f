#pragma once
#include <optional>
#include <string>

namespace pitwall {

struct PitParams {
  double stationary = 0.0; // seconds at box
  double lane = 0.0;       // pit-lane delta vs racing line
};

enum class TrackStatus : int {
  Green = 0,
  SafetyCar = 1,
  VirtualSafetyCar = 2,
};

const char* to_string(TrackStatus s); // "GREEN", "SC", "VSC"
// Case-insensitive; "" maps to GREEN. Unknown strings yield nullopt.
std::optional<TrackStatus> track_status_from_string(const std::string& s);

double pit_stop_loss(const PitParams& p);

// Safety Car / Virtual Safety Car adjustments.
// Factor applies ONLY to lane component; stationary is unchanged.
// factor is clamped to [0, 1].
double pit_stop_loss_under(const PitParams& p, double lane_factor);

// Picks the lane factor matching the status (GREEN -> 1.0).
double pit_stop_loss_for(const PitParams& p, TrackStatus status,
                         double sc_lane_factor, double vsc_lane_factor);

} // namespace pitwall
