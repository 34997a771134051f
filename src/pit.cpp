#include <pitwall/pit.hpp>
#include <algorithm>
#include <cctype>

namespace pitwall {

const char* to_string(TrackStatus s) {
  switch (s) {
    case TrackStatus::Green:            return "GREEN";
    case TrackStatus::SafetyCar:        return "SC";
    case TrackStatus::VirtualSafetyCar: return "VSC";
  }
  return "GREEN";
}

std::optional<TrackStatus> track_status_from_string(const std::string& s) {
  std::string u = s;
  for (auto& c : u) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (u == "GREEN" || u.empty()) return TrackStatus::Green;
  if (u == "SC")  return TrackStatus::SafetyCar;
  if (u == "VSC") return TrackStatus::VirtualSafetyCar;
  return std::nullopt;
}

double pit_stop_loss(const PitParams& p) {
  const double stat = std::max(0.0, p.stationary);
  const double lane = std::max(0.0, p.lane);
  return stat + lane;
}

static inline double clamp01(double x) {
  return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x);
}

double pit_stop_loss_under(const PitParams& p, double lane_factor) {
  const double stat = std::max(0.0, p.stationary);
  const double lane = std::max(0.0, p.lane);
  return stat + lane * clamp01(lane_factor);
}

double pit_stop_loss_for(const PitParams& p, TrackStatus status,
                         double sc_lane_factor, double vsc_lane_factor) {
  switch (status) {
    case TrackStatus::SafetyCar:        return pit_stop_loss_under(p, sc_lane_factor);
    case TrackStatus::VirtualSafetyCar: return pit_stop_loss_under(p, vsc_lane_factor);
    case TrackStatus::Green:            break;
  }
  return pit_stop_loss(p);
}

} // namespace pitwall
