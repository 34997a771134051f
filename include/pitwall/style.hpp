#pragma once
#include <optional>
#include <string>

namespace pitwall {

enum class DrivingStyle : int {
  Aggressive = 0,
  Balanced = 1,
  Conservative = 2,
  QualiMode = 3,
  TyreSave = 4,
};

struct StyleProfile {
  double pace_offset_s = 0.0; // added to every lap (negative = faster)
  double wear_scale = 1.0;    // multiplies tyre degradation
};

// Environmental inputs to the tyre model and lap-time computation.
struct Conditions {
  double wear_scale = 1.0;
  double pace_offset_s = 0.0;
};

const char* to_string(DrivingStyle s);
std::optional<DrivingStyle> driving_style_from_string(const std::string& s);

StyleProfile style_profile(DrivingStyle s);
Conditions conditions_for(DrivingStyle s);

} // namespace pitwall
