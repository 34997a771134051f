#include <pitwall/style.hpp>
#include <cctype>

namespace pitwall {

const char* to_string(DrivingStyle s) {
  switch (s) {
    case DrivingStyle::Aggressive:   return "AGGRESSIVE";
    case DrivingStyle::Balanced:     return "BALANCED";
    case DrivingStyle::Conservative: return "CONSERVATIVE";
    case DrivingStyle::QualiMode:    return "QUALI_MODE";
    case DrivingStyle::TyreSave:     return "TYRE_SAVE";
  }
  return "BALANCED";
}

std::optional<DrivingStyle> driving_style_from_string(const std::string& s) {
  std::string u = s;
  for (auto& c : u) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  if (u == "AGGRESSIVE")   return DrivingStyle::Aggressive;
  if (u == "BALANCED")     return DrivingStyle::Balanced;
  if (u == "CONSERVATIVE") return DrivingStyle::Conservative;
  if (u == "QUALI_MODE" || u == "QUALI") return DrivingStyle::QualiMode;
  if (u == "TYRE_SAVE" || u == "TIRE_SAVE") return DrivingStyle::TyreSave;
  return std::nullopt;
}

StyleProfile style_profile(DrivingStyle s) {
  switch (s) {
    case DrivingStyle::Aggressive:   return {-0.3, 1.4};
    case DrivingStyle::Balanced:     return { 0.0, 1.0};
    case DrivingStyle::Conservative: return { 0.4, 0.7};
    case DrivingStyle::QualiMode:    return {-0.8, 3.0};
    case DrivingStyle::TyreSave:     return { 0.8, 0.5};
  }
  return {};
}

Conditions conditions_for(DrivingStyle s) {
  const auto p = style_profile(s);
  return Conditions{p.wear_scale, p.pace_offset_s};
}

} // namespace pitwall
