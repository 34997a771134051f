#include <pitwall/tyre_model.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace pitwall {

static void check_age(int age) {
  if (age < 0) throw std::invalid_argument("tyre age must be non-negative, got " + std::to_string(age));
}

static double cliff_laps_over(const CompoundParams& p, int age) {
  return static_cast<double>(age - p.cliff_lap + 1);
}

double lap_time_delta(const CompoundParams& p, int age, const Conditions& cond) {
  check_age(age);
  const double cliff = static_cast<double>(p.cliff_lap);
  const double a = static_cast<double>(age);
  const double progress = std::min(a, cliff) / cliff;
  const double slope = p.wear_start_s + (p.wear_end_s - p.wear_start_s) * progress;
  double delta = slope * a;
  if (age >= p.cliff_lap) {
    delta += p.cliff_penalty_s * (std::pow(p.cliff_growth, cliff_laps_over(p, age)) - 1.0);
  }
  return delta * std::max(0.0, cond.wear_scale);
}

double wear_multiplier(const CompoundParams& p, int age) {
  check_age(age);
  if (age < p.cliff_lap) {
    return 1.0 + 0.5 * static_cast<double>(age) / static_cast<double>(p.cliff_lap);
  }
  return 1.5 * std::pow(p.cliff_growth, cliff_laps_over(p, age));
}

TyreModel::TyreModel(CompoundTable table) : table_(std::move(table)) {}

const CompoundParams& TyreModel::params(Compound c) const {
  return require_compound(table_, c);
}

int TyreModel::cliff_lap(Compound c) const {
  return params(c).cliff_lap;
}

double TyreModel::lap_time_delta(Compound c, int age, const Conditions& cond) const {
  return pitwall::lap_time_delta(params(c), age, cond);
}

double TyreModel::wear_multiplier(Compound c, int age) const {
  return pitwall::wear_multiplier(params(c), age);
}

double TyreModel::fresh_lap_s(Compound c) const {
  return params(c).base_lap_s;
}

} // namespace pitwall
