#pragma once
#include <pitwall/compound.hpp>
#include <pitwall/style.hpp>

namespace pitwall {

// Degradation below the cliff:
//   slope(a)  = wear_start + (wear_end - wear_start) * min(a, cliff) / cliff
//   delta(a)  = slope(a) * a
// At and past the cliff (n = a - cliff + 1):
//   delta(a) += cliff_penalty * (cliff_growth^n - 1)
// Wear multiplier: 1 + 0.5 * a / cliff below the cliff, 1.5 * cliff_growth^n from it.
// All functions throw std::invalid_argument for negative ages.
double lap_time_delta(const CompoundParams& p, int age, const Conditions& cond = {});
double wear_multiplier(const CompoundParams& p, int age);

// Compound-keyed view over a table. Pure once constructed; unknown compounds
// throw InvalidCompound.
class TyreModel {
public:
  explicit TyreModel(CompoundTable table);

  int cliff_lap(Compound c) const;
  double lap_time_delta(Compound c, int age, const Conditions& cond = {}) const;
  double wear_multiplier(Compound c, int age) const;
  double fresh_lap_s(Compound c) const;

  const CompoundParams& params(Compound c) const;
  const CompoundTable& table() const { return table_; }

private:
  CompoundTable table_;
};

} // namespace pitwall
