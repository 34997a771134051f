#pragma once
#include <array>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pitwall {

enum class Compound : int {
  Soft = 0,
  Medium = 1,
  Hard = 2,
  Intermediate = 3,
  Wet = 4,
};

inline constexpr std::array<Compound, 5> kAllCompounds{
  Compound::Soft, Compound::Medium, Compound::Hard, Compound::Intermediate, Compound::Wet,
};

const char* to_string(Compound c);               // "SOFT", "MEDIUM", ...
std::optional<Compound> compound_from_string(const std::string& s); // case-insensitive, accepts S/M/H/I/W
Compound parse_compound(const std::string& s);   // throws InvalidCompound

// Per-compound degradation constants. Ages are laps since fitted (0 = fresh).
struct CompoundParams {
  Compound compound = Compound::Medium;
  double base_lap_s = 0.0;       // fresh-tyre lap, no fuel effect
  double wear_start_s = 0.0;     // per-lap degradation slope at age 0
  double wear_end_s = 0.0;       // per-lap degradation slope at the cliff
  int cliff_lap = 1;             // age at which the cliff regime starts
  double cliff_penalty_s = 6.0;  // scale of the post-cliff exponential
  double cliff_growth = 1.08;    // per-lap growth of the post-cliff penalty (> 1)
};

// One entry per available compound, in enum order.
using CompoundTable = std::vector<CompoundParams>;

// Built-in tables. Immutable.
const CompoundTable& dry_compound_table();  // SOFT / MEDIUM / HARD
const CompoundTable& wet_compound_table();  // INTERMEDIATE / WET

std::optional<CompoundParams> compound_params_in(const CompoundTable& table, Compound c);
// Same lookup, but an absent compound throws InvalidCompound.
const CompoundParams& require_compound(const CompoundTable& table, Compound c);
bool table_has(const CompoundTable& table, Compound c);

// Columns: compound,base_lap_s,wear_start_s,wear_end_s,cliff_lap,cliff_penalty_s,cliff_growth
// The last two columns are optional. Header row, '#' comments and blank lines
// are accepted; invalid rows and duplicate compounds are skipped.
CompoundTable compound_table_from_csv_stream(std::istream& in);

// Returns nullopt if the file cannot be opened.
std::optional<CompoundTable> load_compound_table_csv(const std::string& path);

} // namespace pitwall
