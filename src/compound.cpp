#include <pitwall/compound.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>

#include <pitwall/csv.hpp>
#include <pitwall/errors.hpp>

namespace pitwall {

const char* to_string(Compound c) {
  switch (c) {
    case Compound::Soft:         return "SOFT";
    case Compound::Medium:       return "MEDIUM";
    case Compound::Hard:         return "HARD";
    case Compound::Intermediate: return "INTERMEDIATE";
    case Compound::Wet:          return "WET";
  }
  return "UNKNOWN";
}

static std::string upper(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return s;
}

std::optional<Compound> compound_from_string(const std::string& s) {
  const auto u = upper(csv::trim(s));
  if (u == "SOFT" || u == "S")   return Compound::Soft;
  if (u == "MEDIUM" || u == "M") return Compound::Medium;
  if (u == "HARD" || u == "H")   return Compound::Hard;
  if (u == "INTERMEDIATE" || u == "INTER" || u == "I") return Compound::Intermediate;
  if (u == "WET" || u == "W")    return Compound::Wet;
  return std::nullopt;
}

Compound parse_compound(const std::string& s) {
  if (auto c = compound_from_string(s); c.has_value()) return *c;
  throw InvalidCompound("unknown compound '" + s + "'");
}

static CompoundTable make_dry_table() {
  return {
    {Compound::Soft,   97.0, 0.04, 0.20, 25, 6.0, 1.08},
    {Compound::Medium, 97.8, 0.04, 0.12, 40, 6.0, 1.08},
    {Compound::Hard,   98.5, 0.03, 0.08, 60, 6.0, 1.08},
  };
}

static CompoundTable make_wet_table() {
  return {
    {Compound::Intermediate, 104.0, 0.05, 0.15, 30, 6.0, 1.10},
    {Compound::Wet,          108.0, 0.03, 0.10, 40, 6.0, 1.10},
  };
}

const CompoundTable& dry_compound_table() {
  static const CompoundTable t = make_dry_table();
  return t;
}

const CompoundTable& wet_compound_table() {
  static const CompoundTable t = make_wet_table();
  return t;
}

std::optional<CompoundParams> compound_params_in(const CompoundTable& table, Compound c) {
  auto it = std::find_if(table.begin(), table.end(),
                         [&](const CompoundParams& p){ return p.compound == c; });
  if (it == table.end()) return std::nullopt;
  return *it;
}

const CompoundParams& require_compound(const CompoundTable& table, Compound c) {
  auto it = std::find_if(table.begin(), table.end(),
                         [&](const CompoundParams& p){ return p.compound == c; });
  if (it == table.end()) {
    throw InvalidCompound(std::string("compound ") + to_string(c) + " is not available");
  }
  return *it;
}

bool table_has(const CompoundTable& table, Compound c) {
  return compound_params_in(table, c).has_value();
}

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && (cols[0] == "compound" || cols[0] == "Compound");
}

static std::optional<CompoundParams> parse_compound_row(const std::vector<std::string>& cols) {
  if (cols.size() < 5) return std::nullopt;
  const auto c = compound_from_string(cols[0]);
  if (!c.has_value()) return std::nullopt;

  bool ok1, ok2, ok3, ok4;
  CompoundParams p;
  p.compound = *c;
  p.base_lap_s = csv::to_double(cols[1], ok1);
  p.wear_start_s = csv::to_double(cols[2], ok2);
  p.wear_end_s = csv::to_double(cols[3], ok3);
  p.cliff_lap = csv::to_int(cols[4], ok4);
  if (!(ok1 && ok2 && ok3 && ok4)) return std::nullopt;

  if (cols.size() >= 7) {
    bool ok5, ok6;
    p.cliff_penalty_s = csv::to_double(cols[5], ok5);
    p.cliff_growth = csv::to_double(cols[6], ok6);
    if (!(ok5 && ok6)) return std::nullopt;
  }

  // Reject rows the model cannot keep monotonic with.
  if (p.base_lap_s <= 0.0 || p.cliff_lap <= 0) return std::nullopt;
  if (p.wear_start_s < 0.0 || p.wear_end_s < p.wear_start_s) return std::nullopt;
  if (p.cliff_penalty_s <= 0.0 || p.cliff_growth <= 1.0) return std::nullopt;
  return p;
}

CompoundTable compound_table_from_csv_stream(std::istream& in) {
  CompoundTable out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    auto cols = csv::split_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_compound_row(cols); row.has_value()) {
      if (!table_has(out, row->compound)) out.push_back(*row);
    }
  }

  std::sort(out.begin(), out.end(), [](const CompoundParams& a, const CompoundParams& b) {
    return static_cast<int>(a.compound) < static_cast<int>(b.compound);
  });
  return out;
}

std::optional<CompoundTable> load_compound_table_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return compound_table_from_csv_stream(f);
}

} // namespace pitwall
