#include <pitwall/config.hpp>
#include <cctype>
#include <fstream>
#include <set>
#include <sstream>
#include <utility>

#include <pitwall/csv.hpp>
#include <pitwall/errors.hpp>

namespace pitwall {

const char* to_string(Cadence c) {
  switch (c) {
    case Cadence::Full:    return "full";
    case Cadence::Reduced: return "reduced";
  }
  return "full";
}

double fuel_correction_per_lap(const RaceConfig& cfg) {
  if (cfg.total_laps <= 0) return 0.0;
  return cfg.fuel.load_kg / static_cast<double>(cfg.total_laps) * cfg.fuel.time_per_kg_s;
}

double pit_loss_under(const RaceConfig& cfg, TrackStatus status) {
  return pit_stop_loss_for(cfg.pit, status, cfg.sc_lane_factor, cfg.vsc_lane_factor);
}

RaceConfig race_config_for_track(const Track& track, const CompoundTable& compounds) {
  RaceConfig cfg;
  cfg.total_laps = track.total_laps;
  cfg.compounds = compounds;
  cfg.pit = track_pit_params(track);
  cfg.sc_lane_factor = track.sc_lane_factor;
  cfg.vsc_lane_factor = track.vsc_lane_factor;
  return cfg;
}

static void require(bool cond, const std::string& msg) {
  if (!cond) throw ConfigError(msg);
}

void validate(const RaceConfig& cfg) {
  require(cfg.total_laps > 0, "total_laps must be positive");
  require(!cfg.compounds.empty(), "compound table is empty");
  if (cfg.require_compound_diversity) {
    require(cfg.compounds.size() >= 2, "compound diversity needs at least two compounds");
  }

  std::set<int> seen;
  for (const auto& p : cfg.compounds) {
    const std::string name = to_string(p.compound);
    require(seen.insert(static_cast<int>(p.compound)).second, "duplicate compound " + name);
    require(p.base_lap_s > 0.0, name + ": base_lap_s must be positive");
    require(p.cliff_lap > 0, name + ": cliff_lap must be positive");
    require(p.wear_start_s >= 0.0 && p.wear_end_s >= p.wear_start_s,
            name + ": wear slopes must satisfy 0 <= wear_start_s <= wear_end_s");
    require(p.cliff_penalty_s > 0.0, name + ": cliff_penalty_s must be positive");
    require(p.cliff_growth > 1.0, name + ": cliff_growth must exceed 1");
  }

  require(cfg.pit.stationary >= 0.0 && cfg.pit.lane >= 0.0, "pit times must be non-negative");
  require(cfg.sc_lane_factor >= 0.0 && cfg.sc_lane_factor <= 1.0, "sc_lane_factor must be in [0,1]");
  require(cfg.vsc_lane_factor >= 0.0 && cfg.vsc_lane_factor <= 1.0, "vsc_lane_factor must be in [0,1]");
  require(cfg.fuel.load_kg >= 0.0 && cfg.fuel.time_per_kg_s >= 0.0, "fuel parameters must be non-negative");

  const auto& t = cfg.trigger;
  require(t.strategic_ratio > 0.0 && t.strategic_ratio <= t.urgent_ratio && t.urgent_ratio <= 1.0,
          "trigger ratios must satisfy 0 < strategic_ratio <= urgent_ratio <= 1");
  require(t.strategic_min_age >= 0, "strategic_min_age must be non-negative");
  require(t.final_laps_window >= 0, "final_laps_window must be non-negative");
  require(t.tactical_interval > 0, "tactical_interval must be positive");

  require(cfg.horizon.laps >= 0, "horizon_laps must be non-negative");
  require(cfg.max_projected_stops >= 0 && cfg.max_projected_stops <= 3,
          "max_projected_stops must be in [0,3]");
  require(cfg.tie_epsilon_s >= 0.0, "tie_epsilon_s must be non-negative");

  if (cfg.baseline.has_value()) {
    for (int lap : cfg.baseline->pit_laps) {
      require(lap >= 1 && lap <= cfg.total_laps, "baseline pit lap out of range");
    }
  }
}

std::optional<std::vector<int>> parse_lap_list(const std::string& s) {
  std::vector<int> out;
  if (csv::trim(s).empty()) return out;
  for (const auto& field : csv::split_line(s)) {
    bool ok = false;
    const int v = csv::to_int(field, ok);
    if (!ok) return std::nullopt;
    out.push_back(v);
  }
  return out;
}

namespace {

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

double as_double(const std::string& key, const std::string& v) {
  bool ok = false;
  const double d = csv::to_double(v, ok);
  if (!ok) throw ConfigError(key + ": expected a number, got '" + v + "'");
  return d;
}

int as_int(const std::string& key, const std::string& v) {
  bool ok = false;
  const int i = csv::to_int(v, ok);
  if (!ok) throw ConfigError(key + ": expected an integer, got '" + v + "'");
  return i;
}

bool as_bool(const std::string& key, const std::string& v) {
  const auto l = lower(v);
  if (l == "true" || l == "yes" || l == "1" || l == "on") return true;
  if (l == "false" || l == "no" || l == "0" || l == "off") return false;
  throw ConfigError(key + ": expected true/false, got '" + v + "'");
}

BaselineRun& baseline_of(RaceConfig& cfg) {
  if (!cfg.baseline.has_value()) cfg.baseline = BaselineRun{};
  return *cfg.baseline;
}

void apply_key(RaceConfig& cfg, const std::string& key, const std::string& v) {
  if (key == "total_laps")              cfg.total_laps = as_int(key, v);
  else if (key == "pit_stationary_s")   cfg.pit.stationary = as_double(key, v);
  else if (key == "pit_lane_delta_s")   cfg.pit.lane = as_double(key, v);
  else if (key == "sc_lane_factor")     cfg.sc_lane_factor = as_double(key, v);
  else if (key == "vsc_lane_factor")    cfg.vsc_lane_factor = as_double(key, v);
  else if (key == "fuel_load_kg")       cfg.fuel.load_kg = as_double(key, v);
  else if (key == "fuel_time_per_kg_s") cfg.fuel.time_per_kg_s = as_double(key, v);
  else if (key == "urgent_ratio")       cfg.trigger.urgent_ratio = as_double(key, v);
  else if (key == "strategic_ratio")    cfg.trigger.strategic_ratio = as_double(key, v);
  else if (key == "strategic_min_age")  cfg.trigger.strategic_min_age = as_int(key, v);
  else if (key == "final_laps_window")  cfg.trigger.final_laps_window = as_int(key, v);
  else if (key == "tactical_interval")  cfg.trigger.tactical_interval = as_int(key, v);
  else if (key == "cadence") {
    const auto l = lower(v);
    if (l == "full") cfg.trigger.cadence = Cadence::Full;
    else if (l == "reduced") cfg.trigger.cadence = Cadence::Reduced;
    else throw ConfigError("cadence: expected full or reduced, got '" + v + "'");
  }
  else if (key == "horizon_laps")       cfg.horizon.laps = as_int(key, v);
  else if (key == "max_projected_stops") cfg.max_projected_stops = as_int(key, v);
  else if (key == "require_compound_diversity") cfg.require_compound_diversity = as_bool(key, v);
  else if (key == "tie_epsilon_s")      cfg.tie_epsilon_s = as_double(key, v);
  else if (key == "compounds") {
    const auto l = lower(v);
    if (l == "dry") cfg.compounds = dry_compound_table();
    else if (l == "wet") cfg.compounds = wet_compound_table();
    else throw ConfigError("compounds: expected dry or wet, got '" + v + "'");
  }
  else if (key == "compounds_csv") {
    auto table = load_compound_table_csv(v);
    if (!table.has_value()) throw ConfigError("compounds_csv: cannot open '" + v + "'");
    if (table->empty()) throw ConfigError("compounds_csv: no valid rows in '" + v + "'");
    cfg.compounds = std::move(*table);
  }
  else if (key == "baseline_driver")    baseline_of(cfg).driver = v;
  else if (key == "baseline_time_s")    baseline_of(cfg).total_time_s = as_double(key, v);
  else if (key == "baseline_pit_laps") {
    auto laps = parse_lap_list(v);
    if (!laps.has_value()) throw ConfigError("baseline_pit_laps: bad lap list '" + v + "'");
    baseline_of(cfg).pit_laps = std::move(*laps);
  }
  else throw ConfigError("unknown config key '" + key + "'");
}

} // namespace

RaceConfig race_config_from_stream(std::istream& in, RaceConfig base) {
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    const std::string raw = csv::trim(line);
    if (raw.empty()) continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) {
      throw ConfigError("line " + std::to_string(line_no) + ": expected key = value");
    }
    const std::string key = lower(csv::trim(raw.substr(0, eq)));
    const std::string value = csv::trim(raw.substr(eq + 1));
    try {
      apply_key(base, key, value);
    } catch (const ConfigError& e) {
      throw ConfigError("line " + std::to_string(line_no) + ": " + e.what());
    }
  }
  validate(base);
  return base;
}

RaceConfig load_race_config(const std::string& path, RaceConfig base) {
  std::ifstream f(path);
  if (!f) throw ConfigError("cannot open config file '" + path + "'");
  return race_config_from_stream(f, std::move(base));
}

} // namespace pitwall
