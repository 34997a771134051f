#include <pitwall/track.hpp>
#include <algorithm>
#include <fstream>

#include <pitwall/csv.hpp>

namespace pitwall {

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return false;
  return (cols[0] == "key" || cols[0] == "Key");
}

static std::optional<Track> parse_track_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return std::nullopt;
  const std::string key = cols[0];
  if (key.empty()) return std::nullopt;
  bool ok0, ok1, ok2, ok3, ok4;
  const int laps = csv::to_int(cols[1], ok0);
  const double stat = csv::to_double(cols[2], ok1);
  const double lane = csv::to_double(cols[3], ok2);
  double sc  = csv::to_double(cols[4], ok3);
  double vsc = csv::to_double(cols[5], ok4);
  if (!(ok0 && ok1 && ok2 && ok3 && ok4)) return std::nullopt;
  if (laps <= 0) return std::nullopt;

  auto clamp01 = [](double x){ return x < 0.0 ? 0.0 : (x > 1.0 ? 1.0 : x); };
  sc  = clamp01(sc);
  vsc = clamp01(vsc);

  return Track{key, laps, stat < 0.0 ? 0.0 : stat, lane < 0.0 ? 0.0 : lane, sc, vsc};
}

static std::vector<Track> make_catalog_builtin() {
  return {
    {"Bahrain",     57, 2.5, 22.5, 0.45, 0.75},
    {"Monaco",      78, 2.5, 21.0, 0.40, 0.70},
    {"Silverstone", 52, 2.4, 20.0, 0.45, 0.75},
  };
}

const std::vector<Track>& track_catalog() {
  static const std::vector<Track> cat = make_catalog_builtin();
  return cat;
}

std::optional<Track> track_by_key(const std::string& key) {
  return track_by_key_in(track_catalog(), key);
}

std::optional<Track> track_by_key_in(const std::vector<Track>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const Track& t){ return t.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<Track> track_catalog_from_csv_stream(std::istream& in) {
  std::vector<Track> out;
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

    if (auto row = parse_track_row(cols); row.has_value()) {
      out.push_back(*row);
    }
  }
  return out;
}

std::optional<std::vector<Track>> load_track_catalog_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return track_catalog_from_csv_stream(f);
}

} // namespace pitwall
