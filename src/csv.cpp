#include <pitwall/csv.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace pitwall::csv {

std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

std::vector<std::string> split_line(const std::string& line, char sep) {
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == sep) { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

double to_double(const std::string& s, bool& ok) {
  ok = false;
  if (s.empty()) return 0.0;
  try {
    size_t idx = 0;
    const double v = std::stod(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::invalid_argument&) {
    return 0.0;
  } catch (const std::out_of_range&) {
    return 0.0;
  }
}

int to_int(const std::string& s, bool& ok) {
  ok = false;
  if (s.empty()) return 0;
  try {
    size_t idx = 0;
    const int v = std::stoi(s, &idx);
    ok = idx == s.size();
    return v;
  } catch (const std::invalid_argument&) {
    return 0;
  } catch (const std::out_of_range&) {
    return 0;
  }
}

bool is_skippable(const std::string& raw) {
  return raw.empty() || raw[0] == '#';
}

} // namespace pitwall::csv
