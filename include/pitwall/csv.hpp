#pragma once
#include <string>
#include <vector>

// Tiny CSV helpers shared by the catalog loaders. No quoted fields.
namespace pitwall::csv {

std::string trim(std::string s);
std::vector<std::string> split_line(const std::string& line, char sep = ',');

// Whole-field numeric parses; ok is false on trailing garbage or empty input.
double to_double(const std::string& s, bool& ok);
int to_int(const std::string& s, bool& ok);

// Blank or '#'-prefixed after trimming.
bool is_skippable(const std::string& raw);

} // namespace pitwall::csv
