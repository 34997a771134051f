#include <pitwall/log.hpp>
#include <cctype>

namespace pitwall {

const char* to_string(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO";
    case LogLevel::Warn:  return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Off:   return "OFF";
  }
  return "INFO";
}

std::optional<LogLevel> log_level_from_string(const std::string& s) {
  std::string l;
  l.reserve(s.size());
  for (char c : s) l.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (l == "debug") return LogLevel::Debug;
  if (l == "info")  return LogLevel::Info;
  if (l == "warn" || l == "warning") return LogLevel::Warn;
  if (l == "error") return LogLevel::Error;
  if (l == "off" || l == "none") return LogLevel::Off;
  return std::nullopt;
}

void Logger::write(LogLevel lvl, const std::string& msg) const {
  if (!enabled(lvl)) return;
  *out_ << "[pitwall][" << to_string(lvl) << "] " << msg << '\n';
}

} // namespace pitwall
