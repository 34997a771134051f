#pragma once
#include <optional>
#include <ostream>
#include <sstream>
#include <string>

namespace pitwall {

enum class LogLevel : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

const char* to_string(LogLevel lvl);
// Case-insensitive: "debug", "info", "warn", "error", "off".
std::optional<LogLevel> log_level_from_string(const std::string& s);

// Levelled line logger bound to one stream. Each engine owns its own copy,
// so there is no process-wide log state. A default-constructed Logger is silent.
class Logger {
public:
  Logger() = default;
  explicit Logger(std::ostream& out, LogLevel level = LogLevel::Info)
    : out_(&out), level_(level) {}

  void set_level(LogLevel lvl) { level_ = lvl; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel lvl) const {
    return out_ != nullptr && lvl != LogLevel::Off && lvl >= level_;
  }

  void write(LogLevel lvl, const std::string& msg) const;

  template <class... Args>
  void log(LogLevel lvl, const Args&... args) const {
    if (!enabled(lvl)) return;
    std::ostringstream os;
    (os << ... << args);
    write(lvl, os.str());
  }

  template <class... Args> void debug(const Args&... a) const { log(LogLevel::Debug, a...); }
  template <class... Args> void info(const Args&... a)  const { log(LogLevel::Info, a...); }
  template <class... Args> void warn(const Args&... a)  const { log(LogLevel::Warn, a...); }
  template <class... Args> void error(const Args&... a) const { log(LogLevel::Error, a...); }

private:
  std::ostream* out_ = nullptr;
  LogLevel level_ = LogLevel::Off;
};

} // namespace pitwall
