#include <pitwall/config.hpp>
#include <pitwall/csv.hpp>
#include <pitwall/engine.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/events.hpp>
#include <pitwall/log.hpp>
#include <pitwall/track.hpp>

#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace pitwall;

namespace {

struct CliArgs {
  std::string track = "Bahrain";
  std::optional<int> laps;
  std::string start = "SOFT";
  std::string config_path;
  std::string compounds_path;
  std::string tracks_path;
  bool reduced = false;
  bool interactive = false;
  double sc_prob = 0.0;
  double vsc_prob = 0.0;
  unsigned seed = 42;
  LogLevel log_level = LogLevel::Warn;
};

const char* kUsage =
  "pitwall_cli [--track KEY] [--laps N] [--start COMPOUND] [--config FILE]\n"
  "            [--compounds FILE] [--tracks FILE] [--reduced] [--interactive]\n"
  "            [--sc-prob P] [--vsc-prob P] [--seed N] [--log-level debug|info|warn|error|off]\n";

// Out-of-range values are rejected, not truncated.
bool parse_int(const std::string& s, int* out) {
  bool ok = false;
  const int v = csv::to_int(s, ok);
  if (ok) *out = v;
  return ok;
}

bool parse_double(const std::string& s, double* out) {
  bool ok = false;
  const double v = csv::to_double(s, ok);
  if (ok) *out = v;
  return ok;
}

// Returns 0 to run, otherwise the process exit code.
int parse_args(int argc, char** argv, CliArgs* args) {
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    auto need = [&](const std::string& flag) -> const char* {
      if (i + 1 >= argc) {
        std::cerr << "Missing value for " << flag << "\n";
        return nullptr;
      }
      return argv[++i];
    };
    if (a == "--track") {
      const char* v = need(a);
      if (!v) return 2;
      args->track = v;
    } else if (a == "--laps") {
      const char* v = need(a);
      int n = 0;
      if (!v || !parse_int(v, &n)) return 2;
      args->laps = n;
    } else if (a == "--start") {
      const char* v = need(a);
      if (!v) return 2;
      args->start = v;
    } else if (a == "--config") {
      const char* v = need(a);
      if (!v) return 2;
      args->config_path = v;
    } else if (a == "--compounds") {
      const char* v = need(a);
      if (!v) return 2;
      args->compounds_path = v;
    } else if (a == "--tracks") {
      const char* v = need(a);
      if (!v) return 2;
      args->tracks_path = v;
    } else if (a == "--reduced") {
      args->reduced = true;
    } else if (a == "--interactive") {
      args->interactive = true;
    } else if (a == "--sc-prob") {
      const char* v = need(a);
      if (!v || !parse_double(v, &args->sc_prob)) return 2;
    } else if (a == "--vsc-prob") {
      const char* v = need(a);
      if (!v || !parse_double(v, &args->vsc_prob)) return 2;
    } else if (a == "--seed") {
      const char* v = need(a);
      int n = 0;
      if (!v || !parse_int(v, &n) || n < 0) return 2;
      args->seed = static_cast<unsigned>(n);
    } else if (a == "--log-level") {
      const char* v = need(a);
      if (!v) return 2;
      auto lvl = log_level_from_string(v);
      if (!lvl) {
        std::cerr << "Unknown log level: " << v << "\n";
        return 2;
      }
      args->log_level = *lvl;
    } else if (a == "--help" || a == "-h") {
      std::cout << kUsage;
      return 1;
    } else {
      std::cerr << "Unknown argument: " << a << "\n" << kUsage;
      return 2;
    }
  }
  return 0;
}

RaceConfig build_config(const CliArgs& args) {
  std::optional<Track> track;
  if (args.tracks_path.empty()) {
    track = track_by_key(args.track);
  } else {
    auto catalog = load_track_catalog_csv(args.tracks_path);
    if (!catalog) throw ConfigError("cannot open track catalog " + args.tracks_path);
    track = track_by_key_in(*catalog, args.track);
  }
  if (!track) throw ConfigError("unknown track: " + args.track);

  CompoundTable compounds = dry_compound_table();
  if (!args.compounds_path.empty()) {
    auto loaded = load_compound_table_csv(args.compounds_path);
    if (!loaded || loaded->empty()) throw ConfigError("no compounds loaded from " + args.compounds_path);
    compounds = *loaded;
  }

  RaceConfig cfg = race_config_for_track(*track, compounds);
  if (!args.config_path.empty()) cfg = load_race_config(args.config_path, cfg);
  if (args.laps) cfg.total_laps = *args.laps;
  if (args.reduced) cfg.trigger.cadence = Cadence::Reduced;
  validate(cfg);
  return cfg;
}

// Pre-rolled track status per lap.
class StatusFeed : public ContextFeed {
public:
  explicit StatusFeed(std::vector<TrackStatus> statuses) : statuses_(std::move(statuses)) {}

  std::optional<LapContext> context_for(int lap) override {
    if (lap < 1 || lap > static_cast<int>(statuses_.size())) return std::nullopt;
    LapContext ctx;
    ctx.track_status = statuses_[static_cast<std::size_t>(lap - 1)];
    return ctx;
  }

private:
  std::vector<TrackStatus> statuses_;
};

class PrintingObserver : public RaceObserver {
public:
  explicit PrintingObserver(std::ostream& os) : os_(os) {}

  void on_decision(const DecisionPoint& dp) override {
    os_ << "\nLap " << dp.lap << "  " << to_string(dp.reason) << "  "
        << to_string(dp.tyre.compound) << " age " << dp.tyre.age << "/" << dp.tyre.cliff_lap << "\n";
    for (const auto& o : dp.options) {
      os_ << "  [" << o.id << "] " << std::left << std::setw(14) << describe(o.choice)
          << std::right << std::showpos << std::setw(8) << o.predicted_race_time_impact_s << "s"
          << std::setw(8) << o.predicted_lap_time_impact_s << "s" << std::noshowpos
          << "  wear x" << o.tyre_wear_multiplier << "  " << to_string(o.confidence)
          << (o.compliance_violation ? "  (two-compound rule)" : "") << "\n"
          << "      " << o.rationale << "\n";
    }
  }

  void on_lap(const LapAdvance& ev) override {
    os_ << "lap " << std::setw(3) << ev.lap << "  " << std::setw(6) << to_string(ev.tyre.compound)
        << " age " << std::setw(2) << ev.tyre.age << "  " << ev.lap_time_s << "s\n";
  }

  void on_finish(const RaceSummary& sum) override {
    os_ << "\nFinished in " << sum.final_time_s << "s with " << sum.pit_history.size()
        << " stop(s) after " << sum.decisions << " decision(s)\n";
    for (const auto& p : sum.pit_history) {
      os_ << "  lap " << p.lap << ": " << to_string(p.from) << " -> " << to_string(p.to)
          << " (" << p.time_loss_s << "s, " << to_string(p.status) << ")\n";
    }
    if (sum.baseline) {
      const auto& b = *sum.baseline;
      os_ << "vs " << b.driver << ": " << b.matched_stops << "/" << b.baseline_stops << " stops matched";
      if (b.time_delta_s) os_ << ", " << std::showpos << *b.time_delta_s << std::noshowpos << "s";
      os_ << "\n";
    }
  }

private:
  std::ostream& os_;
};

// Reads an option id from stdin; an empty line takes the top option.
class PromptPolicy : public DecisionPolicy {
public:
  int choose(const DecisionPoint& dp) override {
    for (;;) {
      std::cout << "choose option [" << dp.top().id << "]: " << std::flush;
      std::string line;
      if (!std::getline(std::cin, line) || line.empty()) return dp.top().id;
      int id = 0;
      if (parse_int(line, &id)) {
        for (const auto& o : dp.options) {
          if (o.id == id) return id;
        }
      }
      std::cout << "no option " << line << "\n";
    }
  }
};

} // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (const int rc = parse_args(argc, argv, &args); rc != 0) return rc == 1 ? 0 : rc;

  try {
    const RaceConfig cfg = build_config(args);
    const Compound start = parse_compound(args.start);

    std::mt19937 rng(args.seed);
    StatusFeed feed(simulate_track_status(static_cast<std::size_t>(cfg.total_laps),
                                          args.sc_prob, args.vsc_prob, rng));

    StrategyEngine engine(cfg, Logger(std::cerr, args.log_level));
    engine.set_context_feed(&feed);
    PrintingObserver observer(std::cout);

    std::cout << args.track << ": " << cfg.total_laps << " laps, start on " << to_string(start)
              << ", cadence " << to_string(cfg.trigger.cadence) << "\n";

    if (args.interactive) {
      PromptPolicy policy;
      engine.run(policy, &observer, start);
    } else {
      BestOptionPolicy policy;
      engine.run(policy, &observer, start);
    }
  } catch (const Error& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
