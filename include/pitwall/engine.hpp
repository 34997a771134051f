#pragma once
#include <map>
#include <optional>
#include <utility>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/log.hpp>
#include <pitwall/options.hpp>
#include <pitwall/scoring.hpp>
#include <pitwall/state.hpp>
#include <pitwall/tracker.hpp>

namespace pitwall {

struct DecisionPoint {
  int lap = 0;
  TriggerReason reason = TriggerReason::RaceStart;
  TyreState tyre;
  std::vector<DecisionOption> options;

  const DecisionOption& top() const { return top_option(options); }
};

struct LapAdvance {
  int lap = 0;               // lap just driven
  TyreState tyre;            // tyre after the lap
  double lap_time_s = 0.0;
  double cumulative_time_s = 0.0;
};

struct RaceSummary {
  double final_time_s = 0.0;
  std::vector<PitRecord> pit_history;
  std::vector<LapRecord> timeline;
  int decisions = 0;
  std::vector<Compound> compounds_used;
  std::optional<BaselineComparison> baseline;
};

// Receives engine events. All callbacks default to no-ops.
class RaceObserver {
public:
  virtual ~RaceObserver() = default;
  virtual void on_decision(const DecisionPoint&) {}
  virtual void on_lap(const LapAdvance&) {}
  virtual void on_finish(const RaceSummary&) {}
};

// Supplies per-lap context (position, gaps, track status) before each lap.
class ContextFeed {
public:
  virtual ~ContextFeed() = default;
  virtual std::optional<LapContext> context_for(int lap) = 0;
};

// Picks an option id at a decision point.
class DecisionPolicy {
public:
  virtual ~DecisionPolicy() = default;
  virtual int choose(const DecisionPoint& dp) = 0;
};

// Always follows the HIGHLY_RECOMMENDED option.
class BestOptionPolicy : public DecisionPolicy {
public:
  int choose(const DecisionPoint& dp) override { return dp.top().id; }
};

// Replays a fixed plan: the scripted choice on listed laps, STAY_OUT on every
// other decision lap. A scripted choice that is not on offer falls back to
// the top option.
class ScriptedPolicy : public DecisionPolicy {
public:
  explicit ScriptedPolicy(std::map<int, Choice> script) : script_(std::move(script)) {}
  int choose(const DecisionPoint& dp) override;

private:
  std::map<int, Choice> script_;
};

// Sequential per-lap strategy loop for one race. Holds no shared state, so
// separate engines may run on separate threads.
class StrategyEngine {
public:
  explicit StrategyEngine(RaceConfig cfg, Logger log = {});

  // Places the car on the grid at lap 1. Throws InvalidCompound.
  void start(Compound start_compound, int grid_position = 1);

  // Drives laps with an implicit STAY_OUT until a decision triggers (returned
  // and held as pending) or the race ends (nullopt; the summary goes to the
  // observer once). Throws InvalidStateError before start or while a
  // decision is pending.
  std::optional<DecisionPoint> advance(RaceObserver* observer = nullptr);

  // Applies the pending option with this id. Throws InvalidStateError without
  // a pending decision and std::out_of_range for an unknown id.
  void resolve(int option_id);

  // Full race with a policy. Starts the race if start() was not called.
  RaceSummary run(DecisionPolicy& policy, RaceObserver* observer = nullptr,
                  Compound start_compound = Compound::Soft, int grid_position = 1);

  void set_context_feed(ContextFeed* feed) { feed_ = feed; }
  void set_context(const LapContext& ctx);
  void set_style(DrivingStyle style);

  bool started() const { return tracker_.has_value(); }
  bool finished() const { return started() && tracker_->finished(); }
  const std::optional<DecisionPoint>& pending() const { return pending_; }

  const RaceState& state() const;
  const TyreState& tyre() const;
  const RaceConfig& config() const { return cfg_; }

  RaceSummary summary() const;

private:
  RaceTracker& tracker();
  void pull_context();

  RaceConfig cfg_;
  Logger log_;
  OptionGenerator generator_;
  std::optional<RaceTracker> tracker_;
  std::optional<DecisionPoint> pending_;
  ContextFeed* feed_ = nullptr;
  int context_lap_ = 0; // last lap the feed was queried for
  int decisions_ = 0;
  bool finish_reported_ = false;
};

} // namespace pitwall
