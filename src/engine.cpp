#include <pitwall/engine.hpp>
#include <stdexcept>
#include <string>
#include <utility>

#include <pitwall/errors.hpp>
#include <pitwall/trigger.hpp>

namespace pitwall {

int ScriptedPolicy::choose(const DecisionPoint& dp) {
  const auto it = script_.find(dp.lap);
  const Choice wanted = it != script_.end() ? it->second : Choice::stay_out();
  for (const auto& o : dp.options) {
    if (o.choice == wanted) return o.id;
  }
  return dp.top().id;
}

static RaceConfig checked(RaceConfig cfg) {
  validate(cfg);
  return cfg;
}

StrategyEngine::StrategyEngine(RaceConfig cfg, Logger log)
  : cfg_(checked(std::move(cfg))), log_(log), generator_(cfg_) {}

void StrategyEngine::start(Compound start_compound, int grid_position) {
  tracker_.emplace(cfg_, start_compound, grid_position);
  pending_.reset();
  context_lap_ = 0;
  decisions_ = 0;
  finish_reported_ = false;
  log_.info("race start: ", cfg_.total_laps, " laps on ", to_string(start_compound),
            " from P", grid_position, " (cadence ", to_string(cfg_.trigger.cadence), ")");
}

RaceTracker& StrategyEngine::tracker() {
  if (!tracker_.has_value()) throw InvalidStateError("race not started");
  return *tracker_;
}

const RaceState& StrategyEngine::state() const {
  if (!tracker_.has_value()) throw InvalidStateError("race not started");
  return tracker_->state();
}

const TyreState& StrategyEngine::tyre() const {
  if (!tracker_.has_value()) throw InvalidStateError("race not started");
  return tracker_->tyre();
}

void StrategyEngine::set_context(const LapContext& ctx) {
  tracker().set_context(ctx);
}

void StrategyEngine::set_style(DrivingStyle style) {
  tracker().set_style(style);
  log_.info("lap ", tracker_->state().current_lap, ": driving style ", to_string(style));
}

void StrategyEngine::pull_context() {
  if (feed_ == nullptr) return;
  const int lap = tracker_->state().current_lap;
  if (lap == context_lap_) return;
  context_lap_ = lap;
  if (auto ctx = feed_->context_for(lap); ctx.has_value()) {
    tracker_->set_context(*ctx);
  }
}

std::optional<DecisionPoint> StrategyEngine::advance(RaceObserver* observer) {
  RaceTracker& tr = tracker();
  if (pending_.has_value()) {
    throw InvalidStateError("decision pending on lap " + std::to_string(pending_->lap));
  }

  while (!tr.finished()) {
    pull_context();
    const int lap = tr.state().current_lap;

    if (const auto reason = evaluate_trigger(cfg_.trigger, tr.state(), tr.tyre()); reason.has_value()) {
      DecisionPoint dp;
      dp.lap = lap;
      dp.reason = *reason;
      dp.tyre = tr.tyre();
      dp.options = generator_.generate(tr.state(), tr.tyre(), *reason);
      ++decisions_;

      const auto& top = dp.top();
      log_.info("lap ", lap, ": ", to_string(*reason), " on ", to_string(dp.tyre.compound),
                " age ", dp.tyre.age, "/", dp.tyre.cliff_lap, " -> ", describe(top.choice),
                " (", top.predicted_race_time_impact_s, "s)");
      for (const auto& o : dp.options) {
        if (o.compliance_violation) {
          log_.warn("lap ", lap, ": ", describe(o.choice), " breaks the two-compound rule");
        } else if (!o.choice.is_pit() && o.confidence == Confidence::NotRecommended) {
          log_.warn("lap ", lap, ": staying out vetoed, tyre at ", dp.tyre.age, "/", dp.tyre.cliff_lap);
        }
      }

      pending_ = std::move(dp);
      if (observer != nullptr) observer->on_decision(*pending_);
      return pending_;
    }

    const RaceState& s = tr.apply(Choice::stay_out());
    LapAdvance ev{lap, tr.tyre(), s.timeline.back().lap_time_s, s.cumulative_time_s};
    log_.debug("lap ", lap, ": ", ev.lap_time_s, "s on ", to_string(ev.tyre.compound),
               " (age ", ev.tyre.age, ")");
    if (observer != nullptr) observer->on_lap(ev);
  }

  if (!finish_reported_) {
    finish_reported_ = true;
    const RaceSummary sum = summary();
    log_.info("race finished: ", sum.final_time_s, "s, ", sum.pit_history.size(), " stop(s), ",
              sum.decisions, " decision(s)");
    if (observer != nullptr) observer->on_finish(sum);
  }
  return std::nullopt;
}

void StrategyEngine::resolve(int option_id) {
  RaceTracker& tr = tracker();
  if (!pending_.has_value()) throw InvalidStateError("no decision pending");

  const DecisionOption* picked = nullptr;
  for (const auto& o : pending_->options) {
    if (o.id == option_id) picked = &o;
  }
  if (picked == nullptr) {
    throw std::out_of_range("no option " + std::to_string(option_id) + " at lap " +
                            std::to_string(pending_->lap));
  }

  if (picked->confidence == Confidence::NotRecommended) {
    log_.warn("lap ", pending_->lap, ": taking NOT_RECOMMENDED option ", describe(picked->choice));
  }
  tr.apply(picked->choice, pending_->reason);
  log_.info("lap ", pending_->lap, ": selected ", describe(picked->choice));
  pending_.reset();
}

RaceSummary StrategyEngine::run(DecisionPolicy& policy, RaceObserver* observer,
                                Compound start_compound, int grid_position) {
  if (!started()) start(start_compound, grid_position);
  if (pending_.has_value()) resolve(policy.choose(*pending_));
  while (auto dp = advance(observer)) {
    resolve(policy.choose(*dp));
  }
  return summary();
}

RaceSummary StrategyEngine::summary() const {
  const RaceState& s = state();
  RaceSummary out;
  out.final_time_s = s.cumulative_time_s;
  out.pit_history = s.pit_history;
  out.timeline = s.timeline;
  out.decisions = decisions_;
  out.compounds_used = s.compounds_used;
  if (cfg_.baseline.has_value()) {
    out.baseline = compare_with_baseline(s.pit_history, s.cumulative_time_s, *cfg_.baseline);
  }
  return out;
}

} // namespace pitwall
