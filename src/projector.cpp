#include <pitwall/projector.hpp>
#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include <pitwall/errors.hpp>
#include <pitwall/stint.hpp>

namespace pitwall {

namespace {

constexpr double kInf = std::numeric_limits<double>::infinity();

// Optimal continuation over fresh stints. Memoised on
// (pit lap, compound, stops left, diverse).
class ContinuationSearch {
public:
  ContinuationSearch(const LapClock& clock, const CompoundTable& table,
                     int first_lap, int last_lap, double pit_loss,
                     bool check_diversity, int max_stops)
    : clock_(clock), table_(table), first_(first_lap), last_(last_lap),
      pit_loss_(pit_loss), check_diversity_(check_diversity), max_stops_(max_stops),
      nodes_(static_cast<std::size_t>(last_lap - first_lap + 1) * table.size() *
             static_cast<std::size_t>(max_stops + 1) * 2),
      seen_(nodes_.size(), false) {}

  struct Step {
    double cost = kInf;
    int end_lap = 0;   // last lap of this stint
    int next = -1;     // table index pitted for at end_lap + 1, -1 = run to the end
  };

  // Best stint on tyre `ci` starting on lap s, plus whatever follows it.
  // The first lap runs at `first_lap_age`, later laps count up from `next_age`.
  Step stint(int s, int ci, int first_lap_age, int next_age, int stops, bool diverse) {
    Step best;
    const Compound c = table_[static_cast<std::size_t>(ci)].compound;
    double running = 0.0;
    for (int e = s; e <= last_; ++e) {
      const int age = (e == s) ? first_lap_age : next_age + (e - s - 1);
      running += clock_.lap_time(c, age, e);
      if (running >= best.cost) break; // lap times are positive; no later end can win

      if (e == last_) {
        if (finish_ok(diverse) && running < best.cost) best = Step{running, e, -1};
        continue;
      }
      if (stops <= 0) continue;
      for (int ni = 0; ni < static_cast<int>(table_.size()); ++ni) {
        const bool div = diverse || ni != ci;
        const double t = running + pit_loss_ + fresh(e + 1, ni, stops - 1, div).cost;
        if (t < best.cost) best = Step{t, e, ni};
      }
    }
    return best;
  }

  // Fresh set of `ci` fitted on pit lap s. The pit lap runs at age 0 and
  // does not age the tyre, so the following lap is also at age 0.
  const Step& fresh(int s, int ci, int stops, bool diverse) {
    const std::size_t i = index(s, ci, stops, diverse);
    if (!seen_[i]) {
      seen_[i] = true;
      nodes_[i] = stint(s, ci, 0, 0, stops, diverse);
    }
    return nodes_[i];
  }

  // Follows memoised steps to list future stops after a root step.
  void collect(const Step& root, int stops, bool diverse, int ci, std::vector<PlannedStop>& out) {
    Step cur = root;
    int cur_ci = ci;
    while (cur.next >= 0 && stops > 0) {
      const int lap = cur.end_lap + 1;
      out.push_back(PlannedStop{lap, table_[static_cast<std::size_t>(cur.next)].compound});
      diverse = diverse || cur.next != cur_ci;
      cur_ci = cur.next;
      --stops;
      cur = fresh(lap, cur_ci, stops, diverse);
    }
  }

private:
  bool finish_ok(bool diverse) const { return !check_diversity_ || diverse; }

  std::size_t index(int s, int ci, int stops, bool diverse) const {
    const std::size_t n_c = table_.size();
    const std::size_t n_m = static_cast<std::size_t>(max_stops_ + 1);
    return (((static_cast<std::size_t>(s - first_) * n_c + static_cast<std::size_t>(ci)) * n_m +
             static_cast<std::size_t>(stops)) * 2) + (diverse ? 1 : 0);
  }

  const LapClock& clock_;
  const CompoundTable& table_;
  int first_;
  int last_;
  double pit_loss_;
  bool check_diversity_;
  int max_stops_;
  std::vector<Step> nodes_;
  std::vector<bool> seen_;
};

int table_index(const CompoundTable& table, Compound c) {
  for (std::size_t i = 0; i < table.size(); ++i) {
    if (table[i].compound == c) return static_cast<int>(i);
  }
  throw InvalidCompound(std::string("compound ") + to_string(c) + " is not available");
}

} // namespace

Projector::Projector(RaceConfig cfg) : cfg_(std::move(cfg)), model_(cfg_.compounds) {}

int Projector::horizon_end(int lap) const {
  if (cfg_.horizon.to_end()) return cfg_.total_laps;
  return std::min(cfg_.total_laps, lap + cfg_.horizon.laps - 1);
}

Projection Projector::project(const RaceState& state, const TyreState& tyre, const Choice& choice) const {
  if (state.finished()) throw InvalidStateError("cannot project a finished race");

  const CompoundTable& table = model_.table();
  const int cur_ci = table_index(table, tyre.compound);
  const int pit_ci = choice.is_pit() ? table_index(table, choice.compound) : cur_ci;

  const LapClock clock(model_, fuel_correction_per_lap(cfg_), conditions_for(state.style));
  const int first = state.current_lap;
  const int last = horizon_end(first);
  const int stops = cfg_.max_projected_stops;

  // Diversity is only checked when the horizon reaches the flag.
  const bool check = cfg_.require_compound_diversity && last == cfg_.total_laps;
  const int distinct = state.distinct_compounds() + (state.used(tyre.compound) ? 0 : 1);
  const bool diverse0 = distinct >= 2;

  const double future_loss = pit_loss_under(cfg_, TrackStatus::Green);
  const double now_loss = pit_loss_under(cfg_, state.track_status);

  Projection out;
  out.first_lap = first;
  out.last_lap = last;
  for (int lap = first; lap <= last; ++lap) out.baseline_s += clock.best_fresh_lap(lap);

  const double best_fresh = clock.best_fresh_lap(first);
  if (choice.is_pit()) {
    out.lap_time_impact_s = now_loss + clock.lap_time(choice.compound, 0, first) - best_fresh;
    out.wear_multiplier = model_.wear_multiplier(choice.compound, 0);
  } else {
    out.lap_time_impact_s = clock.lap_time(tyre.compound, tyre.age, first) - best_fresh;
    out.wear_multiplier = model_.wear_multiplier(tyre.compound, tyre.age);
  }

  auto run = [&](bool enforce, std::vector<PlannedStop>& planned) {
    ContinuationSearch search(clock, table, first, last, future_loss, enforce, stops);
    if (choice.is_pit()) {
      const bool diverse = diverse0 || pit_ci != cur_ci;
      const auto& step = search.fresh(first, pit_ci, stops, diverse);
      planned.push_back(PlannedStop{first, choice.compound});
      if (step.cost < kInf) search.collect(step, stops, diverse, pit_ci, planned);
      return now_loss + step.cost;
    }
    const auto step = search.stint(first, cur_ci, tyre.age, tyre.age + 1, stops, diverse0);
    if (step.cost < kInf) search.collect(step, stops, diverse0, cur_ci, planned);
    return step.cost;
  };

  std::vector<PlannedStop> planned;
  double total = run(true, planned);
  if (!(total < kInf)) {
    out.compliant = false;
    planned.clear();
    total = run(false, planned);
  }
  out.race_time_s = total;
  out.race_time_impact_s = total - out.baseline_s;
  out.stops = std::move(planned);
  return out;
}

Projection project_impact(const RaceConfig& cfg, const RaceState& state,
                          const TyreState& tyre, const Choice& choice) {
  return Projector(cfg).project(state, tyre, choice);
}

} // namespace pitwall
