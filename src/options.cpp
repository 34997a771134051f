#include <pitwall/options.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace pitwall {

const char* to_string(Confidence c) {
  switch (c) {
    case Confidence::NotRecommended:    return "NOT_RECOMMENDED";
    case Confidence::Alternative:       return "ALTERNATIVE";
    case Confidence::Recommended:       return "RECOMMENDED";
    case Confidence::HighlyRecommended: return "HIGHLY_RECOMMENDED";
  }
  return "ALTERNATIVE";
}

std::vector<Choice> candidate_choices(const CompoundTable& table, Compound current) {
  std::vector<Choice> out;
  out.reserve(table.size() + 1);
  out.push_back(Choice::stay_out());
  for (const auto& p : table) {
    if (p.compound != current) out.push_back(Choice::pit_to(p.compound));
  }
  return out;
}

const DecisionOption& top_option(const std::vector<DecisionOption>& options) {
  auto it = std::find_if(options.begin(), options.end(), [](const DecisionOption& o) {
    return o.confidence == Confidence::HighlyRecommended;
  });
  if (it == options.end()) throw std::logic_error("decision point has no HIGHLY_RECOMMENDED option");
  return *it;
}

bool ranks_before(const RankKey& a, const RankKey& b) {
  if (a.race_time_impact_s != b.race_time_impact_s) return a.race_time_impact_s < b.race_time_impact_s;
  if (tie_breaks_before(a, b)) return true;
  if (tie_breaks_before(b, a)) return false;
  return static_cast<int>(a.choice.compound) < static_cast<int>(b.choice.compound);
}

bool tie_breaks_before(const RankKey& a, const RankKey& b) {
  if (a.wear_multiplier != b.wear_multiplier) return a.wear_multiplier < b.wear_multiplier;
  if (a.choice.is_pit() != b.choice.is_pit()) return a.choice.is_pit();
  return false;
}

namespace {

struct Ranked {
  Choice choice;
  Projection proj;
  bool safety_veto = false;
  bool compliance_veto = false;

  bool vetoed() const { return safety_veto || compliance_veto; }
  RankKey key() const { return RankKey{choice, proj.race_time_impact_s, proj.wear_multiplier}; }
};

bool cliff_reason(TriggerReason r) {
  return r == TriggerReason::CriticalPastCliff || r == TriggerReason::UrgentApproachingCliff;
}

template <class... Args>
std::string format(const char* fmt, Args... args) {
  char buf[192];
  std::snprintf(buf, sizeof(buf), fmt, args...);
  return buf;
}

std::string plan_text(const Ranked& r) {
  std::string out;
  for (const auto& stop : r.proj.stops) {
    if (r.choice.is_pit() && stop.lap == r.proj.first_lap) continue;
    out += out.empty() ? " Plan: pit" : ", then";
    out += format(" lap %d for %s", stop.lap, to_string(stop.compound));
  }
  if (!out.empty()) out += ".";
  return out;
}

// How the top of the list was decided.
struct Leader {
  const Ranked* top = nullptr;
  const Ranked* fastest = nullptr; // best eligible impact before the tie rule
  bool safety_override = false;

  bool tie_promoted() const { return fastest != nullptr && fastest != top; }
};

// What separated two near-tied options.
const char* tie_factor(const Ranked& winner, const Ranked& loser) {
  return winner.proj.wear_multiplier < loser.proj.wear_multiplier ? "lower tyre wear" : "pit preference";
}

void describe_option(DecisionOption& o, const Ranked& r, const RaceConfig& cfg,
                     const RaceState& state, const TyreState& tyre, const Leader& lead) {
  const double gap_to_top = r.proj.race_time_impact_s - lead.top->proj.race_time_impact_s;

  if (r.safety_veto) {
    if (tyre.past_cliff()) {
      o.rationale = format("Past the tyre cliff (age %d/%d): staying out risks tread failure.",
                           tyre.age, tyre.cliff_lap);
    } else {
      o.rationale = format("Approaching the tyre cliff (age %d/%d, %.0f%% of life): box before it.",
                           tyre.age, tyre.cliff_lap, tyre.life_ratio() * 100.0);
    }
  } else if (r.compliance_veto) {
    o.rationale = "Would finish the race on a single compound; at least two are required.";
  } else if (&r == lead.top) {
    if (lead.safety_override) {
      o.rationale = format("Pit before the cliff: best pit option at %+.1fs vs ideal pace.",
                           r.proj.race_time_impact_s);
    } else if (lead.tie_promoted()) {
      o.rationale = format("Near tie on race time (%+.2fs vs the fastest option, margin %.2fs); %s decides.",
                           r.proj.race_time_impact_s - lead.fastest->proj.race_time_impact_s,
                           cfg.tie_epsilon_s, tie_factor(r, *lead.fastest));
    } else {
      o.rationale = format("Best projected race time (%+.1fs vs ideal pace).", r.proj.race_time_impact_s);
    }
  } else if (gap_to_top < 0.0) {
    o.rationale = format("%.1fs faster than the top option but within the %.2fs tie margin; loses on %s.",
                         -gap_to_top, cfg.tie_epsilon_s, tie_factor(*lead.top, r));
  } else {
    o.rationale = format("%.1fs slower than the top option over the horizon.", gap_to_top);
  }
  o.rationale += plan_text(r);

  const double pit_loss = pit_loss_under(cfg, state.track_status);
  if (r.choice.is_pit()) {
    o.pros.push_back(format("Fresh %s tyres", to_string(r.choice.compound)));
    o.pros.push_back(format("%d laps to go", state.laps_remaining()));
    if (cfg.require_compound_diversity && !state.used(r.choice.compound) && state.distinct_compounds() < 2) {
      o.pros.push_back("Meets the two-compound rule");
    }
    if (state.track_status != TrackStatus::Green) {
      o.pros.push_back(format("Cheaper stop under %s", to_string(state.track_status)));
    }
    o.cons.push_back(format("%.1fs pit loss", pit_loss));
    if (state.gap_behind_s.has_value() && *state.gap_behind_s < pit_loss) {
      o.cons.push_back(format("Likely rejoins behind the car %.1fs back", *state.gap_behind_s));
    }
  } else {
    o.pros.push_back("No pit loss now");
    o.pros.push_back("Keeps track position");
    o.cons.push_back(format("Tyre age %d laps, cliff at %d", tyre.age, tyre.cliff_lap));
    if (tyre.past_cliff()) {
      o.cons.push_back(format("Degradation +%.1fs on this lap", r.proj.lap_time_impact_s));
    }
  }
}

} // namespace

std::vector<DecisionOption> OptionGenerator::generate(const RaceState& state, const TyreState& tyre,
                                                      TriggerReason reason) const {
  const RaceConfig& cfg = projector_.config();

  std::vector<Ranked> ranked;
  for (const auto& choice : candidate_choices(projector_.model().table(), tyre.compound)) {
    Ranked r{choice, projector_.project(state, tyre, choice)};
    r.safety_veto = !choice.is_pit() && cliff_reason(reason);
    r.compliance_veto = cfg.require_compound_diversity && !r.proj.compliant;
    ranked.push_back(std::move(r));
  }
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const Ranked& a, const Ranked& b) { return ranks_before(a.key(), b.key()); });

  const bool safety_override = cliff_reason(reason) && !ranked.empty() && !ranked.front().choice.is_pit();

  std::vector<std::size_t> eligible;
  std::vector<std::size_t> vetoed;
  for (std::size_t i = 0; i < ranked.size(); ++i) {
    (ranked[i].vetoed() ? vetoed : eligible).push_back(i);
  }

  const Ranked* fastest = eligible.empty() ? nullptr : &ranked[eligible.front()];

  // Near-tie at the top: the lower-wear option (then pit) leads.
  if (!safety_override && eligible.size() >= 2) {
    const double best = ranked[eligible.front()].proj.race_time_impact_s;
    std::size_t lead = 0;
    for (std::size_t k = 1; k < eligible.size(); ++k) {
      const auto& cand = ranked[eligible[k]];
      if (cand.proj.race_time_impact_s - best > cfg.tie_epsilon_s) break;
      if (tie_breaks_before(cand.key(), ranked[eligible[lead]].key())) lead = k;
    }
    std::rotate(eligible.begin(), eligible.begin() + static_cast<std::ptrdiff_t>(lead),
                eligible.begin() + static_cast<std::ptrdiff_t>(lead) + 1);
  }

  // Fallbacks for an all-vetoed list: compliance vetoes before safety ones.
  std::stable_partition(vetoed.begin(), vetoed.end(),
                        [&](std::size_t i) { return !ranked[i].safety_veto; });

  std::vector<std::size_t> order = eligible;
  order.insert(order.end(), vetoed.begin(), vetoed.end());

  std::vector<DecisionOption> out;
  out.reserve(order.size());
  Leader leader;
  leader.top = &ranked[order.front()];
  leader.fastest = fastest;
  leader.safety_override = safety_override;
  for (std::size_t k = 0; k < order.size(); ++k) {
    const Ranked& r = ranked[order[k]];
    DecisionOption o;
    o.id = static_cast<int>(k) + 1;
    o.choice = r.choice;
    o.predicted_lap_time_impact_s = r.proj.lap_time_impact_s;
    o.predicted_race_time_impact_s = r.proj.race_time_impact_s;
    o.tyre_wear_multiplier = r.proj.wear_multiplier;
    o.compliance_violation = r.compliance_veto;
    o.plan = r.proj.stops;

    if (k == 0) {
      // Holds even if every option was vetoed.
      o.confidence = Confidence::HighlyRecommended;
    } else if (r.vetoed()) {
      o.confidence = Confidence::NotRecommended;
    } else {
      o.confidence = (k == 1) ? Confidence::Recommended : Confidence::Alternative;
    }
    describe_option(o, r, cfg, state, tyre, leader);
    out.push_back(std::move(o));
  }
  return out;
}

std::vector<DecisionOption> generate_options(const RaceConfig& cfg, const RaceState& state,
                                             const TyreState& tyre, TriggerReason reason) {
  return OptionGenerator(cfg).generate(state, tyre, reason);
}

} // namespace pitwall
