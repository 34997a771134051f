#pragma once
#include <string>
#include <utility>
#include <vector>
#include <pitwall/config.hpp>
#include <pitwall/projector.hpp>
#include <pitwall/state.hpp>

namespace pitwall {

enum class Confidence : int {
  NotRecommended = 0,
  Alternative = 1,
  Recommended = 2,
  HighlyRecommended = 3,
};

const char* to_string(Confidence c);

struct DecisionOption {
  int id = 0;                               // 1-based position in the returned list
  Choice choice;
  double predicted_lap_time_impact_s = 0.0;
  double predicted_race_time_impact_s = 0.0;
  double tyre_wear_multiplier = 1.0;
  Confidence confidence = Confidence::Alternative;
  bool compliance_violation = false;        // finishes the race on a single compound
  std::string rationale;
  std::vector<std::string> pros;
  std::vector<std::string> cons;
  std::vector<PlannedStop> plan;
};

// What options are ordered by.
struct RankKey {
  Choice choice;
  double race_time_impact_s = 0.0;
  double wear_multiplier = 1.0;
};

// Lower race-time impact, then lower wear, then PIT before STAY_OUT, then
// compound order.
bool ranks_before(const RankKey& a, const RankKey& b);

// The same order without the impact term; settles near-ties at the top.
bool tie_breaks_before(const RankKey& a, const RankKey& b);

// STAY_OUT followed by one PIT_TO per other compound in the table, in table order.
std::vector<Choice> candidate_choices(const CompoundTable& table, Compound current);

// Builds, ranks and labels the options for one decision point. Exactly one
// option comes back HighlyRecommended. Under CRITICAL_PAST_CLIFF and
// URGENT_APPROACHING_CLIFF staying out is always NotRecommended.
class OptionGenerator {
public:
  explicit OptionGenerator(RaceConfig cfg) : projector_(std::move(cfg)) {}

  std::vector<DecisionOption> generate(const RaceState& state, const TyreState& tyre,
                                       TriggerReason reason) const;

  const Projector& projector() const { return projector_; }

private:
  Projector projector_;
};

// One-shot convenience over OptionGenerator.
std::vector<DecisionOption> generate_options(const RaceConfig& cfg, const RaceState& state,
                                             const TyreState& tyre, TriggerReason reason);

// The HighlyRecommended entry. Throws std::logic_error if there is none.
const DecisionOption& top_option(const std::vector<DecisionOption>& options);

} // namespace pitwall
