#include <catch2/catch_test_macros.hpp>

#include <pitwall/config.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/state.hpp>
#include <pitwall/trigger.hpp>

using namespace pitwall;

static RaceState race_at(int lap, int total = 57) {
  RaceState s;
  s.current_lap = lap;
  s.total_laps = total;
  return s;
}

static TyreState soft(int age) { return TyreState{Compound::Soft, age, 25}; }

TEST_CASE("evaluate_trigger under full cadence") {
  const TriggerParams p;

  SECTION("lap 1 is always race start") {
    REQUIRE(evaluate_trigger(p, race_at(1), soft(0)) == TriggerReason::RaceStart);
    // even on a worn tyre
    REQUIRE(evaluate_trigger(p, race_at(1), soft(30)) == TriggerReason::RaceStart);
  }

  SECTION("a quiet lap raises nothing") {
    REQUIRE_FALSE(evaluate_trigger(p, race_at(5), soft(4)).has_value());
  }

  SECTION("approaching the cliff is urgent") {
    REQUIRE(evaluate_trigger(p, race_at(25), soft(24)) == TriggerReason::UrgentApproachingCliff);
    REQUIRE(evaluate_trigger(p, race_at(19), soft(18)) == TriggerReason::UrgentApproachingCliff);
  }

  SECTION("at or past the cliff is critical") {
    REQUIRE(evaluate_trigger(p, race_at(26), soft(25)) == TriggerReason::CriticalPastCliff);
    REQUIRE(evaluate_trigger(p, race_at(27), soft(26)) == TriggerReason::CriticalPastCliff);
  }

  SECTION("mid-stint review") {
    REQUIRE(evaluate_trigger(p, race_at(11), soft(10)) == TriggerReason::StrategicMidstint);
    TriggerParams floor = p;
    floor.strategic_min_age = 12;
    REQUIRE_FALSE(evaluate_trigger(floor, race_at(11), soft(10)).has_value());
  }

  SECTION("final laps and tactical interval") {
    RaceState s = race_at(54);
    REQUIRE(evaluate_trigger(p, s, TyreState{Compound::Hard, 2, 60}) == TriggerReason::FinalLaps);
    REQUIRE(evaluate_trigger(p, race_at(20), TyreState{Compound::Medium, 3, 40}) ==
            TriggerReason::TacticalInterval);
  }

  SECTION("higher priority wins when several rules hold") {
    // lap 30 is tactical, age 26 is past the cliff
    REQUIRE(evaluate_trigger(p, race_at(30), soft(26)) == TriggerReason::CriticalPastCliff);
    REQUIRE(trigger_priority(TriggerReason::RaceStart) < trigger_priority(TriggerReason::TacticalInterval));
  }

  SECTION("is idempotent") {
    const auto a = evaluate_trigger(p, race_at(25), soft(24));
    const auto b = evaluate_trigger(p, race_at(25), soft(24));
    REQUIRE(a == b);
  }
}

TEST_CASE("evaluate_trigger under reduced cadence") {
  TriggerParams p;
  p.cadence = Cadence::Reduced;

  SECTION("mid-stint and tactical laps are skipped") {
    REQUIRE_FALSE(evaluate_trigger(p, race_at(11), soft(10)).has_value());
    REQUIRE_FALSE(evaluate_trigger(p, race_at(20), TyreState{Compound::Medium, 3, 40}).has_value());
  }

  SECTION("urgent only on the first crossing") {
    // 17/25 = 0.68, 18/25 = 0.72
    REQUIRE(evaluate_trigger(p, race_at(19), soft(18)) == TriggerReason::UrgentApproachingCliff);
    REQUIRE_FALSE(evaluate_trigger(p, race_at(20), soft(19)).has_value());
  }

  SECTION("race start, critical and final laps stay") {
    REQUIRE(evaluate_trigger(p, race_at(1), soft(0)) == TriggerReason::RaceStart);
    REQUIRE(evaluate_trigger(p, race_at(27), soft(26)) == TriggerReason::CriticalPastCliff);
    REQUIRE(evaluate_trigger(p, race_at(55), TyreState{Compound::Hard, 2, 60}) == TriggerReason::FinalLaps);
  }
}

TEST_CASE("evaluate_trigger on a finished race throws") {
  REQUIRE_THROWS_AS(evaluate_trigger(TriggerParams{}, race_at(58), soft(3)), InvalidStateError);
}
