#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <pitwall/config.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/tracker.hpp>

using Catch::Approx;
using namespace pitwall;

TEST_CASE("RaceTracker starts on the grid") {
  RaceTracker t(RaceConfig{}, Compound::Soft, 4);
  REQUIRE(t.state().current_lap == 1);
  REQUIRE(t.state().total_laps == 57);
  REQUIRE(t.state().position == 4);
  REQUIRE(t.tyre().compound == Compound::Soft);
  REQUIRE(t.tyre().age == 0);
  REQUIRE(t.tyre().cliff_lap == 25);
  REQUIRE(t.state().used(Compound::Soft));

  REQUIRE_THROWS_AS(RaceTracker(RaceConfig{}, Compound::Wet), InvalidCompound);
}

TEST_CASE("RaceTracker apply") {
  RaceTracker t(RaceConfig{}, Compound::Soft);

  SECTION("stay out ages the tyre") {
    t.apply(Choice::stay_out());
    t.apply(Choice::stay_out());
    REQUIRE(t.tyre().age == 2);
    REQUIRE(t.state().current_lap == 3);
    REQUIRE(t.state().timeline.size() == 2);
    REQUIRE(t.state().timeline[1].tyre_age == 1);
    REQUIRE(t.state().cumulative_time_s ==
            Approx(t.state().timeline[0].lap_time_s + t.state().timeline[1].lap_time_s));
  }

  SECTION("pit fits fresh tyres and records the stop") {
    t.apply(Choice::pit_to(Compound::Hard), TriggerReason::RaceStart);
    const auto& s = t.state();
    REQUIRE(t.tyre().compound == Compound::Hard);
    REQUIRE(t.tyre().age == 0);
    REQUIRE(t.tyre().cliff_lap == 60);
    REQUIRE(s.pit_history.size() == 1);
    REQUIRE(s.pit_history[0].lap == 1);
    REQUIRE(s.pit_history[0].from == Compound::Soft);
    REQUIRE(s.pit_history[0].to == Compound::Hard);
    REQUIRE(s.pit_history[0].time_loss_s == Approx(25.0));
    REQUIRE(s.distinct_compounds() == 2);
    // lap 1 carries no fuel correction
    REQUIRE(s.timeline[0].lap_time_s == Approx(25.0 + 98.5));
    REQUIRE(s.timeline[0].pitted);
    REQUIRE(s.timeline[0].decision == TriggerReason::RaceStart);

    // the pit lap does not age the tyre
    t.apply(Choice::stay_out());
    REQUIRE(t.state().timeline[1].tyre_age == 0);
    REQUIRE(t.tyre().age == 1);
  }

  SECTION("pit under safety car costs less") {
    LapContext ctx;
    ctx.track_status = TrackStatus::SafetyCar;
    t.set_context(ctx);
    t.apply(Choice::pit_to(Compound::Medium));
    REQUIRE(t.state().pit_history[0].time_loss_s == Approx(2.5 + 22.5 * 0.45));
    REQUIRE(t.state().pit_history[0].status == TrackStatus::SafetyCar);
  }

  SECTION("unknown compound leaves the state untouched") {
    t.apply(Choice::stay_out());
    REQUIRE_THROWS_AS(t.apply(Choice::pit_to(Compound::Intermediate)), InvalidCompound);
    REQUIRE(t.state().current_lap == 2);
    REQUIRE(t.state().pit_history.empty());
    REQUIRE(t.state().timeline.size() == 1);
    REQUIRE(t.tyre().compound == Compound::Soft);
    REQUIRE(t.tyre().age == 1);
  }

  SECTION("lap_time_for matches the applied lap") {
    const double predicted = t.lap_time_for(Choice::pit_to(Compound::Medium));
    t.apply(Choice::pit_to(Compound::Medium));
    REQUIRE(t.state().timeline.back().lap_time_s == Approx(predicted));
  }
}

TEST_CASE("RaceTracker context and style") {
  RaceTracker t(RaceConfig{}, Compound::Medium, 6);

  LapContext ctx;
  ctx.gap_ahead_s = 1.4;
  t.set_context(ctx);
  REQUIRE(t.state().position == 6); // absent field keeps its value
  REQUIRE(*t.state().gap_ahead_s == Approx(1.4));

  ctx = LapContext{};
  ctx.position = 3;
  t.set_context(ctx);
  REQUIRE(t.state().position == 3);
  REQUIRE(*t.state().gap_ahead_s == Approx(1.4));

  const double balanced = t.lap_time_for(Choice::stay_out());
  t.set_style(DrivingStyle::QualiMode);
  REQUIRE(t.lap_time_for(Choice::stay_out()) == Approx(balanced - 0.8));
}

TEST_CASE("RaceTracker after the flag") {
  RaceConfig cfg;
  cfg.total_laps = 2;
  RaceTracker t(cfg, Compound::Soft);
  t.apply(Choice::stay_out());
  t.apply(Choice::pit_to(Compound::Medium));
  REQUIRE(t.finished());
  REQUIRE(t.state().current_lap == 3);

  REQUIRE_THROWS_AS(t.apply(Choice::stay_out()), InvalidStateError);
  REQUIRE_THROWS_AS(t.set_context(LapContext{}), InvalidStateError);
  REQUIRE_THROWS_AS(t.set_style(DrivingStyle::Aggressive), InvalidStateError);
  REQUIRE(t.state().timeline.size() == 2);
}
