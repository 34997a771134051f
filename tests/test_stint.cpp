#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <pitwall/compound.hpp>
#include <pitwall/config.hpp>
#include <pitwall/stint.hpp>
#include <pitwall/tracker.hpp>
#include <pitwall/tyre_model.hpp>

using namespace pitwall;
using Catch::Approx;

TEST_CASE("LapClock") {
  TyreModel model(dry_compound_table());

  SECTION("fresh lap on lap 1 is the base time") {
    LapClock clock(model, 0.0385);
    REQUIRE(clock.lap_time(Compound::Medium, 0, 1) == Approx(97.8));
  }

  SECTION("fuel burn-off makes later laps faster") {
    LapClock clock(model, 0.05);
    REQUIRE(clock.lap_time(Compound::Hard, 0, 11) == Approx(98.5 - 0.5));
  }

  SECTION("style offset applies to every lap") {
    LapClock clock(model, 0.0, conditions_for(DrivingStyle::Conservative));
    REQUIRE(clock.lap_time(Compound::Soft, 0, 1) == Approx(97.4));
  }

  SECTION("best fresh lap picks the fastest compound") {
    LapClock clock(model, 0.0);
    REQUIRE(clock.best_fresh_lap(1) == Approx(97.0));
  }
}

TEST_CASE("LapClock agrees with the tracker across a pit") {
  RaceConfig cfg;
  cfg.fuel.load_kg = 0.0; // lap times depend on tyres only
  RaceTracker t(cfg, Compound::Medium);
  TyreModel model(cfg.compounds);
  LapClock clock(model, fuel_correction_per_lap(cfg));

  t.apply(Choice::pit_to(Compound::Soft));
  t.apply(Choice::stay_out());
  t.apply(Choice::stay_out());
  const auto& tl = t.state().timeline;

  // pit lap and the lap after it both run on a fresh set
  REQUIRE(tl[0].lap_time_s - pit_loss_under(cfg, TrackStatus::Green) == Approx(clock.lap_time(Compound::Soft, 0, 1)));
  REQUIRE(tl[1].lap_time_s == Approx(clock.lap_time(Compound::Soft, 0, 2)));
  REQUIRE(tl[2].lap_time_s == Approx(clock.lap_time(Compound::Soft, 1, 3)));
  REQUIRE(tl[0].lap_time_s + tl[1].lap_time_s == Approx(25.0 + 2 * 97.0));
}
