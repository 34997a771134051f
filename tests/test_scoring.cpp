#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <vector>

#include <pitwall/scoring.hpp>

using Catch::Approx;
using namespace pitwall;

static std::vector<PitRecord> pits_at(std::vector<int> laps) {
  std::vector<PitRecord> out;
  for (int lap : laps) out.push_back(PitRecord{lap, Compound::Soft, Compound::Hard, 25.0, TrackStatus::Green});
  return out;
}

TEST_CASE("compare_with_baseline") {
  SECTION("matches stops and reports the time gap") {
    BaselineRun b{"HAM", 5520.0, {20, 40}};
    auto c = compare_with_baseline(pits_at({18, 41}), 5510.5, b);
    REQUIRE(c.driver == "HAM");
    REQUIRE(c.our_stops == 2);
    REQUIRE(c.baseline_stops == 2);
    REQUIRE(c.matched_stops == 2);
    REQUIRE(c.time_delta_s.has_value());
    REQUIRE(*c.time_delta_s == Approx(-9.5));
    REQUIRE(*c.mean_pit_lap_error == Approx(1.5));
  }

  SECTION("closest pairs are matched first") {
    BaselineRun b{"VER", std::nullopt, {21}};
    auto c = compare_with_baseline(pits_at({10, 20, 30}), 5600.0, b);
    REQUIRE(c.matched_stops == 1);
    REQUIRE(*c.mean_pit_lap_error == Approx(1.0));
    REQUIRE_FALSE(c.time_delta_s.has_value());
  }

  SECTION("equal distance goes to the earlier baseline lap") {
    BaselineRun b{"LEC", std::nullopt, {28, 32}};
    auto c = compare_with_baseline(pits_at({30}), 5600.0, b);
    REQUIRE(c.matched_stops == 1);
    REQUIRE(*c.mean_pit_lap_error == Approx(2.0));
  }

  SECTION("no stops on either side") {
    auto c = compare_with_baseline({}, 5600.0, BaselineRun{"NOR", std::nullopt, {15}});
    REQUIRE(c.matched_stops == 0);
    REQUIRE_FALSE(c.mean_pit_lap_error.has_value());
  }
}
