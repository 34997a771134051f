#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <stdexcept>
#include <string>

#include <pitwall/compound.hpp>
#include <pitwall/errors.hpp>
#include <pitwall/style.hpp>
#include <pitwall/tyre_model.hpp>

using Catch::Approx;
using namespace pitwall;

TEST_CASE("lap_time_delta") {
  const auto& soft = require_compound(dry_compound_table(), Compound::Soft);

  SECTION("fresh tyre has no delta") {
    REQUIRE(lap_time_delta(soft, 0) == Approx(0.0));
  }

  SECTION("slope ramps from start to end wear") {
    // slope(10) = 0.04 + 0.16 * 10/25 = 0.104
    REQUIRE(lap_time_delta(soft, 10) == Approx(1.04));
    // slope(24) = 0.04 + 0.16 * 24/25 = 0.1936
    REQUIRE(lap_time_delta(soft, 24) == Approx(4.6464));
  }

  SECTION("non-decreasing in age, with a jump at the cliff") {
    for (int a = 1; a < 80; ++a) {
      REQUIRE(lap_time_delta(soft, a) >= lap_time_delta(soft, a - 1));
    }
    const double before = lap_time_delta(soft, 24) - lap_time_delta(soft, 23);
    const double at = lap_time_delta(soft, 25) - lap_time_delta(soft, 24);
    REQUIRE(at > before);
  }

  SECTION("style scales degradation") {
    REQUIRE(lap_time_delta(soft, 10, conditions_for(DrivingStyle::Aggressive)) == Approx(1.04 * 1.4));
    REQUIRE(lap_time_delta(soft, 10, conditions_for(DrivingStyle::TyreSave)) == Approx(0.52));
  }

  SECTION("negative age throws") {
    REQUIRE_THROWS_AS(lap_time_delta(soft, -1), std::invalid_argument);
  }
}

TEST_CASE("wear_multiplier") {
  for (const auto& p : dry_compound_table()) {
    SECTION(std::string(to_string(p.compound)) + " is monotone with a cliff step") {
      REQUIRE(wear_multiplier(p, 0) == Approx(1.0));
      for (int a = 1; a < 2 * p.cliff_lap; ++a) {
        REQUIRE(wear_multiplier(p, a) >= wear_multiplier(p, a - 1));
      }
      REQUIRE(wear_multiplier(p, p.cliff_lap) > wear_multiplier(p, p.cliff_lap - 1));
    }
  }

  SECTION("negative age throws") {
    REQUIRE_THROWS_AS(wear_multiplier(dry_compound_table().front(), -3), std::invalid_argument);
  }
}

TEST_CASE("TyreModel") {
  TyreModel dry(dry_compound_table());
  TyreModel wet(wet_compound_table());

  SECTION("looks up by compound") {
    REQUIRE(dry.cliff_lap(Compound::Medium) == 40);
    REQUIRE(dry.fresh_lap_s(Compound::Hard) == Approx(98.5));
    REQUIRE(wet.cliff_lap(Compound::Intermediate) == 30);
  }

  SECTION("is idempotent") {
    REQUIRE(dry.lap_time_delta(Compound::Soft, 27) == dry.lap_time_delta(Compound::Soft, 27));
    REQUIRE(dry.wear_multiplier(Compound::Hard, 61) == dry.wear_multiplier(Compound::Hard, 61));
  }

  SECTION("compounds outside the table throw") {
    REQUIRE_THROWS_AS(dry.cliff_lap(Compound::Wet), InvalidCompound);
    REQUIRE_THROWS_AS(wet.lap_time_delta(Compound::Soft, 3), InvalidCompound);
  }
}
