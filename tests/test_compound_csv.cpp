#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <sstream>
#include <string>

#include <pitwall/compound.hpp>
#include <pitwall/errors.hpp>

using Catch::Approx;
using namespace pitwall;

static std::string csv_full = R"(compound,base_lap_s,wear_start_s,wear_end_s,cliff_lap,cliff_penalty_s,cliff_growth
HARD,98.0,0.03,0.07,55,5.0,1.06
soft,96.5,0.05,0.22,22,7.0,1.10
)";

static std::string csv_with_noise = R"(# five-column rows use default cliff constants
 Medium , 97.5 , 0.04 , 0.11 , 38
S, 96.0, 0.05, 0.20, 0
H, 98.0, 0.08, 0.03, 50
PURPLE, 95.0, 0.01, 0.02, 10
M, 97.0, 0.04, 0.11, 38
W, 108.0, 0.03, 0.10, 40, 6.0, 1.0
I, 104.0, 0.05, 0.15, 30, 6.0, 1.1
)";

TEST_CASE("compound_table_from_csv_stream parses valid rows") {
  std::istringstream ss(csv_full);
  auto t = compound_table_from_csv_stream(ss);
  REQUIRE(t.size() == 2);
  // sorted by compound
  REQUIRE(t[0].compound == Compound::Soft);
  REQUIRE(t[1].compound == Compound::Hard);
  REQUIRE(t[0].cliff_lap == 22);
  REQUIRE(t[0].cliff_growth == Approx(1.10));
  REQUIRE(t[1].cliff_penalty_s == Approx(5.0));
}

TEST_CASE("compound_table_from_csv_stream skips bad rows") {
  std::istringstream ss(csv_with_noise);
  auto t = compound_table_from_csv_stream(ss);
  REQUIRE(t.size() == 2);
  auto med = compound_params_in(t, Compound::Medium);
  REQUIRE(med.has_value());
  REQUIRE(med->base_lap_s == Approx(97.5)); // first row wins
  REQUIRE(med->cliff_penalty_s == Approx(6.0));
  REQUIRE(table_has(t, Compound::Intermediate));
  REQUIRE_FALSE(table_has(t, Compound::Soft));
  REQUIRE_FALSE(table_has(t, Compound::Hard));
  REQUIRE_FALSE(table_has(t, Compound::Wet));
}

TEST_CASE("load_compound_table_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_compound_table_csv("no_such_compounds.csv").has_value());
}

TEST_CASE("compound names") {
  REQUIRE(parse_compound("soft") == Compound::Soft);
  REQUIRE(parse_compound(" H ") == Compound::Hard);
  REQUIRE(compound_from_string("inter") == Compound::Intermediate);
  REQUIRE(std::string(to_string(Compound::Wet)) == "WET");
  REQUIRE_THROWS_AS(parse_compound("hypersoft"), InvalidCompound);
  REQUIRE_THROWS_AS(require_compound(dry_compound_table(), Compound::Wet), InvalidCompound);
}
