#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include <pitwall/csv.hpp>

using Catch::Approx;
using namespace pitwall;

TEST_CASE("csv::to_int parses whole fields only") {
  bool ok = false;
  REQUIRE(csv::to_int("57", ok) == 57);
  REQUIRE(ok);
  REQUIRE(csv::to_int("-3", ok) == -3);
  REQUIRE(ok);

  csv::to_int("12x", ok);
  REQUIRE_FALSE(ok);
  csv::to_int("", ok);
  REQUIRE_FALSE(ok);
  csv::to_int("laps", ok);
  REQUIRE_FALSE(ok);
}

TEST_CASE("csv::to_int rejects values outside int") {
  bool ok = true;
  csv::to_int("99999999999", ok);
  REQUIRE_FALSE(ok);
  csv::to_int("-99999999999", ok);
  REQUIRE_FALSE(ok);
}

TEST_CASE("csv::to_double") {
  bool ok = false;
  REQUIRE(csv::to_double("0.25", ok) == Approx(0.25));
  REQUIRE(ok);
  csv::to_double("1e999", ok);
  REQUIRE_FALSE(ok);
  csv::to_double("0.5s", ok);
  REQUIRE_FALSE(ok);
}

TEST_CASE("csv::split_line trims each column") {
  const std::vector<std::string> cols = csv::split_line(" SOFT , 91.0,,3 ");
  REQUIRE(cols.size() == 4);
  REQUIRE(cols[0] == "SOFT");
  REQUIRE(cols[1] == "91.0");
  REQUIRE(cols[2].empty());
  REQUIRE(cols[3] == "3");
  REQUIRE(csv::trim("\t x \n") == "x");
  REQUIRE(csv::is_skippable(""));
  REQUIRE(csv::is_skippable("# note"));
  REQUIRE_FALSE(csv::is_skippable("Bahrain,57"));
}
