#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>

#include <pitwall/log.hpp>

using namespace pitwall;

TEST_CASE("Logger filters by level") {
  std::ostringstream out;
  Logger log(out, LogLevel::Info);

  log.debug("hidden ", 1);
  log.info("lap ", 12, ": pit");
  log.warn("careful");
  REQUIRE(out.str() == "[pitwall][INFO] lap 12: pit\n[pitwall][WARN] careful\n");

  out.str("");
  log.set_level(LogLevel::Off);
  log.error("nothing");
  REQUIRE(out.str().empty());
}

TEST_CASE("default Logger is silent") {
  Logger log;
  REQUIRE_FALSE(log.enabled(LogLevel::Error));
  log.error("dropped"); // must not crash
}

TEST_CASE("log_level_from_string") {
  REQUIRE(log_level_from_string("DEBUG") == LogLevel::Debug);
  REQUIRE(log_level_from_string("warning") == LogLevel::Warn);
  REQUIRE_FALSE(log_level_from_string("loud").has_value());
}
