#include <limits>// std::numeric_limits

#include <catch2/catch_test_macros.hpp>

#include "ilp_timecode/duration.hpp"
#include "ilp_timecode/error.hpp"

namespace {

TEST_CASE("WallSecondsToDurationString")
{
  using ilp_timecode::WallSecondsToDurationString;

  REQUIRE(WallSecondsToDurationString(3765.0) == "1h 02m 45s");
  REQUIRE(WallSecondsToDurationString(4994.5) == "1h 23m 15s");
  REQUIRE(WallSecondsToDurationString(3600.0) == "1h 00m 00s");
  REQUIRE(WallSecondsToDurationString(36005.0) == "10h 00m 05s");
  REQUIRE(WallSecondsToDurationString(65.0) == "1m 05s");
  REQUIRE(WallSecondsToDurationString(600.0) == "10m 00s");
  REQUIRE(WallSecondsToDurationString(5.0) == "05s");
  REQUIRE(WallSecondsToDurationString(0.0) == "00s");

  SECTION("rounding")
  {
    REQUIRE(WallSecondsToDurationString(59.5) == "1m 00s");
    REQUIRE(WallSecondsToDurationString(59.49) == "59s");
    REQUIRE(WallSecondsToDurationString(0.49) == "00s");
  }

  SECTION("negative")
  {
    REQUIRE(WallSecondsToDurationString(-65.0) == "(-) 1m 05s");
    REQUIRE(WallSecondsToDurationString(-3765.0) == "(-) 1h 02m 45s");
    REQUIRE(WallSecondsToDurationString(-0.5) == "(-) 01s");

    // Rounds to zero, no sign.
    REQUIRE(WallSecondsToDurationString(-0.4) == "00s");
  }

  SECTION("fail")
  {
    REQUIRE_THROWS_WITH(WallSecondsToDurationString(std::numeric_limits<double>::quiet_NaN()),
      "wallSecs must be a finite number");
    REQUIRE_THROWS_AS(WallSecondsToDurationString(std::numeric_limits<double>::infinity()),
      ilp_timecode::InvalidInput);
  }
}

}// namespace
