#include <catch2/catch_test_macros.hpp>

#include "ilp_timecode/error.hpp"
#include "ilp_timecode/standard.hpp"

namespace {

TEST_CASE("ResolveStandard")
{
  SECTION("non-drop integer rates")
  {
    const auto s = ilp_timecode::ResolveStandard("24.00", "non-drop");
    REQUIRE(s.frames == 24);
    REQUIRE(s.per_wall_secs == 1);
    REQUIRE(s.int_fps == 24);
    REQUIRE(s.drop_frames_per_10_mins == 0);
  }

  SECTION("ntsc rates")
  {
    const auto s = ilp_timecode::ResolveStandard("23.976", "non-drop");
    REQUIRE(s.frames == 24000);
    REQUIRE(s.per_wall_secs == 1001);
    REQUIRE(s.int_fps == 24);
    REQUIRE(s.drop_frames_per_10_mins == 0);

    const auto s2 = ilp_timecode::ResolveStandard("47.95", "non-drop");
    REQUIRE(s2.frames == 48000);
    REQUIRE(s2.per_wall_secs == 1001);
    REQUIRE(s2.int_fps == 48);
  }

  SECTION("drop")
  {
    const auto s = ilp_timecode::ResolveStandard("29.97", "drop");
    REQUIRE(s.frames == 30000);
    REQUIRE(s.per_wall_secs == 1001);
    REQUIRE(s.int_fps == 30);
    REQUIRE(s.drop_frames_per_10_mins == 18);

    const auto s2 = ilp_timecode::ResolveStandard("59.940", "drop");
    REQUIRE(s2.frames == 60000);
    REQUIRE(s2.int_fps == 60);
    REQUIRE(s2.drop_frames_per_10_mins == 36);
  }

  SECTION("whitespace and case")
  {
    const auto s = ilp_timecode::ResolveStandard("  29.970 ", " DROP\t");
    REQUIRE(s.drop_frames_per_10_mins == 18);

    const auto s2 = ilp_timecode::ResolveStandard("25.00", "Non-Drop");
    REQUIRE(s2.int_fps == 25);
    REQUIRE(!ilp_timecode::IsDropFrame(s2));
  }

  SECTION("2 and 3 digit spellings are the same standard")
  {
    const auto a = ilp_timecode::ResolveStandard("59.94", "non-drop");
    const auto b = ilp_timecode::ResolveStandard("59.940", "non-drop");
    REQUIRE(a.frames == b.frames);
    REQUIRE(a.per_wall_secs == b.per_wall_secs);
    REQUIRE(a.int_fps == b.int_fps);
  }
}

TEST_CASE("ResolveStandard rejects bad frame rates")
{
  using ilp_timecode::InvalidInput;
  using ilp_timecode::ResolveStandard;

  const char *kFormatMsg =
    R"(frameRate must contain 2 or 3 digits after period (e.g. "23.976" or "24.00"))";

  REQUIRE_THROWS_WITH(ResolveStandard("24", "non-drop"), kFormatMsg);
  REQUIRE_THROWS_WITH(ResolveStandard("24.0", "non-drop"), kFormatMsg);
  REQUIRE_THROWS_WITH(ResolveStandard("24.0000", "non-drop"), kFormatMsg);
  REQUIRE_THROWS_WITH(ResolveStandard("24,00", "non-drop"), kFormatMsg);
  REQUIRE_THROWS_WITH(ResolveStandard("2a.00", "non-drop"), kFormatMsg);
  REQUIRE_THROWS_WITH(ResolveStandard("", "non-drop"), kFormatMsg);

  REQUIRE_THROWS_WITH(ResolveStandard("12.34", "non-drop"), R"(Unsupported frame rate: "12.34")");
  REQUIRE_THROWS_AS(ResolveStandard("29.976", "non-drop"), InvalidInput);
}

TEST_CASE("ValidateFrameRate")
{
  using ilp_timecode::ValidateFrameRate;

  REQUIRE_NOTHROW(ValidateFrameRate("23.976"));
  REQUIRE_NOTHROW(ValidateFrameRate(" 59.94 "));
  REQUIRE_THROWS_WITH(ValidateFrameRate("24"),
    R"(frameRate must contain 2 or 3 digits after period (e.g. "23.976" or "24.00"))");
  REQUIRE_THROWS_WITH(ValidateFrameRate("12.34"), R"(Unsupported frame rate: "12.34")");
}

TEST_CASE("ResolveStandard rejects bad drop types")
{
  using ilp_timecode::ResolveStandard;

  const char *kDropMsg = R"(dropType value must be "non-drop" or "drop" (without quotes))";
  REQUIRE_THROWS_WITH(ResolveStandard("24.00", "nondrop"), kDropMsg);
  REQUIRE_THROWS_WITH(ResolveStandard("24.00", "df"), kDropMsg);
  REQUIRE_THROWS_WITH(ResolveStandard("24.00", ""), kDropMsg);

  REQUIRE_THROWS_WITH(ResolveStandard("24.00", "drop"), "frameRate 24.00 must be non-drop");
  REQUIRE_THROWS_WITH(ResolveStandard("23.976", "drop"), "frameRate 23.976 must be non-drop");
  REQUIRE_THROWS_WITH(ResolveStandard("30.00", "drop"), "frameRate 30.00 must be non-drop");
}

TEST_CASE("SupportedFrameRates")
{
  const auto labels = ilp_timecode::SupportedFrameRates();
  REQUIRE(labels.size() == 20);

  int drop_count = 0;
  for (auto &&label : labels) {
    const auto s = ilp_timecode::ResolveStandard(label, "non-drop");
    REQUIRE(s.int_fps * s.per_wall_secs >= s.frames);
    REQUIRE((s.int_fps - 1) * s.per_wall_secs < s.frames);

    if (ilp_timecode::SupportsDropFrame(label)) {
      ++drop_count;
      const auto d = ilp_timecode::ResolveStandard(label, "drop");
      REQUIRE(d.drop_frames_per_10_mins % 9 == 0);
      REQUIRE(ilp_timecode::FramesPerDroppedBlock(d) > 0);
    } else {
      REQUIRE_THROWS_AS(
        ilp_timecode::ResolveStandard(label, "drop"), ilp_timecode::InvalidInput);
    }
  }
  REQUIRE(drop_count == 4);
}

}// namespace
