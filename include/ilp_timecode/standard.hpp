#pragma once

#include <string>// std::string
#include <string_view>// std::string_view
#include <vector>// std::vector

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT

namespace ilp_timecode {

namespace DropType {
  constexpr auto kDrop = std::string_view{ "drop" };
  constexpr auto kNonDrop = std::string_view{ "non-drop" };
}// namespace DropType

// A fully resolved timecode standard. The exact frame rate is frames / per_wall_secs,
// e.g. [30000 / 1001] for 29.97. Never stored as a floating point approximation.
struct TimecodeStandard
{
  int frames = 0;
  int per_wall_secs = 1;

  // Frames per timecode second, i.e. ceil(frames / per_wall_secs). This is the FF field width.
  int int_fps = 0;

  // Zero for non-drop standards. Always a multiple of 9, since a block of frame numbers is
  // dropped at the start of minutes x1, x2, ..., x9.
  int drop_frames_per_10_mins = 0;
};

[[nodiscard]] ILP_TIMECODE_EXPORT constexpr auto IsDropFrame(const TimecodeStandard &tc_std) noexcept
  -> bool
{
  return tc_std.drop_frames_per_10_mins > 0;
}

// E.g. 2 frames (00 and 01) for 29.97 drop, 4 frames for 59.94 drop.
[[nodiscard]] ILP_TIMECODE_EXPORT constexpr auto FramesPerDroppedBlock(
  const TimecodeStandard &tc_std) noexcept -> int
{
  return tc_std.drop_frames_per_10_mins / 9;
}

// Throws InvalidInput if the frame rate label is malformed or unsupported.
ILP_TIMECODE_EXPORT void ValidateFrameRate(std::string_view frame_rate);

// Combines a frame rate label (exactly 2 or 3 digits after the period, e.g. "23.976" or
// "24.00") with a drop type ("drop" or "non-drop", case insensitive). Leading and trailing
// whitespace is ignored for both.
//
// Throws InvalidInput if the label is malformed or unsupported, if the drop type is not
// recognized, or if "drop" is requested for a rate that has no drop frame definition.
[[nodiscard]] ILP_TIMECODE_EXPORT auto ResolveStandard(std::string_view frame_rate,
  std::string_view drop_type) -> TimecodeStandard;

// All accepted frame rate labels, both 2 and 3 digit spellings.
[[nodiscard]] ILP_TIMECODE_EXPORT auto SupportedFrameRates() -> std::vector<std::string>;

// Labels for which "drop" is accepted.
[[nodiscard]] ILP_TIMECODE_EXPORT auto SupportsDropFrame(std::string_view frame_rate) noexcept
  -> bool;

}// namespace ilp_timecode
