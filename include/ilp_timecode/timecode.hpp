#pragma once

#include <string>// std::string
#include <variant>// std::variant

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT
#include <ilp_timecode/standard.hpp>// ilp_timecode::TimecodeStandard

namespace ilp_timecode {

// HH:MM:SS:FF. Whether a timecode is valid depends on the standard it is used with.
struct Timecode
{
  int hh = 0;
  int mm = 0;
  int ss = 0;
  int ff = 0;
};

[[nodiscard]] ILP_TIMECODE_EXPORT constexpr auto operator==(const Timecode &lhs,
  const Timecode &rhs) noexcept -> bool
{
  return lhs.hh == rhs.hh && lhs.mm == rhs.mm && lhs.ss == rhs.ss && lhs.ff == rhs.ff;
}

[[nodiscard]] ILP_TIMECODE_EXPORT constexpr auto operator!=(const Timecode &lhs,
  const Timecode &rhs) noexcept -> bool
{
  return !(lhs == rhs);
}

// Raw timecode as handed over by a host: either text, "HH:MM:SS:FF" where each separator may
// also be ';', or a number holding packed HHMMSSFF digits (e.g. 4332211 is 04:33:22:11).
using TimecodeArg = std::variant<std::string, double>;

// Throws InvalidInput if the text does not have the HH:MM:SS:FF shape, or if the number is not
// an integer in [0, 99999999]. No range checks are done on the fields here.
[[nodiscard]] ILP_TIMECODE_EXPORT auto ParseTimecode(const TimecodeArg &raw) -> Timecode;

// Throws InvalidInput if MM, SS or FF are out of range for the standard, if the timecode is
// a dropped frame number, or if the raw text uses ';' separators with a non-drop standard.
// HH is not checked.
ILP_TIMECODE_EXPORT void ValidateTimecode(const TimecodeArg &raw,
  const Timecode &tc,
  const TimecodeStandard &tc_std);

// Parse followed by validate.
[[nodiscard]] ILP_TIMECODE_EXPORT auto ParseValidTimecode(const TimecodeArg &raw,
  const TimecodeStandard &tc_std) -> Timecode;

// True if the frame number is skipped by the (drop frame) standard, e.g. 00:01:00:00 and
// 00:01:00:01 for 29.97 drop.
[[nodiscard]] ILP_TIMECODE_EXPORT constexpr auto IsDroppedFrame(const Timecode &tc,
  const TimecodeStandard &tc_std) noexcept -> bool
{
  // A block is dropped from the first second (SS=00) of each minute not divisible by 10.
  const bool drop_sec = IsDropFrame(tc_std) && tc.ss == 0 && (tc.mm % 10) != 0;
  return drop_sec && tc.ff < FramesPerDroppedBlock(tc_std);
}

// Always "HH:MM:SS:FF" with colon separators, also for drop frame standards.
[[nodiscard]] ILP_TIMECODE_EXPORT auto FormatTimecode(const Timecode &tc) -> std::string;

}// namespace ilp_timecode
