// Rationale:
//
// t = f * (fr.den / fr.num)   <=>   f = t * (fr.num / fr.den)
//
// where f is the frame index, t is wall time in seconds and fr is the exact frame rate
// (frames / second, e.g. [30000 / 1001]). Both num and den are small integers, so multiplying
// before dividing keeps the result exact up to the precision of a double.
#pragma once

#include <cstdint>// int64_t

#include <ilp_timecode/standard.hpp>// ilp_timecode::TimecodeStandard

// clang-format off
extern "C" {
#include <libavutil/rational.h>// AVRational
}
// clang-format on

namespace rational_internal {

[[nodiscard]] inline auto FrameRate(const ilp_timecode::TimecodeStandard &tc_std) noexcept
  -> AVRational
{
  return AVRational{ tc_std.frames, tc_std.per_wall_secs };
}

// Assumes |frames * fr.den| fits in 64 bits.
[[nodiscard]] inline auto FramesToSeconds(const int64_t frames, const AVRational &fr) noexcept
  -> double
{
  return static_cast<double>(frames * fr.den) / fr.num;
}

[[nodiscard]] inline auto SecondsToFrames(const double secs, const AVRational &fr) noexcept
  -> double
{
  return secs * fr.num / fr.den;
}

}// namespace rational_internal
