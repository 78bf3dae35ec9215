#pragma once

#include <cstdint>// int64_t

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT
#include <ilp_timecode/standard.hpp>// ilp_timecode::TimecodeStandard
#include <ilp_timecode/timecode.hpp>// ilp_timecode::Timecode

namespace ilp_timecode {

enum class Boundary : int {
  kLeft,// Closest frame at or before the wall time.
  kRight,// Closest frame at or after the wall time.
};

// Throws InvalidInput if wall_secs is not finite. Negative wall times give negative
// fractional frame indices.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecondsToFractionalFrameIndex(double wall_secs,
  const TimecodeStandard &tc_std) -> double;

// Floor (left) or ceiling (right) of the fractional frame index. May be negative.
// Throws InvalidInput if wall_secs is not finite or the index magnitude exceeds kMaxFrameIndex.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecondsToFrameIndex(double wall_secs,
  const TimecodeStandard &tc_std,
  Boundary boundary) -> int64_t;

// Negative wall times are NOT supported here, since there are no negative timecodes.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecondsToTimecode(double wall_secs,
  const TimecodeStandard &tc_std,
  Boundary boundary) -> Timecode;

}// namespace ilp_timecode
