#pragma once

#include <cstdint>// int64_t

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT
#include <ilp_timecode/standard.hpp>// ilp_timecode::TimecodeStandard
#include <ilp_timecode/timecode.hpp>// ilp_timecode::Timecode

namespace ilp_timecode {

// Wall time, in [s], from the origin 00:00:00:00 to the given frame index.
// Throws InvalidInput if the frame index is negative or larger than kMaxFrameIndex.
[[nodiscard]] ILP_TIMECODE_EXPORT auto FrameIndexToWallSeconds(int64_t frame_index,
  const TimecodeStandard &tc_std) -> double;

// Wall time, in [s], from start to end. Negative if end is before start.
// Both timecodes are assumed to be valid for the standard.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecondsBetween(const Timecode &start,
  const Timecode &end,
  const TimecodeStandard &tc_std) noexcept -> double;

}// namespace ilp_timecode
