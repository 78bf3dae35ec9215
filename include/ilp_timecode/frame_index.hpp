#pragma once

#include <cstdint>// int64_t

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT
#include <ilp_timecode/standard.hpp>// ilp_timecode::TimecodeStandard
#include <ilp_timecode/timecode.hpp>// ilp_timecode::Timecode

namespace ilp_timecode {

// Largest supported frame index, 2^53. Every index up to here is exact as a double, which is
// how hosts pass numbers around.
constexpr int64_t kMaxFrameIndex = int64_t{ 1 } << 53;

// Frame indices are zero-based, 00:00:00:00 has index 0. Dropped frame numbers are not given
// indices, so in 29.97 drop 00:00:59:29 has index 1799 and 00:01:00:02 has index 1800.
//
// The timecode is assumed to be valid for the standard, see ValidateTimecode.
[[nodiscard]] ILP_TIMECODE_EXPORT auto TimecodeToFrameIndex(const Timecode &tc,
  const TimecodeStandard &tc_std) noexcept -> int64_t;

// Throws InvalidInput if the frame index is negative or larger than kMaxFrameIndex.
[[nodiscard]] ILP_TIMECODE_EXPORT auto FrameIndexToTimecode(int64_t frame_index,
  const TimecodeStandard &tc_std) -> Timecode;

// Number of frame numbers skipped by the standard before reaching the given (non-negative)
// frame index. Always zero for non-drop standards.
[[nodiscard]] ILP_TIMECODE_EXPORT auto FramesDroppedBeforeFrameIndex(int64_t frame_index,
  const TimecodeStandard &tc_std) noexcept -> int64_t;

}// namespace ilp_timecode
