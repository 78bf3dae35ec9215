#include <ilp_timecode/wall_time.hpp>

#include <ilp_timecode/error.hpp>// ilp_timecode::InvalidInput
#include <ilp_timecode/frame_index.hpp>// ilp_timecode::TimecodeToFrameIndex, etc.
#include <internal/rational.hpp>

namespace ilp_timecode {

auto FrameIndexToWallSeconds(const int64_t frame_index, const TimecodeStandard &tc_std) -> double
{
  if (frame_index < 0) { throw InvalidInput{ "frameIdx must be non-negative integer" }; }
  if (frame_index > kMaxFrameIndex) { throw InvalidInput{ "frameIdx out of range" }; }
  return rational_internal::FramesToSeconds(frame_index, rational_internal::FrameRate(tc_std));
}

auto WallSecondsBetween(const Timecode &start,
  const Timecode &end,
  const TimecodeStandard &tc_std) noexcept -> double
{
  const int64_t start_index = TimecodeToFrameIndex(start, tc_std);
  const int64_t end_index = TimecodeToFrameIndex(end, tc_std);
  return rational_internal::FramesToSeconds(
    end_index - start_index, rational_internal::FrameRate(tc_std));
}

}// namespace ilp_timecode
