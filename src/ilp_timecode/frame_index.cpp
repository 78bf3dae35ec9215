#include <ilp_timecode/frame_index.hpp>

#include <limits>// std::numeric_limits

#include <ilp_timecode/error.hpp>// ilp_timecode::InvalidInput

namespace {

constexpr int64_t kMinsPerHr = 60;
constexpr int64_t kSecsPerMin = 60;
constexpr int64_t k10MinBlocksPerHr = kMinsPerHr / 10;

}// namespace

namespace ilp_timecode {

auto TimecodeToFrameIndex(const Timecode &tc, const TimecodeStandard &tc_std) noexcept -> int64_t
{
  // Calculate first ignoring dropped frames.
  const int64_t total_mins = kMinsPerHr * tc.hh + tc.mm;
  const int64_t total_secs = kSecsPerMin * total_mins + tc.ss;
  int64_t frame_index = tc_std.int_fps * total_secs + tc.ff;

  if (IsDropFrame(tc_std)) {
    const int64_t drop_per_10_mins = tc_std.drop_frames_per_10_mins;

    // Dropped through the start of HH.
    frame_index -= tc.hh * k10MinBlocksPerHr * drop_per_10_mins;

    // Dropped from the start of HH to the start of this 10 minute block.
    frame_index -= (tc.mm / 10) * drop_per_10_mins;

    // Dropped since the start of this 10 minute block (none in minute x0).
    frame_index -= (tc.mm % 10) * static_cast<int64_t>(FramesPerDroppedBlock(tc_std));
  }

  return frame_index;
}

auto FramesDroppedBeforeFrameIndex(const int64_t frame_index,
  const TimecodeStandard &tc_std) noexcept -> int64_t
{
  if (!IsDropFrame(tc_std)) { return 0; }

  const int64_t frames_per_non_drop_min = tc_std.int_fps * kSecsPerMin;
  const int64_t frames_per_dropped_block = FramesPerDroppedBlock(tc_std);
  const int64_t frames_per_drop_min = frames_per_non_drop_min - frames_per_dropped_block;

  // Complete blocks of 10 minutes (of timecode, not wall time).
  const int64_t frames_per_10_mins = 10 * frames_per_non_drop_min - tc_std.drop_frames_per_10_mins;
  const int64_t complete_10_min_blocks = frame_index / frames_per_10_mins;
  int64_t frames_remaining = frame_index - complete_10_min_blocks * frames_per_10_mins;

  int64_t dropped = complete_10_min_blocks * tc_std.drop_frames_per_10_mins;

  if (frames_remaining >= frames_per_non_drop_min) {
    // The first minute of a 10 minute block has no dropped frames.
    frames_remaining -= frames_per_non_drop_min;

    // Each complete drop minute, plus the current one, dropped a block.
    const int64_t complete_drop_mins = frames_remaining / frames_per_drop_min;
    dropped += (complete_drop_mins + 1) * frames_per_dropped_block;
  }

  return dropped;
}

auto FrameIndexToTimecode(const int64_t frame_index, const TimecodeStandard &tc_std) -> Timecode
{
  if (frame_index < 0) { throw InvalidInput{ "negative timecode values are not supported" }; }
  if (frame_index > kMaxFrameIndex) { throw InvalidInput{ "frameIdx out of range" }; }

  const int64_t frames_per_min = tc_std.int_fps * kSecsPerMin;
  const int64_t frames_per_hr = frames_per_min * kMinsPerHr;

  int64_t frames_remaining = frame_index + FramesDroppedBeforeFrameIndex(frame_index, tc_std);

  const int64_t hh = frames_remaining / frames_per_hr;
  if (hh > std::numeric_limits<int>::max()) { throw InvalidInput{ "frameIdx out of range" }; }
  frames_remaining -= hh * frames_per_hr;

  const int64_t mm = frames_remaining / frames_per_min;
  frames_remaining -= mm * frames_per_min;

  const int64_t ss = frames_remaining / tc_std.int_fps;
  frames_remaining -= ss * tc_std.int_fps;

  Timecode tc = {};
  tc.hh = static_cast<int>(hh);
  tc.mm = static_cast<int>(mm);
  tc.ss = static_cast<int>(ss);
  tc.ff = static_cast<int>(frames_remaining);
  return tc;
}

}// namespace ilp_timecode
