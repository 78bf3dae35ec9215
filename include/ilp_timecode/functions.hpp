// Host-agnostic function set, one function per spreadsheet function of the TIMECODE
// add-in (name in the comment above each declaration). Inputs and outputs are
// primitives so that a host adapter only needs to marshal values:
//
//   frame_rate: plain text with exactly 2 or 3 digits after the period, e.g. "23.976", "24.00".
//   drop_type:  "drop" or "non-drop".
//   timecode:   "HH:MM:SS:FF" text (';' separators allowed for drop standards), or a packed
//               HHMMSSFF number, e.g. 4332211 is 04:33:22:11.
//
// All functions except TcError throw InvalidInput on bad input.
#pragma once

#include <cstdint>// int64_t
#include <string>// std::string
#include <string_view>// std::string_view

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT
#include <ilp_timecode/timecode.hpp>// ilp_timecode::TimecodeArg

namespace ilp_timecode {

// TC_ERROR: empty string if the timecode is valid in the given standard, otherwise a
// non-empty error message. Never throws InvalidInput.
[[nodiscard]] ILP_TIMECODE_EXPORT auto TcError(const TimecodeArg &timecode,
  std::string_view frame_rate,
  std::string_view drop_type) -> std::string;

// TC_TO_FRAMEIDX: TcToFrameIdx("00:00:01:02", "50.00", "non-drop") == 52
[[nodiscard]] ILP_TIMECODE_EXPORT auto TcToFrameIdx(const TimecodeArg &timecode,
  std::string_view frame_rate,
  std::string_view drop_type) -> int64_t;

// FRAMEIDX_TO_TC: FrameIdxToTc(52, "50.00", "non-drop") == "00:00:01:02"
[[nodiscard]] ILP_TIMECODE_EXPORT auto FrameIdxToTc(double frame_idx,
  std::string_view frame_rate,
  std::string_view drop_type) -> std::string;

// FRAMEIDX_TO_WALL_SECS: FrameIdxToWallSecs(52, "50.00", "non-drop") == 1.04
[[nodiscard]] ILP_TIMECODE_EXPORT auto FrameIdxToWallSecs(double frame_idx,
  std::string_view frame_rate,
  std::string_view drop_type) -> double;

// TC_TO_WALL_SECS: TcToWallSecs("00:00:01:02", "50.00", "non-drop") == 1.04
[[nodiscard]] ILP_TIMECODE_EXPORT auto TcToWallSecs(const TimecodeArg &timecode,
  std::string_view frame_rate,
  std::string_view drop_type) -> double;

// WALL_SECS_BETWEEN_TCS: negative if end is before start.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecsBetweenTcs(const TimecodeArg &start,
  const TimecodeArg &end,
  std::string_view frame_rate,
  std::string_view drop_type) -> double;

// WALL_SECS_TO_DURSTR: WallSecsToDurStr(3765) == "1h 02m 45s"
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecsToDurStr(double wall_secs) -> std::string;

// WALL_SECS_TO_FRAMEIDX_LEFT / _RIGHT: closest frame index <= / >= wall_secs. Negative wall
// times give negative frame indices.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecsToFrameIdxLeft(double wall_secs,
  std::string_view frame_rate,
  std::string_view drop_type) -> int64_t;

[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecsToFrameIdxRight(double wall_secs,
  std::string_view frame_rate,
  std::string_view drop_type) -> int64_t;

// WALL_SECS_TO_TC_LEFT / _RIGHT: timecode of the closest frame <= / >= wall_secs. Negative
// wall times are not supported.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecsToTcLeft(double wall_secs,
  std::string_view frame_rate,
  std::string_view drop_type) -> std::string;

[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecsToTcRight(double wall_secs,
  std::string_view frame_rate,
  std::string_view drop_type) -> std::string;

}// namespace ilp_timecode
