#pragma once

#include <string>// std::string

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT

namespace ilp_timecode {

// Human-readable duration, rounded to the nearest whole second (0.5 rounds up). Examples:
//
//   3765   -> "1h 02m 45s"
//   4994.5 -> "1h 23m 15s"
//   65     -> "1m 05s"
//   5      -> "05s"
//   -65    -> "(-) 1m 05s"
//
// Throws InvalidInput if wall_secs is not finite.
[[nodiscard]] ILP_TIMECODE_EXPORT auto WallSecondsToDurationString(double wall_secs)
  -> std::string;

}// namespace ilp_timecode
