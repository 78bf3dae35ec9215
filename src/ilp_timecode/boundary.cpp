#include <ilp_timecode/boundary.hpp>

#include <cmath>// std::isfinite, std::floor, std::ceil
#include <sstream>// std::ostringstream
#include <string>// std::string

#include <ilp_timecode/error.hpp>// ilp_timecode::InvalidInput
#include <ilp_timecode/frame_index.hpp>// ilp_timecode::FrameIndexToTimecode, etc.
#include <internal/rational.hpp>

namespace {

[[nodiscard]] auto WallSecsError(const char *what, const double wall_secs) -> std::string
{
  std::ostringstream oss;
  oss << "wallSecs " << what << ": " << wall_secs;
  return oss.str();
}

}// namespace

namespace ilp_timecode {

auto WallSecondsToFractionalFrameIndex(const double wall_secs, const TimecodeStandard &tc_std)
  -> double
{
  if (!std::isfinite(wall_secs)) {
    throw InvalidInput{ WallSecsError("must be a finite number", wall_secs) };
  }
  return rational_internal::SecondsToFrames(wall_secs, rational_internal::FrameRate(tc_std));
}

auto WallSecondsToFrameIndex(const double wall_secs,
  const TimecodeStandard &tc_std,
  const Boundary boundary) -> int64_t
{
  const double frac = WallSecondsToFractionalFrameIndex(wall_secs, tc_std);
  const double rounded = (boundary == Boundary::kLeft) ? std::floor(frac) : std::ceil(frac);

  constexpr auto kMax = static_cast<double>(kMaxFrameIndex);
  if (!(-kMax <= rounded && rounded <= kMax)) {
    throw InvalidInput{ WallSecsError("out of range", wall_secs) };
  }
  return static_cast<int64_t>(rounded);
}

auto WallSecondsToTimecode(const double wall_secs,
  const TimecodeStandard &tc_std,
  const Boundary boundary) -> Timecode
{
  return FrameIndexToTimecode(WallSecondsToFrameIndex(wall_secs, tc_std, boundary), tc_std);
}

}// namespace ilp_timecode
