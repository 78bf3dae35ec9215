#include <ilp_timecode/duration.hpp>

#include <cmath>// std::isfinite, std::round, std::floor
#include <iomanip>// std::setprecision, std::setw, std::setfill
#include <sstream>// std::ostringstream

#include <ilp_timecode/error.hpp>// ilp_timecode::InvalidInput

namespace {

constexpr double kSecsPerMin = 60.0;
constexpr double kSecsPerHr = 60.0 * kSecsPerMin;

}// namespace

namespace ilp_timecode {

auto WallSecondsToDurationString(const double wall_secs) -> std::string
{
  if (!std::isfinite(wall_secs)) { throw InvalidInput{ "wallSecs must be a finite number" }; }

  // Round the magnitude, so that e.g. -0.5 becomes "(-) 01s" and not "00s".
  double secs = std::round(std::fabs(wall_secs));
  const bool negative = wall_secs < 0.0 && secs != 0.0;

  // Keep to doubles, wall_secs may be larger than any integer type.
  const double hh = std::floor(secs / kSecsPerHr);
  secs -= kSecsPerHr * hh;
  const double mm = std::floor(secs / kSecsPerMin);
  secs -= kSecsPerMin * mm;
  const double ss = secs;

  std::ostringstream oss;
  oss << std::fixed << std::setprecision(0) << std::setfill('0');
  if (negative) { oss << "(-) "; }

  // No zero padding for hours.
  if (hh > 0.0) { oss << hh << "h "; }

  // Minutes are zero padded only when preceded by hours.
  if (hh > 0.0 || mm > 0.0) { oss << std::setw(hh > 0.0 ? 2 : 0) << mm << "m "; }

  oss << std::setw(2) << ss << 's';
  return oss.str();
}

}// namespace ilp_timecode
