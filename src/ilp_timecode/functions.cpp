#include <ilp_timecode/functions.hpp>

#include <cmath>// std::isfinite, std::floor
#include <exception>// std::exception
#include <sstream>// std::ostringstream
#include <utility>// std::forward

#include <ilp_timecode/boundary.hpp>
#include <ilp_timecode/duration.hpp>
#include <ilp_timecode/error.hpp>
#include <ilp_timecode/frame_index.hpp>
#include <ilp_timecode/log.hpp>
#include <ilp_timecode/standard.hpp>
#include <ilp_timecode/wall_time.hpp>

namespace {

// Rejected input is not an error on our side, the host shows the message to the user.
// We only leave a trace of it at debug level.
void LogRejected(const char *func_name, const char *what) noexcept
{
  if (!ilp_timecode::IsLogLevelEnabled(ilp_timecode::LogLevel::kDebug)) { return; }
  try {
    std::ostringstream oss;
    oss << func_name << ": " << what << '\n';
    ilp_timecode::LogMsg(ilp_timecode::LogLevel::kDebug, oss.str().c_str());
  } catch (const std::exception &) {
    ilp_timecode::LogMsg(ilp_timecode::LogLevel::kError, "Cannot format log message\n");
  }
}

template<typename F> auto Call(const char *func_name, F &&f) -> decltype(f())
{
  try {
    return std::forward<F>(f)();
  } catch (const ilp_timecode::InvalidInput &e) {
    LogRejected(func_name, e.what());
    throw;
  }
}

// Hosts pass numbers as doubles, frame indices must still be integers. Any negative value
// maps to -1, so that the converters report it as negative whatever its magnitude.
[[nodiscard]] auto ToFrameIndex(const double frame_idx, const char *msg) -> int64_t
{
  if (frame_idx < 0) { return -1; }
  if (!std::isfinite(frame_idx) || std::floor(frame_idx) != frame_idx) {
    throw ilp_timecode::InvalidInput{ msg };
  }
  if (frame_idx > static_cast<double>(ilp_timecode::kMaxFrameIndex)) {
    throw ilp_timecode::InvalidInput{ "frameIdx out of range" };
  }
  return static_cast<int64_t>(frame_idx);
}

}// namespace

namespace ilp_timecode {

auto TcError(const TimecodeArg &timecode,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> std::string
{
  try {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    const auto tc = ParseTimecode(timecode);
    ValidateTimecode(timecode, tc, tc_std);
    return {};
  } catch (const InvalidInput &e) {
    return e.what();
  }
}

auto TcToFrameIdx(const TimecodeArg &timecode,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> int64_t
{
  return Call("TC_TO_FRAMEIDX", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    return TimecodeToFrameIndex(ParseValidTimecode(timecode, tc_std), tc_std);
  });
}

auto FrameIdxToTc(const double frame_idx,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> std::string
{
  return Call("FRAMEIDX_TO_TC", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    const auto idx = ToFrameIndex(frame_idx, "frameIdx must be an integer");
    return FormatTimecode(FrameIndexToTimecode(idx, tc_std));
  });
}

auto FrameIdxToWallSecs(const double frame_idx,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> double
{
  return Call("FRAMEIDX_TO_WALL_SECS", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    const auto idx = ToFrameIndex(frame_idx, "frameIdx must be non-negative integer");
    return FrameIndexToWallSeconds(idx, tc_std);
  });
}

auto TcToWallSecs(const TimecodeArg &timecode,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> double
{
  return Call("TC_TO_WALL_SECS", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    const auto idx = TimecodeToFrameIndex(ParseValidTimecode(timecode, tc_std), tc_std);
    return FrameIndexToWallSeconds(idx, tc_std);
  });
}

auto WallSecsBetweenTcs(const TimecodeArg &start,
  const TimecodeArg &end,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> double
{
  return Call("WALL_SECS_BETWEEN_TCS", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    const auto start_tc = ParseValidTimecode(start, tc_std);
    const auto end_tc = ParseValidTimecode(end, tc_std);
    return WallSecondsBetween(start_tc, end_tc, tc_std);
  });
}

auto WallSecsToDurStr(const double wall_secs) -> std::string
{
  return Call("WALL_SECS_TO_DURSTR", [&]() { return WallSecondsToDurationString(wall_secs); });
}

auto WallSecsToFrameIdxLeft(const double wall_secs,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> int64_t
{
  return Call("WALL_SECS_TO_FRAMEIDX_LEFT", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    return WallSecondsToFrameIndex(wall_secs, tc_std, Boundary::kLeft);
  });
}

auto WallSecsToFrameIdxRight(const double wall_secs,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> int64_t
{
  return Call("WALL_SECS_TO_FRAMEIDX_RIGHT", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    return WallSecondsToFrameIndex(wall_secs, tc_std, Boundary::kRight);
  });
}

auto WallSecsToTcLeft(const double wall_secs,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> std::string
{
  return Call("WALL_SECS_TO_TC_LEFT", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    return FormatTimecode(WallSecondsToTimecode(wall_secs, tc_std, Boundary::kLeft));
  });
}

auto WallSecsToTcRight(const double wall_secs,
  const std::string_view frame_rate,
  const std::string_view drop_type) -> std::string
{
  return Call("WALL_SECS_TO_TC_RIGHT", [&]() {
    const auto tc_std = ResolveStandard(frame_rate, drop_type);
    return FormatTimecode(WallSecondsToTimecode(wall_secs, tc_std, Boundary::kRight));
  });
}

}// namespace ilp_timecode
