#include "ilp_timecode_module/bindings.hpp"

#include <cstdint>// int64_t
#include <string>// std::string

#include <boost/python.hpp>

#include "ilp_timecode/error.hpp"
#include "ilp_timecode/functions.hpp"
#include "ilp_timecode/log.hpp"
#include "ilp_timecode/standard.hpp"
#include "ilp_timecode_module/startup.hpp"

using namespace boost::python;

namespace {

// Host values are marshalled here, so that the library only ever sees text and numbers.

[[nodiscard]] auto IsNumber(const object &o) noexcept -> bool
{
  // bool is an int subclass in Python, but TRUE is not a timecode.
  return !PyBool_Check(o.ptr()) && (PyLong_Check(o.ptr()) || PyFloat_Check(o.ptr()));
}

[[nodiscard]] auto ToText(const object &o, const char *msg) -> std::string
{
  if (!PyUnicode_Check(o.ptr())) { throw ilp_timecode::InvalidInput{ msg }; }
  return extract<std::string>(o);
}

[[nodiscard]] auto ToNumber(const object &o, const char *msg) -> double
{
  if (!IsNumber(o)) { throw ilp_timecode::InvalidInput{ msg }; }
  return extract<double>(o);
}

[[nodiscard]] auto ToTimecodeArg(const object &o) -> ilp_timecode::TimecodeArg
{
  if (PyUnicode_Check(o.ptr())) { return ilp_timecode::TimecodeArg{ extract<std::string>(o)() }; }
  if (IsNumber(o)) { return ilp_timecode::TimecodeArg{ extract<double>(o)() }; }
  throw ilp_timecode::InvalidInput{
    "timecode must be a single plain text value or custom format number"
  };
}

[[nodiscard]] auto WallSecs(const object &o) -> double
{
  return ToNumber(o, "wallSecs must be a finite number");
}

struct StandardArgs
{
  std::string frame_rate = {};
  std::string drop_type = {};
};

// Fails in the same order as the library resolves a standard: frame rate kind, frame rate
// label, drop type kind, drop type value. Other arguments are marshalled afterwards.
[[nodiscard]] auto ToStandardArgs(const object &frame_rate, const object &drop_type)
  -> StandardArgs
{
  StandardArgs args = {};
  args.frame_rate = ToText(frame_rate, "frameRate must be a single plain text value");
  ilp_timecode::ValidateFrameRate(args.frame_rate);
  args.drop_type = ToText(drop_type, "dropType must be a single plain text value");
  [[maybe_unused]] const auto tc_std =
    ilp_timecode::ResolveStandard(args.frame_rate, args.drop_type);
  return args;
}

auto TC_ERROR(const object &timecode, const object &frame_rate, const object &drop_type)
  -> std::string
{
  try {
    const auto args = ToStandardArgs(frame_rate, drop_type);
    return ilp_timecode::TcError(ToTimecodeArg(timecode), args.frame_rate, args.drop_type);
  } catch (const ilp_timecode::InvalidInput &e) {
    // Marshalling failed, still an error string and not an exception.
    return e.what();
  }
}

auto TC_TO_FRAMEIDX(const object &timecode, const object &frame_rate, const object &drop_type)
  -> int64_t
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::TcToFrameIdx(ToTimecodeArg(timecode), args.frame_rate, args.drop_type);
}

auto FRAMEIDX_TO_TC(const object &frame_idx, const object &frame_rate, const object &drop_type)
  -> std::string
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::FrameIdxToTc(
    ToNumber(frame_idx, "frameIdx must be an integer"), args.frame_rate, args.drop_type);
}

auto FRAMEIDX_TO_WALL_SECS(const object &frame_idx,
  const object &frame_rate,
  const object &drop_type) -> double
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::FrameIdxToWallSecs(
    ToNumber(frame_idx, "frameIdx must be non-negative integer"), args.frame_rate, args.drop_type);
}

auto TC_TO_WALL_SECS(const object &timecode, const object &frame_rate, const object &drop_type)
  -> double
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::TcToWallSecs(ToTimecodeArg(timecode), args.frame_rate, args.drop_type);
}

auto WALL_SECS_BETWEEN_TCS(const object &start,
  const object &end,
  const object &frame_rate,
  const object &drop_type) -> double
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  const auto start_tc = ToTimecodeArg(start);
  const auto end_tc = ToTimecodeArg(end);
  return ilp_timecode::WallSecsBetweenTcs(start_tc, end_tc, args.frame_rate, args.drop_type);
}

auto WALL_SECS_TO_DURSTR(const object &wall_secs) -> std::string
{
  return ilp_timecode::WallSecsToDurStr(WallSecs(wall_secs));
}

auto WALL_SECS_TO_FRAMEIDX_LEFT(const object &wall_secs,
  const object &frame_rate,
  const object &drop_type) -> int64_t
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::WallSecsToFrameIdxLeft(
    WallSecs(wall_secs), args.frame_rate, args.drop_type);
}

auto WALL_SECS_TO_FRAMEIDX_RIGHT(const object &wall_secs,
  const object &frame_rate,
  const object &drop_type) -> int64_t
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::WallSecsToFrameIdxRight(
    WallSecs(wall_secs), args.frame_rate, args.drop_type);
}

auto WALL_SECS_TO_TC_LEFT(const object &wall_secs,
  const object &frame_rate,
  const object &drop_type) -> std::string
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::WallSecsToTcLeft(WallSecs(wall_secs), args.frame_rate, args.drop_type);
}

auto WALL_SECS_TO_TC_RIGHT(const object &wall_secs,
  const object &frame_rate,
  const object &drop_type) -> std::string
{
  const auto args = ToStandardArgs(frame_rate, drop_type);
  return ilp_timecode::WallSecsToTcRight(WallSecs(wall_secs), args.frame_rate, args.drop_type);
}

auto supportedFrameRates() -> boost::python::list
{
  boost::python::list result;
  for (auto &&s : ilp_timecode::SupportedFrameRates()) { result.append(s); }
  return result;
}

void setLogLevel(const int level) { ilp_timecode::SetLogLevel(level); }

auto getLogLevel() -> int { return ilp_timecode::GetLogLevel(); }

void translateInvalidInput(const ilp_timecode::InvalidInput &e)
{
  PyErr_SetString(PyExc_ValueError, e.what());
}

}// namespace

namespace IlpTimecode {

void bindStartup()
{
  // clang-format off

  class_<Startup>("Startup", init<>())
    .def("initLog", &Startup::initLog, (arg("level")))
    .staticmethod("initLog")
  ;

  // clang-format on
}

void bindFunctions()
{
  register_exception_translator<ilp_timecode::InvalidInput>(&translateInvalidInput);

  def("supportedFrameRates", &supportedFrameRates);
  def("setLogLevel", &setLogLevel, (arg("level")));
  def("getLogLevel", &getLogLevel);

  // clang-format off
  def("TC_ERROR",                    &TC_ERROR,                    (arg("timecode"), arg("frameRate"), arg("dropType")));
  def("TC_TO_FRAMEIDX",              &TC_TO_FRAMEIDX,              (arg("timecode"), arg("frameRate"), arg("dropType")));
  def("FRAMEIDX_TO_TC",              &FRAMEIDX_TO_TC,              (arg("frameIdx"), arg("frameRate"), arg("dropType")));
  def("FRAMEIDX_TO_WALL_SECS",       &FRAMEIDX_TO_WALL_SECS,       (arg("frameIdx"), arg("frameRate"), arg("dropType")));
  def("TC_TO_WALL_SECS",             &TC_TO_WALL_SECS,             (arg("timecode"), arg("frameRate"), arg("dropType")));
  def("WALL_SECS_BETWEEN_TCS",       &WALL_SECS_BETWEEN_TCS,       (arg("start"), arg("end"), arg("frameRate"), arg("dropType")));
  def("WALL_SECS_TO_DURSTR",         &WALL_SECS_TO_DURSTR,         (arg("wallSecs")));
  def("WALL_SECS_TO_FRAMEIDX_LEFT",  &WALL_SECS_TO_FRAMEIDX_LEFT,  (arg("wallSecs"), arg("frameRate"), arg("dropType")));
  def("WALL_SECS_TO_FRAMEIDX_RIGHT", &WALL_SECS_TO_FRAMEIDX_RIGHT, (arg("wallSecs"), arg("frameRate"), arg("dropType")));
  def("WALL_SECS_TO_TC_LEFT",        &WALL_SECS_TO_TC_LEFT,        (arg("wallSecs"), arg("frameRate"), arg("dropType")));
  def("WALL_SECS_TO_TC_RIGHT",       &WALL_SECS_TO_TC_RIGHT,       (arg("wallSecs"), arg("frameRate"), arg("dropType")));
  // clang-format on
}

}// namespace IlpTimecode
