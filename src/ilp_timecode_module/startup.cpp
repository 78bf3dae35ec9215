#include "ilp_timecode_module/startup.hpp"

#include <mutex>// std::call_once, etc.
#include <string>// std::string

#include <boost/python.hpp>

#include "ilp_timecode/log.hpp"// ilp_timecode::SetLogLevel, ilp_timecode::SetLogCallback

static std::once_flag initLogFlag;

namespace {

// Levels of the Python logging module.
namespace PyLogLevel {
  constexpr int kDebug = 10;
  constexpr int kInfo = 20;
  constexpr int kWarning = 30;
  constexpr int kError = 40;
  constexpr int kCritical = 50;
}// namespace PyLogLevel

}// namespace

namespace IlpTimecode {

void Startup::initLog(const int level)
{
  namespace LogLevel = ilp_timecode::LogLevel;

  ilp_timecode::SetLogLevel(level);

  // Initialize logging so that Python picks up log messages from the ilp_timecode function calls.
  std::call_once(initLogFlag, []() {
    ilp_timecode::SetLogCallback([](int msg_level, const char *s) {
      auto py_level = 0;
      // clang-format off
      switch (msg_level) {
      case LogLevel::kPanic:
      case LogLevel::kFatal:
        py_level = PyLogLevel::kCritical; break;
      case LogLevel::kError:
        py_level = PyLogLevel::kError; break;
      case LogLevel::kWarning:
        py_level = PyLogLevel::kWarning; break;
      case LogLevel::kInfo:
      case LogLevel::kVerbose:
        py_level = PyLogLevel::kInfo; break;
      case LogLevel::kDebug:
      case LogLevel::kTrace:
        py_level = PyLogLevel::kDebug; break;
      case LogLevel::kQuiet:
      default:
        return;
      }
      // clang-format on

      // Remove trailing newline character since the Python logger will add one.
      auto str = std::string{ s };
      if (!str.empty() && *str.rbegin() == '\n') { str.erase(str.length() - 1); }

      // Messages may come from any thread.
      const PyGILState_STATE gil = PyGILState_Ensure();
      try {
        namespace bp = boost::python;
        const bp::object logging = bp::import("logging");
        logging.attr("getLogger")("ilp_timecode").attr("log")(py_level, str);
      } catch (const boost::python::error_already_set &) {
        // Report to sys.stderr, we cannot raise from here.
        PyErr_Print();
      }
      PyGILState_Release(gil);
    });
  });
}

}// namespace IlpTimecode
