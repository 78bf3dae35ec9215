#include <ilp_timecode/log.hpp>

#include <atomic>// std::atomic
#include <mutex>// std::mutex, std::scoped_lock

// The level and callback belong to this library only. libavutil's global av_log state is
// left alone, other FFmpeg users in the same process keep their own logging.

static std::mutex mutex;

static std::atomic<int> IlpLogLevel{ ilp_timecode::LogLevel::kInfo };

// clang-format off
static std::function<void(int, const char *)> IlpLogCallback = 
  [](int /*level*/, const char * /*s*/) noexcept {};
// clang-format on

namespace ilp_timecode {

void SetLogLevel(const int level) noexcept { IlpLogLevel.store(level); }

auto GetLogLevel() noexcept -> int { return IlpLogLevel.load(); }

void SetLogCallback(const std::function<void(int, const char *)> &cb) noexcept
{
  std::scoped_lock lock{ mutex };
  IlpLogCallback = cb;
}

auto GetLogCallback() noexcept -> std::function<void(int, const char *)>
{
  std::scoped_lock lock{ mutex };
  return IlpLogCallback;
}

auto LogLevelString(const int level) noexcept -> const char *
{
  // clang-format off
  switch (level) {
  case LogLevel::kQuiet:   return "QUIET";
  case LogLevel::kPanic:   return "PANIC";
  case LogLevel::kFatal:   return "FATAL";
  case LogLevel::kError:   return "ERROR";
  case LogLevel::kWarning: return "WARNING";
  case LogLevel::kInfo:    return "INFO";
  case LogLevel::kVerbose: return "VERBOSE";
  case LogLevel::kDebug:   return "DEBUG";
  case LogLevel::kTrace:   return "TRACE";
  default:                 return "UNKNOWN";
  }
  // clang-format on
}

auto IsLogLevelEnabled(const int level) noexcept -> bool { return level <= GetLogLevel(); }

void LogMsg(const int level, const char *msg) noexcept
{
  // Filter messages based on log level, we can do this before locking the mutex.
  if (!IsLogLevelEnabled(level)) { return; }
  std::scoped_lock lock{ mutex };
  if (IlpLogCallback) { IlpLogCallback(level, msg); }
}

}// namespace ilp_timecode
