#include <cstring>// std::strcmp
#include <string>// std::string
#include <utility>// std::pair
#include <vector>// std::vector

#include <catch2/catch_test_macros.hpp>

#include "ilp_timecode/log.hpp"

// clang-format off
extern "C" {
#include <libavutil/log.h>// av_log_get_level, av_log_set_level
}
// clang-format on

namespace {

TEST_CASE("LogLevelString")
{
  namespace LogLevel = ilp_timecode::LogLevel;
  REQUIRE(std::strcmp(ilp_timecode::LogLevelString(LogLevel::kError), "ERROR") == 0);
  REQUIRE(std::strcmp(ilp_timecode::LogLevelString(LogLevel::kDebug), "DEBUG") == 0);
  REQUIRE(std::strcmp(ilp_timecode::LogLevelString(12345), "UNKNOWN") == 0);// NOLINT
}

TEST_CASE("Log level and callback")
{
  namespace LogLevel = ilp_timecode::LogLevel;

  const int prev_level = ilp_timecode::GetLogLevel();
  const auto prev_cb = ilp_timecode::GetLogCallback();

  std::vector<std::pair<int, std::string>> msgs;
  ilp_timecode::SetLogCallback([&](int level, const char *s) { msgs.emplace_back(level, s); });

  ilp_timecode::SetLogLevel(LogLevel::kWarning);
  REQUIRE(ilp_timecode::GetLogLevel() == LogLevel::kWarning);

  SECTION("filtered by level")
  {
    ilp_timecode::LogMsg(LogLevel::kError, "error\n");
    ilp_timecode::LogMsg(LogLevel::kWarning, "warning\n");
    ilp_timecode::LogMsg(LogLevel::kInfo, "info\n");
    REQUIRE(msgs.size() == 2);
    REQUIRE(msgs[0].first == LogLevel::kError);
    REQUIRE(msgs[0].second == "error\n");
    REQUIRE(msgs[1].first == LogLevel::kWarning);
  }

  SECTION("enabled levels")
  {
    REQUIRE(ilp_timecode::IsLogLevelEnabled(LogLevel::kError));
    REQUIRE(ilp_timecode::IsLogLevelEnabled(LogLevel::kWarning));
    REQUIRE(!ilp_timecode::IsLogLevelEnabled(LogLevel::kInfo));
  }

  SECTION("empty callback discards")
  {
    ilp_timecode::SetLogCallback(nullptr);
    REQUIRE_NOTHROW(ilp_timecode::LogMsg(LogLevel::kError, "error\n"));
    REQUIRE(msgs.empty());
  }

  ilp_timecode::SetLogCallback(prev_cb);
  ilp_timecode::SetLogLevel(prev_level);
}

TEST_CASE("libavutil log state is left alone")
{
  const int prev_av_level = av_log_get_level();
  const int prev_level = ilp_timecode::GetLogLevel();

  av_log_set_level(AV_LOG_ERROR);
  ilp_timecode::SetLogLevel(ilp_timecode::LogLevel::kTrace);
  REQUIRE(av_log_get_level() == AV_LOG_ERROR);
  REQUIRE(ilp_timecode::GetLogLevel() == ilp_timecode::LogLevel::kTrace);

  av_log_set_level(AV_LOG_QUIET);
  REQUIRE(ilp_timecode::GetLogLevel() == ilp_timecode::LogLevel::kTrace);

  ilp_timecode::SetLogLevel(prev_level);
  av_log_set_level(prev_av_level);
}

}// namespace
