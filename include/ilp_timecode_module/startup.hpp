#pragma once

namespace IlpTimecode {

class Startup
{
public:
  // Set the ilp_timecode log level and forward its log messages to the Python logging module
  // (logger "ilp_timecode"). The forwarding is installed by the first call, later calls only
  // change the level.
  static void initLog(int level);
};

}// namespace IlpTimecode
