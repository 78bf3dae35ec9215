#pragma once

#include <stdexcept>// std::invalid_argument

#include <ilp_timecode/ilp_timecode_export.hpp>// ILP_TIMECODE_EXPORT

namespace ilp_timecode {

// The only error kind raised by this library. The message names the offending argument and,
// where it helps, the expected format or range, e.g.
//
//   timecode FF must be in range 00-23: "24"
//
// Hosts decide how to present it; the library itself never logs these.
class ILP_TIMECODE_EXPORT InvalidInput : public std::invalid_argument
{
public:
  using std::invalid_argument::invalid_argument;
};

}// namespace ilp_timecode
