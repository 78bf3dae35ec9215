#pragma once

namespace IlpTimecode {

// Define the Python bindings in the current boost::python::scope.

// Startup class.
void bindStartup();

// TC_ERROR ... WALL_SECS_TO_TC_RIGHT, supportedFrameRates, setLogLevel and getLogLevel.
// Also registers the translation of ilp_timecode::InvalidInput to ValueError.
void bindFunctions();

}// namespace IlpTimecode
