#include <string>// std::string

#include <boost/python.hpp>

#include <ilp_timecode_module/bindings.hpp>

#include <internal_use_only/config.hpp>

using namespace boost::python;

BOOST_PYTHON_MODULE(_IlpTimecode)// NOLINT
{
  scope().attr("__version__") = std::string{ ilp_timecode::cmake::project_version };

  IlpTimecode::bindStartup();
  IlpTimecode::bindFunctions();
}
