#pragma once

#include <cpp-zmq-plugin/export.h>

#include <ostream>
#include <string>

// Forward declaration for leatherman::logging::log_level
namespace leatherman {
    namespace logging {
        enum class log_level;
    }  // namespace logging
}  // namespace leatherman

/* This header provides a utility to setup logging for the cpp-zmq-plugin library.
   When Boost.Log is statically linked, logging configuration has to be done from
   within the cpp-zmq-plugin library for logging to work.
*/

namespace ZmqPlugin {
namespace Util {

// Throw a std::invalid_argument in case of unknown level label; the
// known ones are none, trace, debug, info, warning, error and fatal.
LIBCPP_ZMQ_PLUGIN_EXPORT
void setupLogging(std::ostream &stream,
                  bool force_colorization,
                  std::string const& loglevel_label);

LIBCPP_ZMQ_PLUGIN_EXPORT
void setupLogging(std::ostream &log_stream,
                  bool force_colorization,
                  leatherman::logging::log_level const& lvl);

}  // namespace Util
}  // namespace ZmqPlugin
