#include <cpp-zmq-plugin/util/logging.hpp>

#define LEATHERMAN_LOGGING_NAMESPACE CPP_ZMQ_PLUGIN_LOGGING_PREFIX".configuration"
#include <leatherman/logging/logging.hpp>

#include <leatherman/locale/locale.hpp>

#include <map>
#include <stdexcept>

namespace ZmqPlugin {
namespace Util {

namespace lth_log = leatherman::logging;
namespace lth_loc = leatherman::locale;

static void setupLoggingImp(std::ostream& log_stream,
                            bool force_colorization,
                            lth_log::log_level const& lvl)
{
    lth_log::setup_logging(log_stream);
    lth_log::set_level(lvl);

    if (force_colorization)
        lth_log::set_colorization(true);

    LOG_DEBUG("Logging configured");
}

void setupLogging(std::ostream &log_stream,
                  bool force_colorization,
                  std::string const& loglevel_label)
{
    const std::map<std::string, lth_log::log_level> label_to_log_level {
            { "none", lth_log::log_level::none },
            { "trace", lth_log::log_level::trace },
            { "debug", lth_log::log_level::debug },
            { "info", lth_log::log_level::info },
            { "warning", lth_log::log_level::warning },
            { "error", lth_log::log_level::error },
            { "fatal", lth_log::log_level::fatal }
    };

    auto lvl_it = label_to_log_level.find(loglevel_label);

    if (lvl_it == label_to_log_level.end()) {
        throw std::invalid_argument {
            lth_loc::format("unknown log level '{1}'", loglevel_label) };
    }

    setupLoggingImp(log_stream, force_colorization, lvl_it->second);
}

void setupLogging(std::ostream &log_stream,
                  bool force_colorization,
                  lth_log::log_level const& lvl)
{
    setupLoggingImp(log_stream, force_colorization, lvl);
}

}  // namespace Util
}  // namespace ZmqPlugin
