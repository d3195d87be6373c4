#include "tests/test.hpp"

#include <cpp-zmq-plugin/util/logging.hpp>

#define LEATHERMAN_LOGGING_NAMESPACE CPP_ZMQ_PLUGIN_LOGGING_PREFIX".test"
#include <leatherman/logging/logging.hpp>

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ZmqPlugin {

namespace lth_log = leatherman::logging;

TEST_CASE("Util::setupLogging", "[util]") {
    std::ostringstream log_stream {};

    SECTION("sets the level by label") {
        Util::setupLogging(log_stream, false, "warning");
        REQUIRE(lth_log::get_level() == lth_log::log_level::warning);
    }

    SECTION("sets the level by value") {
        Util::setupLogging(log_stream, false, lth_log::log_level::error);
        REQUIRE(lth_log::get_level() == lth_log::log_level::error);
    }

    SECTION("throws an invalid_argument in case of unknown label") {
        REQUIRE_THROWS_AS(Util::setupLogging(log_stream, false, "verbose"),
                          std::invalid_argument);
    }

    // restore the test configuration
    Util::setupLogging(std::cout, false, "fatal");
}

}  // namespace ZmqPlugin
