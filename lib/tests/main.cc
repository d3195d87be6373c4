// Refer to https://github.com/philsquared/Catch/blob/master/docs/own-main.md
// for providing our own main function to Catch
#define CATCH_CONFIG_RUNNER

#include "test.hpp"

#include <cpp-zmq-plugin/util/logging.hpp>

#include <iostream>

int main(int argc, char* const argv[]) {
    // set logging level to fatal
    ZmqPlugin::Util::setupLogging(std::cout, false, "fatal");

    // configure the Catch session and start it
    Catch::Session test_session;
    test_session.applyCommandLine(argc, argv);

    // Reporters: "xml", "junit", "console", "compact"
    test_session.configData().reporterName = "console";

    // ShowDurations::Always, ::Never, ::DefaultForReporter
    test_session.configData().showDurations = Catch::ShowDurations::Always;

    return test_session.run();
}
