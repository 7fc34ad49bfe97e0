#include <iostream>
#include <string>

#include "driver.hh"
#include "driver_options.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace harnessgen::driver;

    try {
        // Handles --help, --version, --list-frontends by itself
        DriverOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;
        if (opts.debug) log_level = LogLevel::Debug;

        Logger logger(log_level, opts.color);

        Driver driver(opts, logger);
        return driver.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
