#pragma once

#include "driver_options.hh"
#include "logger.hh"
#include <harnessgen/frontend.hh>
#include <harnessgen/generator.hh>
#include <harnessgen/types.hh>
#include <ostream>
#include <string>

namespace harnessgen::driver {

/// Command-line driver: load -> generate -> render -> write
class Driver {
public:
    explicit Driver(const DriverOptions& options, Logger& logger);

    /// Run the whole pipeline, writing to the output file or std::cout
    /// Returns 0 on success, non-zero on error
    int run();

    /// Same as run(), with `out` standing in for stdout
    int run(std::ostream& out);

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Stage 1: Pick the frontend for the input file
    frontend::BaseFrontend& select_frontend();

    /// Stage 2: Load the translation unit
    translation_unit load(frontend::BaseFrontend& fe);

    /// Stage 3: Select target and build its harness
    harness_result generate(const translation_unit& tu);

    /// Stage 4: Fragment or complete program text
    std::string render(const harness_result& result, const translation_unit& tu);

    /// Stage 5: Write to output file or `out`
    void write_output(const std::string& text, std::ostream& out);

    // ========================================================================
    // Diagnostics
    // ========================================================================

    void report_plan(const harness_result& result);

    // ========================================================================
    // State
    // ========================================================================

    const DriverOptions& options_;
    Logger& logger_;
};

}  // namespace harnessgen::driver
