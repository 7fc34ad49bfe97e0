#pragma once

#include "logger.hh"
#include <filesystem>
#include <string>
#include <vector>

namespace harnessgen::driver {

/// Driver options (command line only, nothing is read from files)
struct DriverOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::filesystem::path input_file;
    std::filesystem::path output_file;               // Empty: stdout
    std::vector<std::filesystem::path> include_dirs; // -I paths (clang frontend)

    // ========================================================================
    // Frontend & Target Selection
    // ========================================================================

    std::string frontend;                            // Empty: by input extension
    std::string primary_file;                        // Empty: frontend's choice
    std::string function_name;                       // Empty: last-declared function

    // ========================================================================
    // Output Shape
    // ========================================================================

    bool fragment_only = false;                      // --fragment-only
    std::vector<std::string> includes;               // --include=<header>
    size_t indent_width = 4;                         // --indent=<n>

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    bool debug = false;                              // --debug
    ColorMode color = ColorMode::Auto;               // --color=<when>
};

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
DriverOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print registered frontends
void print_frontends();

}  // namespace harnessgen::driver
