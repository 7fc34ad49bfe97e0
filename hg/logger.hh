#pragma once

#include <iostream>
#include <string>

namespace harnessgen::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + per-parameter plan
    Debug    // + every flattened variable
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Console logger for the harnessgen driver.
 *
 * Errors and warnings go to the error stream (stderr). Everything else
 * goes to the info stream, which the driver points at stderr whenever the
 * generated harness itself is written to stdout.
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                    ColorMode color = ColorMode::Auto,
                    std::ostream& info_stream = std::cout,
                    std::ostream& error_stream = std::cerr);

    void error(const std::string& message);

    /// "error: <Label>: message", label in bold ("NoFunctionFound")
    void error(const std::string& label, const std::string& message);

    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// Verbose header line for one parameter of the target
    void parameter(const std::string& name, const std::string& spelling, size_t variable_count);

    /// Debug row for one flattened variable: index, kind, name, child count
    void variable(size_t index, const std::string& kind, const std::string& name, size_t child_count);

    // Level control
    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

    // Redirect non-error output so it does not mix with generated code
    void set_info_stream(std::ostream& os);

private:
    LogLevel level_;
    ColorMode color_mode_;
    std::ostream* info_stream_;
    std::ostream* error_stream_;

    bool should_log(LogLevel required_level) const;
    void apply_color_mode(std::ostream& os) const;
};

} // namespace harnessgen::driver
