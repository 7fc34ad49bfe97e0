#include "logger.hh"
#include <iomanip>
#include <termcolor/termcolor.hpp>

namespace harnessgen::driver {

Logger::Logger(LogLevel level, ColorMode color, std::ostream& info_stream, std::ostream& error_stream)
    : level_(level)
    , color_mode_(color)
    , info_stream_(&info_stream)
    , error_stream_(&error_stream)
{
    apply_color_mode(*info_stream_);
    apply_color_mode(*error_stream_);
}

void Logger::apply_color_mode(std::ostream& os) const {
    switch (color_mode_) {
        case ColorMode::Always:
            os << termcolor::colorize;
            break;
        case ColorMode::Never:
            os << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            // termcolor auto-detects TTY by default
            break;
    }
}

void Logger::set_info_stream(std::ostream& os) {
    info_stream_ = &os;
    apply_color_mode(os);
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    *error_stream_ << termcolor::bold << termcolor::red
                   << "error: " << termcolor::reset
                   << message << "\n";
}

void Logger::error(const std::string& label, const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    *error_stream_ << termcolor::bold << termcolor::red
                   << "error: " << termcolor::reset
                   << termcolor::bold << label << ": " << termcolor::reset
                   << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    *error_stream_ << termcolor::bold << termcolor::yellow
                   << "warning: " << termcolor::reset
                   << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    *info_stream_ << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    *info_stream_ << termcolor::bold << termcolor::green
                  << "✓ " << termcolor::reset
                  << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    *info_stream_ << termcolor::cyan
                  << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    *info_stream_ << termcolor::magenta
                  << "[debug] " << termcolor::reset
                  << message << "\n";
}

void Logger::parameter(const std::string& name, const std::string& spelling, size_t variable_count) {
    if (!should_log(LogLevel::Verbose)) return;

    *info_stream_ << "  • " << termcolor::cyan << name << termcolor::reset
                  << " (" << spelling << "): "
                  << variable_count << (variable_count == 1 ? " variable" : " variables") << "\n";
}

void Logger::variable(size_t index, const std::string& kind, const std::string& name, size_t child_count) {
    if (!should_log(LogLevel::Debug)) return;

    *info_stream_ << termcolor::magenta << "[debug] " << termcolor::reset
                  << "    " << std::setw(3) << index << "  "
                  << std::left << std::setw(13) << kind << std::right
                  << name;
    if (child_count > 0) {
        *info_stream_ << " <- " << child_count;
    }
    *info_stream_ << "\n";
}

} // namespace harnessgen::driver
