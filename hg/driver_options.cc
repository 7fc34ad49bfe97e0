#include "driver_options.hh"
#include <harnessgen/frontend.hh>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>

namespace harnessgen::driver {

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// "-o file", "-ofile"
static std::string get_short_option_value(const char* arg, const char* prefix,
                                          int argc, char** argv, int& i) {
    std::string value = get_option_value(arg, prefix);
    if (value.empty() && i + 1 < argc) {
        value = argv[++i];
    }
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + " requires argument");
    }
    return value;
}

// "--name=value"
static std::string get_long_option_value(const char* arg, const char* prefix) {
    std::string value = get_option_value(arg, prefix);
    if (value.empty()) {
        throw std::runtime_error(std::string("Option ") + prefix + "<value> requires a value");
    }
    return value;
}

static ColorMode parse_color(const std::string& value) {
    if (value == "auto") return ColorMode::Auto;
    if (value == "always") return ColorMode::Always;
    if (value == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid choice for color: " + value +
                             "\nValid choices: auto, always, never");
}

static size_t parse_indent(const std::string& value) {
    size_t width = 0;
    try {
        size_t pos = 0;
        long parsed = std::stol(value, &pos);
        if (pos != value.size() || parsed < 0 || parsed > 16) {
            throw std::out_of_range(value);
        }
        width = static_cast<size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid indent width: " + value + " (expected 0-16)");
    }
    return width;
}

// ============================================================================
// Main Parser
// ============================================================================

DriverOptions parse_command_line(int argc, char** argv) {
    DriverOptions opts;
    bool have_input = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        if (std::strcmp(arg, "--list-frontends") == 0) {
            print_frontends();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (std::strcmp(arg, "--debug") == 0) {
            opts.debug = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color(get_long_option_value(arg, "--color="));
            continue;
        }

        // Output shape
        if (std::strcmp(arg, "--fragment-only") == 0) {
            opts.fragment_only = true;
            continue;
        }

        if (starts_with(arg, "--include=")) {
            opts.includes.push_back(get_long_option_value(arg, "--include="));
            continue;
        }

        if (starts_with(arg, "--indent=")) {
            opts.indent_width = parse_indent(get_long_option_value(arg, "--indent="));
            continue;
        }

        // Frontend & target selection
        if (starts_with(arg, "--frontend=")) {
            opts.frontend = get_long_option_value(arg, "--frontend=");
            continue;
        }

        if (starts_with(arg, "--primary-file=")) {
            opts.primary_file = get_long_option_value(arg, "--primary-file=");
            continue;
        }

        if (starts_with(arg, "--function=")) {
            opts.function_name = get_long_option_value(arg, "--function=");
            continue;
        }

        // Short options with values
        if (starts_with(arg, "-o")) {
            opts.output_file = get_short_option_value(arg, "-o", argc, argv, i);
            continue;
        }

        if (starts_with(arg, "-I")) {
            opts.include_dirs.push_back(get_short_option_value(arg, "-I", argc, argv, i));
            continue;
        }

        // "-f <name>" only; "-fsyntax-only" and friends are unknown options
        if (std::strcmp(arg, "-f") == 0) {
            if (i + 1 >= argc || argv[i + 1][0] == '-') {
                throw std::runtime_error("Option -f requires a frontend name");
            }
            opts.frontend = argv[++i];
            continue;
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        if (have_input) {
            throw std::runtime_error(std::string("Only one input file is supported, got extra: ") + arg);
        }
        opts.input_file = arg;
        have_input = true;
    }

    // Validation
    if (!have_input) {
        throw std::runtime_error("No input file specified");
    }

    if (opts.quiet && (opts.verbose || opts.debug)) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose/--debug");
    }

    if (!opts.frontend.empty() &&
        !frontend::FrontendRegistry::instance().get_frontend(opts.frontend)) {
        auto available = frontend::FrontendRegistry::instance().get_available_frontends();
        std::string error_msg = "Unknown frontend: " + opts.frontend;

        if (!available.empty()) {
            error_msg += "\n\nAvailable frontends:";
            for (const auto& name : available) {
                error_msg += "\n  - " + name;
            }
        }
        throw std::runtime_error(error_msg);
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <input-file>\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-frontends        List available input frontends\n";
    std::cout << "\n";

    std::cout << "Input:\n";
    std::cout << "  -f, --frontend=<name>   Frontend to use (default: by file extension)\n";
    std::cout << "  -I <dir>                Add include search path (clang frontend)\n";
    std::cout << "  --primary-file=<file>   Only functions declared in <file> are targets\n";
    std::cout << "  --function=<name>       Harness <name> instead of the last-declared function\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <file>               Output file (default: stdout)\n";
    std::cout << "  --fragment-only         Emit statements only, without main()\n";
    std::cout << "  --include=<header>      Add #include \"<header>\" to the program (repeatable)\n";
    std::cout << "  --indent=<n>            Indentation width inside main() (default: 4)\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --debug                 Print every flattened variable\n";
    std::cout << "  --color=<when>          auto, always or never\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " main.c\n";
    std::cout << "  " << program_name << " -o harness.c --function=parse_header main.c\n";
    std::cout << "  " << program_name << " --fragment-only model.yaml\n";
}

void print_version() {
    std::cout << "harnessgen v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_frontends() {
    auto& registry = frontend::FrontendRegistry::instance();

    std::cout << "Available frontends:\n\n";

    for (const auto& name : registry.get_available_frontends()) {
        auto* fe = registry.get_frontend(name);
        if (!fe) continue;

        std::cout << "  " << name << " - " << fe->get_description() << "\n";
        std::cout << "    Extensions:";
        for (const auto& ext : fe->get_extensions()) {
            std::cout << " " << ext;
        }
        std::cout << "\n\n";
    }
}

}  // namespace harnessgen::driver
