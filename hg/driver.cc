#include "driver.hh"
#include <harnessgen/emitter.hh>
#include <harnessgen/harness_error.hh>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace harnessgen::driver {

Driver::Driver(const DriverOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
}

int Driver::run() {
    return run(std::cout);
}

int Driver::run(std::ostream& out) {
    // Keep generated code on stdout free of progress messages
    if (options_.output_file.empty()) {
        logger_.set_info_stream(std::cerr);
    }

    try {
        frontend::BaseFrontend& fe = select_frontend();
        translation_unit tu = load(fe);
        logger_.info("Translation unit: " + tu.spelling);

        harness_result result = generate(tu);
        std::string text = render(result, tu);
        write_output(text, out);
        return 0;

    } catch (const generation_error& e) {
        logger_.error(to_string(e.kind()), e.what());
        return 1;
    } catch (const frontend::frontend_error& e) {
        logger_.error("Frontend", e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

frontend::BaseFrontend& Driver::select_frontend() {
    auto& registry = frontend::FrontendRegistry::instance();

    frontend::BaseFrontend* fe = nullptr;
    if (!options_.frontend.empty()) {
        fe = registry.get_frontend(options_.frontend);
    } else {
        fe = registry.find_for_file(options_.input_file);
    }

    if (!fe) {
        std::string error_msg = "No frontend for input file: " + options_.input_file.string();
        error_msg += "\n\nAvailable frontends:";
        for (const auto& name : registry.get_available_frontends()) {
            error_msg += "\n  - " + name;
        }
        throw std::runtime_error(error_msg);
    }

    logger_.verbose("Using frontend: " + fe->get_name());
    return *fe;
}

translation_unit Driver::load(frontend::BaseFrontend& fe) {
    logger_.verbose("Loading: " + options_.input_file.string());

    std::vector<std::string> args;
    for (const auto& dir : options_.include_dirs) {
        args.push_back("-I" + dir.string());
    }
    fe.set_compiler_args(args);

    translation_unit tu = fe.load(options_.input_file);
    logger_.verbose("Found " + std::to_string(tu.functions.size()) + " function declaration(s)");
    return tu;
}

harness_result Driver::generate(const translation_unit& tu) {
    generator_options gen_opts;
    gen_opts.primary_file = options_.primary_file;
    gen_opts.function_name = options_.function_name;

    harness_result result = generate_harness(tu, gen_opts);

    logger_.info("Target: " + result.target->name + " (" +
                 result.target->location.file_path + ":" +
                 std::to_string(result.target->location.line) + ")");
    if (result.parameters.empty()) {
        logger_.warning(result.target->name + " takes no parameters; the harness only calls it");
    }
    report_plan(result);
    return result;
}

std::string Driver::render(const harness_result& result, const translation_unit& tu) {
    if (options_.fragment_only) {
        return result.fragment;
    }

    program_options prog_opts;
    prog_opts.indent = std::string(options_.indent_width, ' ');
    prog_opts.includes = options_.includes;
    if (prog_opts.includes.empty()) {
        const std::string& primary =
            options_.primary_file.empty() ? tu.primary_file : options_.primary_file;
        prog_opts.includes.push_back(primary);
    }
    return render_program(result.spec, prog_opts);
}

void Driver::write_output(const std::string& text, std::ostream& out) {
    if (options_.output_file.empty()) {
        out << text;
        out.flush();
        return;
    }

    logger_.verbose("Writing: " + options_.output_file.string());

    auto parent = options_.output_file.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    std::ofstream ofs(options_.output_file);
    if (!ofs) {
        throw std::runtime_error("Failed to open file for writing: " + options_.output_file.string());
    }

    ofs << text;

    if (!ofs) {
        throw std::runtime_error("Failed to write file: " + options_.output_file.string());
    }

    logger_.success("Generated: " + options_.output_file.string());
}

// ============================================================================
// Diagnostics
// ============================================================================

void Driver::report_plan(const harness_result& result) {
    for (const auto& plan : result.parameters) {
        // The parameter's own entry closes its subsequence
        logger_.parameter(plan.name, plan.variables.back().type->spelling, plan.variables.size());

        for (size_t i = 0; i < plan.variables.size(); ++i) {
            const auto& var = plan.variables[i];
            logger_.variable(i, to_string(var.type->kind), var.name, var.child_count);
        }
    }
}

}  // namespace harnessgen::driver
