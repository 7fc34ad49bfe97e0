//
// Harness Emitter Implementation
//

#include <harnessgen/emitter.hh>
#include <harnessgen/codegen/code_writer.hh>
#include <sstream>

namespace harnessgen {

using codegen::CodeWriter;

namespace {

    void write_fragment(CodeWriter& writer, const harness_spec& spec) {
        for (const auto& init : spec.initializers) {
            writer.write_line(init.declaration);
        }
        if (!spec.initializers.empty()) {
            writer.write_blank_line();
        }

        bool any_assignment = false;
        for (const auto& init : spec.initializers) {
            writer.write_lines(init.assignments);
            any_assignment = any_assignment || !init.assignments.empty();
        }
        if (any_assignment) {
            writer.write_blank_line();
        }

        writer.write_line(call_statement(spec));
    }

} // anonymous namespace

std::string call_statement(const harness_spec& spec) {
    std::string result = spec.function_name + "(";
    for (size_t i = 0; i < spec.parameter_names.size(); ++i) {
        if (i > 0) result += ", ";
        result += spec.parameter_names[i];
    }
    result += ");";
    return result;
}

std::string emit_fragment(const harness_spec& spec) {
    std::ostringstream oss;
    CodeWriter writer(oss);
    write_fragment(writer, spec);
    return oss.str();
}

std::string render_program(const harness_spec& spec, const program_options& opts) {
    std::ostringstream oss;
    CodeWriter writer(oss, opts.indent);

    if (opts.banner) {
        writer.write_comment({
            "Generated by harnessgen. Do not edit.",
            "",
            "Reads the arguments of " + spec.function_name + "() from standard input",
            "and calls it once."
        });
        writer.write_blank_line();
    }

    writer.write_line("#include <stdio.h>");
    for (const auto& header : opts.includes) {
        writer << "#include \"" << header << "\"" << codegen::endl;
    }
    writer.write_blank_line();

    {
        auto main_block = writer.write_function("int main(void)");
        write_fragment(writer, spec);
        writer.write_line("return 0;");
    }

    return oss.str();
}

} // namespace harnessgen
