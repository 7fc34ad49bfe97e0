//
// Harness Emitter
//
// Assembles the initializers of all parameters into the harness text:
// every declaration, then every assignment/read, then one call to the
// target function. render_program() additionally wraps the fragment into
// a compilable main().
//

#pragma once

#include "synthesizer.hh"
#include <string>
#include <vector>

namespace harnessgen {

struct harness_spec {
    std::string function_name;

    /// Parameter names in declaration order
    std::vector<std::string> parameter_names;

    /// Concatenation of each parameter's initializers, parameter by
    /// parameter, never interleaved
    std::vector<initializer> initializers;
};

struct program_options {
    /// Lines written as #include "<header>" after <stdio.h>
    std::vector<std::string> includes;

    /// Indentation used inside main()
    std::string indent = "    ";

    /// Emit the "generated by" banner comment
    bool banner = true;
};

/// Call statement "<function>(<p1>, <p2>, ...);"
std::string call_statement(const harness_spec& spec);

/// Declarations, a blank line, assignments, a blank line, the call.
/// The text is not validated as C.
std::string emit_fragment(const harness_spec& spec);

/// Complete translation unit: banner, includes and int main(void) whose
/// body is the fragment followed by "return 0;"
std::string render_program(const harness_spec& spec, const program_options& opts = {});

} // namespace harnessgen
