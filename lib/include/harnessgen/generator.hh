//
// Harness Generation API
//
// Runs Select -> Flatten -> Synthesize -> Emit for one translation unit.
// The pipeline either returns a complete harness or throws one of the
// generation_error subclasses; there are no partial results.
//
// Example:
//   translation_unit tu = frontend.load("main.c");
//   harness_result result = generate_harness(tu);
//   std::cout << render_program(result.spec);
//

#pragma once

#include "emitter.hh"
#include "flattener.hh"
#include "types.hh"
#include <string>
#include <vector>

namespace harnessgen {

struct generator_options {
    /// Overrides translation_unit::primary_file when non-empty
    std::string primary_file;

    /// Harness this function instead of the last-declared one
    std::string function_name;
};

/// Flattening of one parameter, kept for diagnostics
struct parameter_plan {
    std::string name;
    flat_sequence variables;
};

struct harness_result {
    const function_decl* target = nullptr;
    std::vector<parameter_plan> parameters;
    harness_spec spec;
    std::string fragment;
};

/// Flatten and synthesize every parameter of `fn` in declaration order
harness_spec build_harness_spec(const function_decl& fn,
                                std::vector<parameter_plan>* plans = nullptr);

/// Select the target in `tu` and generate its harness
/// @throws generation_error (see harness_error.hh)
harness_result generate_harness(const translation_unit& tu,
                                const generator_options& opts = {});

} // namespace harnessgen
