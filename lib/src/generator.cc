//
// Harness Generation Pipeline
//

#include <harnessgen/generator.hh>
#include <harnessgen/synthesizer.hh>
#include <harnessgen/target_selector.hh>
#include <iterator>

namespace harnessgen {

harness_spec build_harness_spec(const function_decl& fn,
                                std::vector<parameter_plan>* plans) {
    harness_spec spec;
    spec.function_name = fn.name;

    for (const auto& param : fn.parameters) {
        // Each parameter is synthesized on its own sequence so that one
        // parameter's window can never reach into another's
        flat_sequence variables = flatten(*param.type, param.name);
        std::vector<initializer> inits = synthesize(variables);

        spec.parameter_names.push_back(param.name);
        spec.initializers.insert(spec.initializers.end(),
                                 std::make_move_iterator(inits.begin()),
                                 std::make_move_iterator(inits.end()));

        if (plans) {
            plans->push_back({param.name, std::move(variables)});
        }
    }

    return spec;
}

harness_result generate_harness(const translation_unit& tu, const generator_options& opts) {
    const std::string& primary_file =
        opts.primary_file.empty() ? tu.primary_file : opts.primary_file;

    harness_result result;
    result.target = opts.function_name.empty()
        ? &select_target(tu.functions, primary_file)
        : &select_target_by_name(tu.functions, primary_file, opts.function_name);

    result.spec = build_harness_spec(*result.target, &result.parameters);
    result.fragment = emit_fragment(result.spec);
    return result;
}

} // namespace harnessgen
