//
// Initializer Synthesizer Implementation
//

#include <harnessgen/synthesizer.hh>
#include <harnessgen/harness_error.hh>

namespace harnessgen {

std::string declaration_statement(const local_variable& var) {
    return var.type->spelling + " " + var.name + ";";
}

std::string read_statement(type_kind kind, const std::string& name) {
    switch (kind) {
        case type_kind::signed_int:
            return "scanf(\"%d\", &" + name + ");";
        case type_kind::unsigned_int:
            return "scanf(\"%u\", &" + name + ");";
        case type_kind::character:
            // Leading space skips whitespace left over from earlier reads
            return "scanf(\" %c\", &" + name + ");";
        default:
            throw unsupported_type_kind_error(kind, "", pipeline_stage::synthesize);
    }
}

std::vector<initializer> synthesize(const flat_sequence& seq) {
    std::vector<initializer> result;
    result.reserve(seq.size());

    for (size_t i = 0; i < seq.size(); ++i) {
        const local_variable& var = seq[i];
        const type_descriptor& type = *var.type;

        initializer init;
        init.declaration = declaration_statement(var);

        std::vector<size_t> deps = direct_dependencies(seq, i);

        switch (type.kind) {
            case type_kind::record:
                if (type.fields.size() != deps.size()) {
                    throw malformed_sequence_error(
                        "'" + var.name + "' has " + std::to_string(type.fields.size()) +
                        " fields but child count " + std::to_string(deps.size()));
                }
                for (size_t f = 0; f < deps.size(); ++f) {
                    init.assignments.push_back(
                        var.name + "." + type.fields[f].name + " = " + seq[deps[f]].name + ";");
                }
                break;

            case type_kind::pointer:
                if (deps.size() != 1) {
                    throw malformed_sequence_error(
                        "pointer '" + var.name + "' must have exactly one dependency");
                }
                init.assignments.push_back(var.name + " = &" + seq[deps[0]].name + ";");
                break;

            case type_kind::signed_int:
            case type_kind::unsigned_int:
            case type_kind::character:
                if (!deps.empty()) {
                    throw malformed_sequence_error(
                        "primitive '" + var.name + "' cannot have dependencies");
                }
                init.assignments.push_back(read_statement(type.kind, var.name));
                break;

            default:
                throw unsupported_type_kind_error(type.kind, type.spelling,
                                                  pipeline_stage::synthesize);
        }

        result.push_back(std::move(init));
    }

    return result;
}

} // namespace harnessgen
