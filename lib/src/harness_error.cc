//
// Generation Error Reporting
//

#include <harnessgen/harness_error.hh>

namespace harnessgen {

const char* to_string(error_kind kind) {
    switch (kind) {
        case error_kind::unsupported_type_kind: return "UnsupportedTypeKind";
        case error_kind::no_function_found:     return "NoFunctionFound";
        case error_kind::missing_declaration:   return "MissingDeclaration";
    }
    return "Unknown";
}

std::string unsupported_type_kind_error::build_message(type_kind kind,
                                                       const std::string& spelling,
                                                       pipeline_stage stage) {
    std::string result = "unsupported type kind '";
    result += to_string(kind);
    result += "'";
    if (!spelling.empty()) {
        result += " (" + spelling + ")";
    }
    result += stage == pipeline_stage::flatten ? " while flattening"
                                               : " while synthesizing initializers";
    return result;
}

} // namespace harnessgen
