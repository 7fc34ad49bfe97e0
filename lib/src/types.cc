//
// Type Model Implementation
//

#include <harnessgen/types.hh>

namespace harnessgen {

const char* to_string(type_kind kind) {
    switch (kind) {
        case type_kind::signed_int:     return "int";
        case type_kind::unsigned_int:   return "unsigned int";
        case type_kind::character:      return "char";
        case type_kind::pointer:        return "pointer";
        case type_kind::record:         return "struct";
        case type_kind::floating_point: return "floating-point";
        case type_kind::array:          return "array";
        case type_kind::union_type:     return "union";
        case type_kind::enum_type:      return "enum";
        case type_kind::function_type:  return "function";
        case type_kind::void_type:      return "void";
        case type_kind::other:          return "other";
    }
    return "unknown";
}

bool is_primitive(type_kind kind) {
    return kind == type_kind::signed_int ||
           kind == type_kind::unsigned_int ||
           kind == type_kind::character;
}

// ============================================================================
// type_table
// ============================================================================

type_descriptor* type_table::create(type_kind kind, std::string spelling) {
    auto type = std::make_unique<type_descriptor>();
    type->kind = kind;
    type->spelling = std::move(spelling);
    types_.push_back(std::move(type));
    return types_.back().get();
}

type_descriptor* type_table::make_primitive(type_kind kind, const std::string& spelling) {
    return create(kind, spelling);
}

type_descriptor* type_table::make_pointer(const type_descriptor* pointee) {
    // "int" -> "int *", "char *" -> "char **"
    std::string spelling = pointee->spelling;
    if (!spelling.empty() && spelling.back() != '*') {
        spelling += ' ';
    }
    spelling += '*';

    auto* type = create(type_kind::pointer, std::move(spelling));
    type->pointee = pointee;
    return type;
}

type_descriptor* type_table::make_record(const std::string& spelling) {
    return create(type_kind::record, spelling);
}

} // namespace harnessgen
