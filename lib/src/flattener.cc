//
// Type Flattener Implementation
//

#include <harnessgen/flattener.hh>
#include <harnessgen/harness_error.hh>
#include <algorithm>

namespace harnessgen {

// ============================================================================
// Flattening
// ============================================================================

void flatten_into(const type_descriptor& type, const std::string& varname, flat_sequence& out) {
    switch (type.kind) {
        case type_kind::record: {
            if (!type.complete) {
                throw missing_declaration_error(type.spelling);
            }
            // Each field's whole subsequence goes out before the next sibling
            for (const auto& field : type.fields) {
                flatten_into(*field.type, field.name, out);
            }
            out.push_back({&type, varname, type.fields.size()});
            break;
        }

        case type_kind::pointer:
            // Pointers always get a single pointee, never a buffer
            flatten_into(*type.pointee, varname + pointee_suffix, out);
            out.push_back({&type, varname, 1});
            break;

        case type_kind::signed_int:
        case type_kind::unsigned_int:
        case type_kind::character:
            out.push_back({&type, varname, 0});
            break;

        default:
            throw unsupported_type_kind_error(type.kind, type.spelling, pipeline_stage::flatten);
    }
}

flat_sequence flatten(const type_descriptor& type, const std::string& varname) {
    flat_sequence result;
    flatten_into(type, varname, result);
    return result;
}

// ============================================================================
// Dependency Windows
// ============================================================================

size_t subtree_size(const flat_sequence& seq, size_t index) {
    if (index >= seq.size()) {
        throw malformed_sequence_error("index " + std::to_string(index) + " out of range");
    }

    size_t size = 1;
    size_t cursor = index;
    for (size_t i = 0; i < seq[index].child_count; ++i) {
        if (cursor == 0) {
            throw malformed_sequence_error(
                "'" + seq[index].name + "' expects " +
                std::to_string(seq[index].child_count) + " dependencies before index " +
                std::to_string(index));
        }
        size_t child = subtree_size(seq, cursor - 1);
        size += child;
        cursor -= child;
    }
    return size;
}

std::vector<size_t> direct_dependencies(const flat_sequence& seq, size_t index) {
    if (index >= seq.size()) {
        throw malformed_sequence_error("index " + std::to_string(index) + " out of range");
    }

    // Walk backwards over whole sibling subtrees: the last field sits
    // directly before the entry, the one before it ends where the last
    // field's subtree begins, and so on.
    std::vector<size_t> deps;
    size_t cursor = index;
    for (size_t i = 0; i < seq[index].child_count; ++i) {
        if (cursor == 0) {
            throw malformed_sequence_error(
                "'" + seq[index].name + "' expects " +
                std::to_string(seq[index].child_count) + " dependencies before index " +
                std::to_string(index));
        }
        size_t dep = cursor - 1;
        deps.push_back(dep);
        cursor -= subtree_size(seq, dep);
    }
    std::reverse(deps.begin(), deps.end());
    return deps;
}

} // namespace harnessgen
