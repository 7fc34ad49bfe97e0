//
// Type Flattener
//
// Decomposes a parameter type into a post-order sequence of local
// variables. Every non-primitive entry is emitted after the complete
// subsequences of its direct dependencies (record fields in declaration
// order, or the single pointee), so a bottom-up replay of the sequence
// always finds a variable's dependencies already materialized.
//
// Example: struct { int a; int *b; } p
//
//   [0] int      a
//   [1] int      b_v
//   [2] int *    b      child_count = 1   -> depends on [1]
//   [3] struct   p      child_count = 2   -> depends on [0], [2]
//

#pragma once

#include "types.hh"
#include <cstddef>
#include <string>
#include <vector>

namespace harnessgen {

struct local_variable {
    const type_descriptor* type = nullptr;
    std::string name;

    /// Number of direct dependencies: 1 for pointers, field count for
    /// records, 0 for primitives
    size_t child_count = 0;
};

using flat_sequence = std::vector<local_variable>;

/// Suffix appended to a pointer's name to name its pointee variable
inline constexpr const char* pointee_suffix = "_v";

/// Flatten `type` for a variable called `varname`.
/// @throws unsupported_type_kind_error for kinds outside int/uint/char/pointer/struct
/// @throws missing_declaration_error for records without a field list
flat_sequence flatten(const type_descriptor& type, const std::string& varname);

/// Append the flattening of `type` to `out`. The existing contents of `out`
/// are left untouched, so sequences of several parameters can be built in
/// one accumulator.
void flatten_into(const type_descriptor& type, const std::string& varname, flat_sequence& out);

/// Number of entries in the subtree that ends at `index` (the entry itself
/// plus all of its transitive dependencies).
/// @throws malformed_sequence_error if the subtree runs past the start
size_t subtree_size(const flat_sequence& seq, size_t index);

/// Indices of the direct dependencies of the entry at `index`, in field
/// declaration order. Empty for primitives.
/// @throws malformed_sequence_error if a dependency window runs past the start
std::vector<size_t> direct_dependencies(const flat_sequence& seq, size_t index);

} // namespace harnessgen
