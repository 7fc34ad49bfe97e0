//
// Initializer Synthesizer
//
// Turns a flat_sequence into C statements: one declaration per variable
// and the statements that give it a value. Primitives are read from
// standard input, pointers take the address of their pointee and records
// copy each field from the variable that was flattened for it.
//

#pragma once

#include "flattener.hh"
#include <string>
#include <vector>

namespace harnessgen {

struct initializer {
    /// "<type-spelling> <name>;"
    std::string declaration;

    /// Read statement (primitive), address-of (pointer) or one
    /// field assignment per field (record; empty for a field-less record)
    std::vector<std::string> assignments;
};

/// Declaration statement for a variable
std::string declaration_statement(const local_variable& var);

/// scanf statement reading a primitive into `name`
/// @throws unsupported_type_kind_error if `kind` is not a primitive
std::string read_statement(type_kind kind, const std::string& name);

/// Build one initializer per entry, index-aligned with `seq`.
/// Dependencies are resolved by position only, through direct_dependencies.
/// @throws unsupported_type_kind_error for an entry of an unsupported kind
/// @throws malformed_sequence_error if a dependency window is out of range
std::vector<initializer> synthesize(const flat_sequence& seq);

} // namespace harnessgen
