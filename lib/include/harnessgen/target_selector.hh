//
// Target Selector
//
// Picks the function to harness: the declaration with the greatest source
// line in the primary file ("last declared wins"). Candidates are compared
// by selection_key only, never by name.
//

#pragma once

#include "types.hh"
#include <string>
#include <vector>

namespace harnessgen {

/// Ordering key of a candidate; greater is preferred
struct selection_key {
    bool in_primary_file = false;
    size_t line = 0;

    friend bool operator<(const selection_key& lhs, const selection_key& rhs) {
        if (lhs.in_primary_file != rhs.in_primary_file) {
            return !lhs.in_primary_file;
        }
        // Declarations outside the primary file all rank equal
        if (!lhs.in_primary_file) {
            return false;
        }
        return lhs.line < rhs.line;
    }
};

/// True when `file` names `primary_file` (exact match, or same path after
/// normalization)
[[nodiscard]] bool is_same_file(const std::string& file, const std::string& primary_file);

selection_key make_selection_key(const function_decl& fn, const std::string& primary_file);

/// Function with the greatest key. Among equal keys the first one
/// enumerated is kept.
/// @throws no_function_found_error if no function lies in the primary file
const function_decl& select_target(const std::vector<function_decl>& functions,
                                   const std::string& primary_file);

/// Named function in the primary file (last declaration if repeated)
/// @throws no_function_found_error if there is none
const function_decl& select_target_by_name(const std::vector<function_decl>& functions,
                                           const std::string& primary_file,
                                           const std::string& name);

} // namespace harnessgen
