//
// Harness Generation Exceptions
//
// Every failure of the Select -> Flatten -> Synthesize -> Emit pipeline is
// fatal for the current target. Callers either catch the concrete class or
// catch generation_error and branch on kind().
//

#pragma once

#include "types.hh"
#include <stdexcept>
#include <string>

namespace harnessgen {

enum class error_kind {
    unsupported_type_kind,
    no_function_found,
    missing_declaration
};

const char* to_string(error_kind kind);

/// Pipeline stage that rejected a type
enum class pipeline_stage {
    flatten,
    synthesize
};

class generation_error : public std::runtime_error {
public:
    generation_error(error_kind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    [[nodiscard]] error_kind kind() const { return kind_; }

private:
    error_kind kind_;
};

class unsupported_type_kind_error : public generation_error {
public:
    unsupported_type_kind_error(type_kind kind,
                                const std::string& spelling,
                                pipeline_stage stage)
        : generation_error(error_kind::unsupported_type_kind,
                           build_message(kind, spelling, stage)),
          type_kind_(kind),
          spelling_(spelling),
          stage_(stage) {}

    [[nodiscard]] type_kind offending_kind() const { return type_kind_; }
    [[nodiscard]] const std::string& spelling() const { return spelling_; }
    [[nodiscard]] pipeline_stage stage() const { return stage_; }

private:
    type_kind type_kind_;
    std::string spelling_;
    pipeline_stage stage_;

    static std::string build_message(type_kind kind,
                                     const std::string& spelling,
                                     pipeline_stage stage);
};

class no_function_found_error : public generation_error {
public:
    explicit no_function_found_error(const std::string& primary_file)
        : generation_error(error_kind::no_function_found,
                           "no function declaration found in '" + primary_file + "'"),
          primary_file_(primary_file) {}

    no_function_found_error(const std::string& primary_file,
                            const std::string& function_name)
        : generation_error(error_kind::no_function_found,
                           "function '" + function_name + "' not found in '" +
                           primary_file + "'"),
          primary_file_(primary_file) {}

    const std::string& primary_file() const { return primary_file_; }

private:
    std::string primary_file_;
};

class missing_declaration_error : public generation_error {
public:
    explicit missing_declaration_error(const std::string& spelling)
        : generation_error(error_kind::missing_declaration,
                           "incomplete type '" + spelling +
                           "': field list is not available (forward declaration only?)"),
          spelling_(spelling) {}

    const std::string& spelling() const { return spelling_; }

private:
    std::string spelling_;
};

/**
 * Thrown when a flat sequence does not have the post-order shape the
 * synthesizer relies on (a dependency window running past the start of
 * the sequence). Indicates a bug in the flattener, never bad user input.
 */
class malformed_sequence_error : public std::logic_error {
public:
    explicit malformed_sequence_error(const std::string& what_arg)
        : std::logic_error("Malformed flat sequence: " + what_arg) {}
};

} // namespace harnessgen
