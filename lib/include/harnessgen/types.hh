//
// Type Model
//
// Read-only view of the C types and function declarations reported by a
// frontend (YAML type model, clang AST). The harness pipeline only ever
// holds const references into a type_table; frontends own construction.
//

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace harnessgen {

// ============================================================================
// Source Location Tracking
// ============================================================================

struct source_location {
    std::string file_path;
    size_t line = 0;
    size_t column = 0;

    /// Format as "file:line:column"
    [[nodiscard]] std::string format() const {
        return file_path + ":" + std::to_string(line) + ":" + std::to_string(column);
    }
};

// ============================================================================
// Type System
// ============================================================================

enum class type_kind {
    // Supported by the harness pipeline
    signed_int,
    unsigned_int,
    character,
    pointer,
    record,

    // Reported by frontends, rejected by the pipeline
    floating_point,
    array,
    union_type,
    enum_type,
    function_type,
    void_type,
    other
};

/// Human-readable kind name used in diagnostics ("int", "struct", ...)
const char* to_string(type_kind kind);

/// True for signed_int, unsigned_int and character
[[nodiscard]] bool is_primitive(type_kind kind);

struct type_descriptor;

struct field_descriptor {
    std::string name;
    const type_descriptor* type = nullptr;
};

struct type_descriptor {
    type_kind kind = type_kind::other;

    /// Declaration spelling, used verbatim ("struct point", "int *")
    std::string spelling;

    /// For pointers
    const type_descriptor* pointee = nullptr;

    /// For records: fields in declaration order
    std::vector<field_descriptor> fields;

    /// For records: false when only a forward declaration was seen
    bool complete = true;
};

// ============================================================================
// Type Table - owns every descriptor of one translation unit
// ============================================================================

class type_table {
public:
    type_table() = default;

    type_table(const type_table&) = delete;
    type_table& operator=(const type_table&) = delete;
    type_table(type_table&&) noexcept = default;
    type_table& operator=(type_table&&) noexcept = default;

    /// Allocate a descriptor; the returned pointer stays valid for the
    /// lifetime of the table
    type_descriptor* create(type_kind kind, std::string spelling);

    type_descriptor* make_primitive(type_kind kind, const std::string& spelling);
    type_descriptor* make_pointer(const type_descriptor* pointee);
    type_descriptor* make_record(const std::string& spelling);

    [[nodiscard]] size_t size() const { return types_.size(); }

private:
    std::vector<std::unique_ptr<type_descriptor>> types_;
};

// ============================================================================
// Declarations
// ============================================================================

struct parameter_decl {
    std::string name;
    const type_descriptor* type = nullptr;
};

struct function_decl {
    std::string name;
    source_location location;
    std::vector<parameter_decl> parameters;
};

/// Everything a frontend reports about one translation unit
struct translation_unit {
    std::string spelling;       ///< File name reported in diagnostics
    std::string primary_file;   ///< Functions outside this file are not targets
    type_table types;
    std::vector<function_decl> functions;  ///< In enumeration order
};

} // namespace harnessgen
