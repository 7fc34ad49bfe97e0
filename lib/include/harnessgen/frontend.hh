//
// Frontend Interface and Registry
//
// A frontend is the type-introspection collaborator of the pipeline: it
// reads some input (a YAML type model, a C source file) and reports the
// translation unit's types and function declarations. Frontends register
// themselves with the FrontendRegistry and are looked up by name or by
// input file extension.
//

#pragma once

#include "types.hh"
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace harnessgen::frontend {

// ============================================================================
// Frontend Exceptions
// ============================================================================

/// Input could not be read or understood by a frontend
class frontend_error : public std::runtime_error {
public:
    explicit frontend_error(const std::string& msg)
        : std::runtime_error(msg) {}
};

/// Structurally invalid type model; names the offending entry
class model_error : public frontend_error {
public:
    model_error(const std::string& entry, const std::string& message)
        : frontend_error("invalid type model entry '" + entry + "': " + message),
          entry_(entry) {}

    const std::string& entry() const { return entry_; }

private:
    std::string entry_;
};

// ============================================================================
// BaseFrontend
// ============================================================================

class BaseFrontend {
public:
    virtual ~BaseFrontend() = default;

    /// Registry name ("yaml", "clang")
    [[nodiscard]] virtual std::string get_name() const = 0;

    /// One-line description for --list-frontends
    [[nodiscard]] virtual std::string get_description() const = 0;

    /// File extensions handled, with leading dot (".yaml")
    [[nodiscard]] virtual std::vector<std::string> get_extensions() const = 0;

    /// Load a translation unit
    /// @throws frontend_error
    virtual translation_unit load(const std::filesystem::path& path) = 0;

    /// Extra compiler arguments ("-I<dir>"); ignored by frontends that do
    /// not run a compiler
    virtual void set_compiler_args(const std::vector<std::string>& args) { (void)args; }
};

// ============================================================================
// FrontendRegistry
// ============================================================================

class FrontendRegistry {
public:
    /// Singleton access; the YAML frontend is always registered
    static FrontendRegistry& instance();

    FrontendRegistry(const FrontendRegistry&) = delete;
    FrontendRegistry(FrontendRegistry&&) = delete;
    FrontendRegistry& operator=(const FrontendRegistry&) = delete;
    FrontendRegistry& operator=(FrontendRegistry&&) = delete;

    /// Register (or replace) a frontend under its get_name()
    void register_frontend(std::unique_ptr<BaseFrontend> frontend);

    /// Lookup by name (case-insensitive), nullptr if unknown
    BaseFrontend* get_frontend(const std::string& name) const;

    /// Lookup by the extension of `path`, nullptr if no frontend claims it
    BaseFrontend* find_for_file(const std::filesystem::path& path) const;

    /// Registered names, sorted
    std::vector<std::string> get_available_frontends() const;

private:
    FrontendRegistry();

    static std::string normalize(const std::string& name);

    std::map<std::string, std::unique_ptr<BaseFrontend>> frontends_;
};

/**
 * Registers a frontend during static initialization.
 *
 * Usage:
 *   REGISTER_FRONTEND(ClangFrontend);
 *
 * The translation unit containing the macro must be linked into the
 * executable as an object file; the linker drops unreferenced members of
 * static archives together with their registrars.
 */
#define REGISTER_FRONTEND(FrontendClass)                                        \
    namespace {                                                                 \
        struct FrontendClass##_Registrar {                                      \
            FrontendClass##_Registrar() {                                       \
                ::harnessgen::frontend::FrontendRegistry::instance()            \
                    .register_frontend(std::make_unique<FrontendClass>());      \
            }                                                                   \
        };                                                                      \
        static FrontendClass##_Registrar g_##FrontendClass##_registrar;        \
    }

} // namespace harnessgen::frontend
