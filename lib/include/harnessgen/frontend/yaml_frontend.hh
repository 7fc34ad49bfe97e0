#pragma once

#include <harnessgen/frontend.hh>
#include <map>
#include <string>

// fkYAML uses versioned namespaces, so we need to include the header
#include <fkYAML/node.hpp>

namespace harnessgen::frontend {

/**
 * Loads a translation unit from a YAML type model.
 *
 * The model describes what a C type-introspection service would report:
 *
 *   translation_unit: main.c
 *   primary_file: main.c            # optional, defaults to translation_unit
 *   types:
 *     point:
 *       kind: struct
 *       fields:
 *         - { name: x, type: int }
 *         - { name: next, type: "point *" }
 *     opaque:
 *       kind: struct                # no 'fields': forward declaration only
 *   functions:
 *     - name: process
 *       file: main.c                # optional, defaults to primary_file
 *       line: 12
 *       params:
 *         - { name: p, type: point }
 *
 * Type references are builtin C names ("int", "unsigned int", "char",
 * "double", ...), names declared under 'types' (optionally written as
 * "struct point"), each optionally followed by one or more '*'.
 */
class YamlFrontend : public BaseFrontend {
public:
    [[nodiscard]] std::string get_name() const override { return "yaml"; }
    [[nodiscard]] std::string get_description() const override;
    [[nodiscard]] std::vector<std::string> get_extensions() const override;

    /// @throws frontend_error if the file cannot be read or parsed
    /// @throws model_error for invalid entries
    translation_unit load(const std::filesystem::path& path) override;

    /// Build a translation unit from an already parsed document (for testing)
    /// @throws model_error for invalid entries
    translation_unit load_from_yaml(const fkyaml::node& root);

private:
    /// Per-load state
    struct model_state {
        translation_unit* tu = nullptr;
        const fkyaml::node* types = nullptr;

        /// Resolved references, keyed by normalized reference ("point **")
        std::map<std::string, const type_descriptor*> resolved;

        /// Declared types, created before any of them is filled in
        std::map<std::string, type_descriptor*> declared;
    };

    void declare_types(model_state& state);
    void define_type(model_state& state, const std::string& name, const fkyaml::node& node);
    void parse_function(model_state& state, const fkyaml::node& node, size_t index);

    const type_descriptor* resolve(model_state& state,
                                   const std::string& reference,
                                   const std::string& context);

    static std::string require_string(const fkyaml::node& node,
                                      const std::string& key,
                                      const std::string& context);
};

} // namespace harnessgen::frontend
