#include <harnessgen/frontend/yaml_frontend.hh>
#include <cctype>
#include <fstream>

namespace harnessgen::frontend {

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

    struct builtin_type {
        type_kind kind;
        const char* spelling;
    };

    const std::map<std::string, builtin_type>& builtin_types() {
        static const std::map<std::string, builtin_type> types = {
            {"int",                {type_kind::signed_int,     "int"}},
            {"signed",             {type_kind::signed_int,     "int"}},
            {"signed int",         {type_kind::signed_int,     "int"}},
            {"unsigned",           {type_kind::unsigned_int,   "unsigned int"}},
            {"unsigned int",       {type_kind::unsigned_int,   "unsigned int"}},
            {"char",               {type_kind::character,      "char"}},
            {"float",              {type_kind::floating_point, "float"}},
            {"double",             {type_kind::floating_point, "double"}},
            {"long double",        {type_kind::floating_point, "long double"}},
            {"void",               {type_kind::void_type,      "void"}},
            {"_Bool",              {type_kind::other,          "_Bool"}},
            {"short",              {type_kind::other,          "short"}},
            {"unsigned short",     {type_kind::other,          "unsigned short"}},
            {"long",               {type_kind::other,          "long"}},
            {"unsigned long",      {type_kind::other,          "unsigned long"}},
            {"long long",          {type_kind::other,          "long long"}},
            {"unsigned long long", {type_kind::other,          "unsigned long long"}},
            {"signed char",        {type_kind::other,          "signed char"}},
            {"unsigned char",      {type_kind::other,          "unsigned char"}},
        };
        return types;
    }

    // "struct  point**" -> {"struct point", 2}
    std::pair<std::string, size_t> split_reference(const std::string& reference) {
        std::string base;
        size_t depth = 0;
        bool pending_space = false;

        for (char c : reference) {
            if (c == '*') {
                ++depth;
                pending_space = false;
                continue;
            }
            if (depth > 0 && !std::isspace(static_cast<unsigned char>(c))) {
                // "int * x" or "int *const": not a plain reference
                return {"", 0};
            }
            if (std::isspace(static_cast<unsigned char>(c))) {
                pending_space = !base.empty();
                continue;
            }
            if (pending_space) {
                base += ' ';
                pending_space = false;
            }
            base += c;
        }
        return {base, depth};
    }

    std::string strip_tag(const std::string& base) {
        for (const char* tag : {"struct ", "union ", "enum "}) {
            std::string prefix(tag);
            if (base.compare(0, prefix.size(), prefix) == 0) {
                return base.substr(prefix.size());
            }
        }
        return base;
    }

    type_kind parse_kind(const std::string& kind, const std::string& context) {
        if (kind == "struct")   return type_kind::record;
        if (kind == "union")    return type_kind::union_type;
        if (kind == "enum")     return type_kind::enum_type;
        if (kind == "pointer")  return type_kind::pointer;
        if (kind == "array")    return type_kind::array;
        if (kind == "function") return type_kind::function_type;
        throw model_error(context, "unknown kind '" + kind + "'");
    }

    std::string default_spelling(type_kind kind, const std::string& name) {
        switch (kind) {
            case type_kind::record:     return "struct " + name;
            case type_kind::union_type: return "union " + name;
            case type_kind::enum_type:  return "enum " + name;
            default:                    return name;
        }
    }

    size_t require_unsigned(const fkyaml::node& node,
                            const std::string& key,
                            const std::string& context) {
        if (!node.contains(key) || !node[key].is_integer()) {
            throw model_error(context, "'" + key + "' must be an integer");
        }
        auto value = node[key].get_value<int64_t>();
        if (value < 0) {
            throw model_error(context, "'" + key + "' must not be negative");
        }
        return static_cast<size_t>(value);
    }

} // anonymous namespace

// ============================================================================
// YamlFrontend
// ============================================================================

std::string YamlFrontend::get_description() const {
    return "YAML type model (types and function declarations of one translation unit)";
}

std::vector<std::string> YamlFrontend::get_extensions() const {
    return {".yaml", ".yml"};
}

translation_unit YamlFrontend::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw frontend_error("Failed to open file: " + path.string());
    }

    fkyaml::node root;
    try {
        root = fkyaml::node::deserialize(file);
    } catch (const std::exception& e) {
        throw frontend_error("Failed to parse YAML: " + std::string(e.what()));
    }

    return load_from_yaml(root);
}

translation_unit YamlFrontend::load_from_yaml(const fkyaml::node& root) {
    if (!root.is_mapping()) {
        throw model_error("<root>", "document must be a mapping");
    }

    translation_unit tu;
    tu.spelling = require_string(root, "translation_unit", "<root>");
    tu.primary_file = tu.spelling;
    if (root.contains("primary_file")) {
        tu.primary_file = require_string(root, "primary_file", "<root>");
    }

    model_state state;
    state.tu = &tu;

    if (root.contains("types")) {
        const auto& types = root["types"];
        if (!types.is_mapping()) {
            throw model_error("types", "must be a mapping");
        }
        state.types = &types;
        declare_types(state);

        for (auto it = types.begin(); it != types.end(); ++it) {
            define_type(state, it.key().get_value<std::string>(), *it);
        }
    }

    if (root.contains("functions")) {
        const auto& functions = root["functions"];
        if (!functions.is_sequence()) {
            throw model_error("functions", "must be a sequence");
        }
        for (size_t i = 0; i < functions.size(); ++i) {
            parse_function(state, functions[i], i);
        }
    }

    return tu;
}

// ============================================================================
// Types
// ============================================================================

void YamlFrontend::declare_types(model_state& state) {
    // Every named type exists before any field is resolved, so fields may
    // refer to types declared later in the document
    for (auto it = state.types->begin(); it != state.types->end(); ++it) {
        std::string name = it.key().get_value<std::string>();
        const auto& node = *it;
        std::string context = "types." + name;

        if (!node.is_mapping()) {
            throw model_error(context, "must be a mapping");
        }

        type_kind kind = parse_kind(require_string(node, "kind", context), context);
        std::string spelling = node.contains("spelling")
            ? require_string(node, "spelling", context)
            : default_spelling(kind, name);

        type_descriptor* type = state.tu->types.create(kind, spelling);
        state.declared[name] = type;
        state.resolved[name] = type;
    }
}

void YamlFrontend::define_type(model_state& state, const std::string& name, const fkyaml::node& node) {
    std::string context = "types." + name;
    type_descriptor* type = state.declared.at(name);

    switch (type->kind) {
        case type_kind::record:
        case type_kind::union_type: {
            if (!node.contains("fields")) {
                type->complete = false;
                break;
            }
            const auto& fields = node["fields"];
            if (!fields.is_sequence()) {
                throw model_error(context, "'fields' must be a sequence");
            }
            for (size_t i = 0; i < fields.size(); ++i) {
                std::string field_context = context + ".fields[" + std::to_string(i) + "]";
                const auto& field = fields[i];
                if (!field.is_mapping()) {
                    throw model_error(field_context, "must be a mapping");
                }

                field_descriptor fd;
                fd.name = require_string(field, "name", field_context);
                fd.type = resolve(state, require_string(field, "type", field_context), field_context);
                type->fields.push_back(std::move(fd));
            }
            break;
        }

        case type_kind::pointer: {
            type->pointee = resolve(state, require_string(node, "pointee", context), context);
            if (!node.contains("spelling")) {
                type->spelling = type->pointee->spelling + " *";
            }
            break;
        }

        default:
            break;
    }
}

const type_descriptor* YamlFrontend::resolve(model_state& state,
                                             const std::string& reference,
                                             const std::string& context) {
    auto [base, depth] = split_reference(reference);
    if (base.empty()) {
        throw model_error(context, "malformed type reference '" + reference + "'");
    }

    std::string key = base;
    if (depth > 0) {
        key += " " + std::string(depth, '*');
    }

    auto it = state.resolved.find(key);
    if (it != state.resolved.end()) {
        return it->second;
    }

    const type_descriptor* result = nullptr;
    if (depth > 0) {
        const type_descriptor* pointee =
            resolve(state, base + std::string(depth - 1, '*'), context);
        result = state.tu->types.make_pointer(pointee);
    } else if (auto declared = state.declared.find(strip_tag(base)); declared != state.declared.end()) {
        result = declared->second;
    } else if (auto builtin = builtin_types().find(base); builtin != builtin_types().end()) {
        result = state.tu->types.make_primitive(builtin->second.kind, builtin->second.spelling);
    } else {
        throw model_error(context, "unknown type '" + base + "'");
    }

    state.resolved[key] = result;
    return result;
}

// ============================================================================
// Functions
// ============================================================================

void YamlFrontend::parse_function(model_state& state, const fkyaml::node& node, size_t index) {
    std::string context = "functions[" + std::to_string(index) + "]";
    if (!node.is_mapping()) {
        throw model_error(context, "must be a mapping");
    }

    function_decl fn;
    fn.name = require_string(node, "name", context);
    context = "functions." + fn.name;

    fn.location.file_path = node.contains("file")
        ? require_string(node, "file", context)
        : state.tu->primary_file;
    fn.location.line = require_unsigned(node, "line", context);
    fn.location.column = node.contains("column") ? require_unsigned(node, "column", context) : 1;

    if (node.contains("params")) {
        const auto& params = node["params"];
        if (!params.is_sequence()) {
            throw model_error(context, "'params' must be a sequence");
        }
        for (size_t i = 0; i < params.size(); ++i) {
            std::string param_context = context + ".params[" + std::to_string(i) + "]";
            const auto& param = params[i];
            if (!param.is_mapping()) {
                throw model_error(param_context, "must be a mapping");
            }

            parameter_decl pd;
            // Unnamed prototype parameters still need a variable
            pd.name = param.contains("name")
                ? require_string(param, "name", param_context)
                : "arg" + std::to_string(i);
            pd.type = resolve(state, require_string(param, "type", param_context), param_context);
            fn.parameters.push_back(std::move(pd));
        }
    }

    state.tu->functions.push_back(std::move(fn));
}

std::string YamlFrontend::require_string(const fkyaml::node& node,
                                         const std::string& key,
                                         const std::string& context) {
    if (!node.contains(key) || !node[key].is_string()) {
        throw model_error(context, "'" + key + "' must be a string");
    }
    return node[key].get_value<std::string>();
}

} // namespace harnessgen::frontend
