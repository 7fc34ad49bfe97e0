//
// Target Selector Implementation
//

#include <harnessgen/target_selector.hh>
#include <harnessgen/harness_error.hh>
#include <filesystem>

namespace harnessgen {

bool is_same_file(const std::string& file, const std::string& primary_file) {
    if (file == primary_file) {
        return true;
    }
    if (file.empty() || primary_file.empty()) {
        return false;
    }
    namespace fs = std::filesystem;
    return fs::path(file).lexically_normal() == fs::path(primary_file).lexically_normal();
}

selection_key make_selection_key(const function_decl& fn, const std::string& primary_file) {
    return {is_same_file(fn.location.file_path, primary_file), fn.location.line};
}

const function_decl& select_target(const std::vector<function_decl>& functions,
                                   const std::string& primary_file) {
    const function_decl* best = nullptr;
    selection_key best_key;

    for (const auto& fn : functions) {
        selection_key key = make_selection_key(fn, primary_file);
        if (!best || best_key < key) {
            best = &fn;
            best_key = key;
        }
    }

    if (!best || !best_key.in_primary_file) {
        throw no_function_found_error(primary_file);
    }
    return *best;
}

const function_decl& select_target_by_name(const std::vector<function_decl>& functions,
                                           const std::string& primary_file,
                                           const std::string& name) {
    const function_decl* best = nullptr;
    selection_key best_key;

    for (const auto& fn : functions) {
        if (fn.name != name) continue;

        selection_key key = make_selection_key(fn, primary_file);
        if (!key.in_primary_file) continue;

        if (!best || best_key < key) {
            best = &fn;
            best_key = key;
        }
    }

    if (!best) {
        throw no_function_found_error(primary_file, name);
    }
    return *best;
}

} // namespace harnessgen
