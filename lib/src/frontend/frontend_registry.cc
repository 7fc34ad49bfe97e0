//
// Frontend Registry Implementation
//

#include <harnessgen/frontend.hh>
#include <harnessgen/frontend/yaml_frontend.hh>
#include <algorithm>
#include <cctype>

namespace harnessgen::frontend {

// ============================================================================
// Singleton Access
// ============================================================================

FrontendRegistry& FrontendRegistry::instance() {
    static FrontendRegistry registry;
    return registry;
}

// The YAML frontend lives in the same static library as the registry, so
// it is registered here instead of through a static registrar that the
// linker might discard.
FrontendRegistry::FrontendRegistry() {
    auto yaml = std::make_unique<YamlFrontend>();
    std::string name = normalize(yaml->get_name());
    frontends_[name] = std::move(yaml);
}

// ============================================================================
// Registration & Lookup
// ============================================================================

void FrontendRegistry::register_frontend(std::unique_ptr<BaseFrontend> frontend) {
    std::string name = normalize(frontend->get_name());
    frontends_[name] = std::move(frontend);
}

BaseFrontend* FrontendRegistry::get_frontend(const std::string& name) const {
    auto it = frontends_.find(normalize(name));
    return (it != frontends_.end()) ? it->second.get() : nullptr;
}

BaseFrontend* FrontendRegistry::find_for_file(const std::filesystem::path& path) const {
    std::string ext = normalize(path.extension().string());
    if (ext.empty()) {
        return nullptr;
    }

    for (const auto& [name, frontend] : frontends_) {
        for (const auto& candidate : frontend->get_extensions()) {
            if (normalize(candidate) == ext) {
                return frontend.get();
            }
        }
    }
    return nullptr;
}

std::vector<std::string> FrontendRegistry::get_available_frontends() const {
    std::vector<std::string> names;
    names.reserve(frontends_.size());
    for (const auto& [name, frontend] : frontends_) {
        names.push_back(name);
    }
    return names;  // std::map keeps them sorted
}

std::string FrontendRegistry::normalize(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

} // namespace harnessgen::frontend
