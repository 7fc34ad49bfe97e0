#pragma once

#include <harnessgen/frontend.hh>
#include <string>
#include <vector>

namespace harnessgen::frontend {

/**
 * Loads a translation unit by parsing a C file with the clang frontend.
 *
 * Every FunctionDecl of the AST is enumerated (including those pulled in
 * from headers); the primary file is the parsed file itself. Parameter
 * types are mapped to type descriptors through their canonical type while
 * the spelling keeps the written form ("point_t", "struct point *").
 */
class ClangFrontend : public BaseFrontend {
public:
    [[nodiscard]] std::string get_name() const override { return "clang"; }
    [[nodiscard]] std::string get_description() const override;
    [[nodiscard]] std::vector<std::string> get_extensions() const override;

    /// @throws frontend_error if the file cannot be read or has errors
    translation_unit load(const std::filesystem::path& path) override;

    /// Parse C source held in memory; `file_name` becomes the primary file
    translation_unit load_from_source(const std::string& source, const std::string& file_name);

    void set_compiler_args(const std::vector<std::string>& args) override { compiler_args_ = args; }

private:
    std::vector<std::string> compiler_args_;
};

} // namespace harnessgen::frontend
