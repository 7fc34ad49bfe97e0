#include <harnessgen/frontend/clang_frontend.hh>

#include "clang/AST/ASTContext.h"
#include "clang/AST/Decl.h"
#include "clang/AST/RecursiveASTVisitor.h"
#include "clang/AST/Type.h"
#include "clang/Basic/SourceManager.h"
#include "clang/Frontend/ASTUnit.h"
#include "clang/Tooling/Tooling.h"

#include <fstream>
#include <map>
#include <sstream>
#include <utility>

namespace harnessgen::frontend {

namespace {

    // ========================================================================
    // Type mapping
    // ========================================================================

    class type_mapper {
    public:
        type_mapper(type_table& types, const clang::ASTContext& context)
            : types_(types), policy_(context.getPrintingPolicy()) {}

        const type_descriptor* map(clang::QualType qt) {
            auto key = qt.getAsOpaquePtr();
            if (auto it = mapped_.find(key); it != mapped_.end()) {
                return it->second;
            }

            std::string spelling = qt.getAsString(policy_);
            clang::QualType canonical = qt.getCanonicalType();

            if (const auto* builtin = canonical->getAs<clang::BuiltinType>()) {
                return remember(key, types_.make_primitive(map_builtin(*builtin), spelling));
            }

            if (canonical->isPointerType()) {
                // Registered before the pointee is mapped so that records
                // pointing to themselves terminate here
                type_descriptor* pointer = types_.create(type_kind::pointer, spelling);
                remember(key, pointer);
                pointer->pointee = map(qt->getPointeeType());
                return pointer;
            }

            if (const auto* record = canonical->getAs<clang::RecordType>()) {
                return map_record(key, *record->getDecl(), spelling);
            }

            type_kind kind = type_kind::other;
            if (canonical->isArrayType()) {
                kind = type_kind::array;
            } else if (canonical->isEnumeralType()) {
                kind = type_kind::enum_type;
            } else if (canonical->isFunctionType()) {
                kind = type_kind::function_type;
            }
            return remember(key, types_.create(kind, spelling));
        }

    private:
        type_table& types_;
        clang::PrintingPolicy policy_;
        std::map<void*, const type_descriptor*> mapped_;
        std::map<std::pair<const clang::RecordDecl*, std::string>, type_descriptor*> records_;

        const type_descriptor* remember(void* key, const type_descriptor* type) {
            mapped_[key] = type;
            return type;
        }

        static type_kind map_builtin(const clang::BuiltinType& builtin) {
            switch (builtin.getKind()) {
                case clang::BuiltinType::Int:
                    return type_kind::signed_int;
                case clang::BuiltinType::UInt:
                    return type_kind::unsigned_int;
                case clang::BuiltinType::Char_S:
                case clang::BuiltinType::Char_U:
                    return type_kind::character;
                case clang::BuiltinType::Void:
                    return type_kind::void_type;
                default:
                    return builtin.isFloatingPoint() ? type_kind::floating_point
                                                     : type_kind::other;
            }
        }

        const type_descriptor* map_record(void* key,
                                          const clang::RecordDecl& decl,
                                          const std::string& spelling) {
            const clang::RecordDecl* canonical_decl = decl.getCanonicalDecl();
            auto record_key = std::make_pair(canonical_decl, spelling);
            if (auto it = records_.find(record_key); it != records_.end()) {
                return remember(key, it->second);
            }

            type_descriptor* type = types_.create(
                decl.isUnion() ? type_kind::union_type : type_kind::record, spelling);
            records_[record_key] = type;
            remember(key, type);

            const clang::RecordDecl* definition = decl.getDefinition();
            if (!definition) {
                type->complete = false;
                return type;
            }

            for (const clang::FieldDecl* field : definition->fields()) {
                field_descriptor fd;
                fd.name = field->getNameAsString();
                if (field->isBitField()) {
                    fd.type = types_.create(type_kind::other,
                                            field->getType().getAsString(policy_) + " (bit-field)");
                } else {
                    fd.type = map(field->getType());
                }
                type->fields.push_back(std::move(fd));
            }
            return type;
        }
    };

    // ========================================================================
    // Function enumeration
    // ========================================================================

    class function_collector : public clang::RecursiveASTVisitor<function_collector> {
    public:
        function_collector(translation_unit& tu, clang::ASTContext& context)
            : tu_(tu), context_(context), mapper_(tu.types, context) {}

        bool VisitFunctionDecl(clang::FunctionDecl* decl) {
            const clang::SourceManager& sm = context_.getSourceManager();
            clang::PresumedLoc loc = sm.getPresumedLoc(decl->getLocation());

            function_decl fn;
            fn.name = decl->getNameAsString();
            if (loc.isValid()) {
                fn.location.file_path = loc.getFilename();
                fn.location.line = loc.getLine();
                fn.location.column = loc.getColumn();
            }

            unsigned index = 0;
            for (const clang::ParmVarDecl* param : decl->parameters()) {
                parameter_decl pd;
                pd.name = param->getNameAsString();
                if (pd.name.empty()) {
                    pd.name = "arg" + std::to_string(index);
                }
                pd.type = mapper_.map(param->getType());
                fn.parameters.push_back(std::move(pd));
                ++index;
            }

            tu_.functions.push_back(std::move(fn));
            return true;
        }

    private:
        translation_unit& tu_;
        clang::ASTContext& context_;
        type_mapper mapper_;
    };

} // anonymous namespace

// ============================================================================
// ClangFrontend
// ============================================================================

std::string ClangFrontend::get_description() const {
    return "C source parsed with the clang frontend";
}

std::vector<std::string> ClangFrontend::get_extensions() const {
    return {".c", ".h"};
}

translation_unit ClangFrontend::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw frontend_error("Failed to open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_source(buffer.str(), path.string());
}

translation_unit ClangFrontend::load_from_source(const std::string& source,
                                                 const std::string& file_name) {
    std::vector<std::string> args = {"-xc", "-std=c11", "-fsyntax-only"};
    args.insert(args.end(), compiler_args_.begin(), compiler_args_.end());

    std::unique_ptr<clang::ASTUnit> ast =
        clang::tooling::buildASTFromCodeWithArgs(source, args, file_name);
    if (!ast) {
        throw frontend_error("Failed to parse " + file_name);
    }
    if (ast->getDiagnostics().hasErrorOccurred()) {
        throw frontend_error("Errors while parsing " + file_name);
    }

    translation_unit tu;
    tu.spelling = file_name;
    tu.primary_file = file_name;

    function_collector collector(tu, ast->getASTContext());
    collector.TraverseDecl(ast->getASTContext().getTranslationUnitDecl());
    return tu;
}

REGISTER_FRONTEND(ClangFrontend);

} // namespace harnessgen::frontend
