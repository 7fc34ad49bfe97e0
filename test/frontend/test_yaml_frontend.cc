//
// Unit tests for the YAML type-model frontend
//

#include <doctest/doctest.h>
#include <harnessgen/frontend/yaml_frontend.hh>
#include <harnessgen/generator.hh>
#include <harnessgen/harness_error.hh>

#include <string>

using namespace harnessgen;
using namespace harnessgen::frontend;

namespace {
    translation_unit load_text(const std::string& text) {
        YamlFrontend frontend;
        return frontend.load_from_yaml(fkyaml::node::deserialize(text));
    }

    const function_decl& function_named(const translation_unit& tu, const std::string& name) {
        for (const auto& fn : tu.functions) {
            if (fn.name == name) return fn;
        }
        FAIL("function not found: " << name);
        return tu.functions.front();
    }
}

TEST_SUITE("YAML Frontend") {
    TEST_CASE("Builtin parameter types") {
        auto tu = load_text(
            "translation_unit: main.c\n"
            "functions:\n"
            "  - name: f\n"
            "    line: 3\n"
            "    params:\n"
            "      - { name: n, type: int }\n"
            "      - { name: u, type: unsigned int }\n"
            "      - { name: c, type: char }\n"
            "      - { name: d, type: double }\n");

        CHECK(tu.spelling == "main.c");
        CHECK(tu.primary_file == "main.c");
        REQUIRE(tu.functions.size() == 1);

        const auto& fn = tu.functions[0];
        CHECK(fn.location.file_path == "main.c");
        CHECK(fn.location.line == 3);
        CHECK(fn.location.column == 1);
        REQUIRE(fn.parameters.size() == 4);
        CHECK(fn.parameters[0].type->kind == type_kind::signed_int);
        CHECK(fn.parameters[1].type->kind == type_kind::unsigned_int);
        CHECK(fn.parameters[1].type->spelling == "unsigned int");
        CHECK(fn.parameters[2].type->kind == type_kind::character);
        CHECK(fn.parameters[3].type->kind == type_kind::floating_point);
    }

    TEST_CASE("Structs and pointer references") {
        auto tu = load_text(
            "translation_unit: main.c\n"
            "types:\n"
            "  point:\n"
            "    kind: struct\n"
            "    fields:\n"
            "      - { name: a, type: int }\n"
            "      - { name: b, type: char }\n"
            "functions:\n"
            "  - name: move\n"
            "    line: 8\n"
            "    params:\n"
            "      - { name: p, type: \"struct point *\" }\n"
            "      - { name: q, type: \"point\" }\n");

        const auto& fn = function_named(tu, "move");
        REQUIRE(fn.parameters.size() == 2);

        const type_descriptor* ptr = fn.parameters[0].type;
        REQUIRE(ptr->kind == type_kind::pointer);
        CHECK(ptr->spelling == "struct point *");
        REQUIRE(ptr->pointee != nullptr);
        CHECK(ptr->pointee == fn.parameters[1].type);

        const type_descriptor* point = fn.parameters[1].type;
        CHECK(point->kind == type_kind::record);
        CHECK(point->spelling == "struct point");
        CHECK(point->complete);
        REQUIRE(point->fields.size() == 2);
        CHECK(point->fields[0].name == "a");
        CHECK(point->fields[1].type->kind == type_kind::character);
    }

    TEST_CASE("Double pointer and custom spelling") {
        auto tu = load_text(
            "translation_unit: main.c\n"
            "types:\n"
            "  point_t:\n"
            "    kind: struct\n"
            "    spelling: point_t\n"
            "    fields:\n"
            "      - { name: x, type: int }\n"
            "functions:\n"
            "  - name: f\n"
            "    line: 1\n"
            "    params:\n"
            "      - { name: pp, type: \"point_t **\" }\n");

        const type_descriptor* pp = tu.functions[0].parameters[0].type;
        CHECK(pp->spelling == "point_t **");
        REQUIRE(pp->pointee != nullptr);
        CHECK(pp->pointee->spelling == "point_t *");
        CHECK(pp->pointee->pointee->spelling == "point_t");
    }

    TEST_CASE("Fields may refer to types declared later") {
        auto tu = load_text(
            "translation_unit: main.c\n"
            "types:\n"
            "  outer:\n"
            "    kind: struct\n"
            "    fields:\n"
            "      - { name: in, type: inner }\n"
            "  inner:\n"
            "    kind: struct\n"
            "    fields:\n"
            "      - { name: v, type: unsigned }\n"
            "functions:\n"
            "  - name: f\n"
            "    line: 1\n"
            "    params:\n"
            "      - { name: o, type: outer }\n");

        const type_descriptor* outer = tu.functions[0].parameters[0].type;
        REQUIRE(outer->fields.size() == 1);
        CHECK(outer->fields[0].type->spelling == "struct inner");
        CHECK(outer->fields[0].type->fields[0].type->kind == type_kind::unsigned_int);
    }

    TEST_CASE("Struct without fields is a forward declaration") {
        auto tu = load_text(
            "translation_unit: main.c\n"
            "types:\n"
            "  opaque:\n"
            "    kind: struct\n"
            "functions:\n"
            "  - name: use\n"
            "    line: 2\n"
            "    params:\n"
            "      - { name: o, type: \"opaque *\" }\n");

        const type_descriptor* ptr = tu.functions[0].parameters[0].type;
        CHECK_FALSE(ptr->pointee->complete);

        CHECK_THROWS_AS(generate_harness(tu, {}), missing_declaration_error);
    }

    TEST_CASE("Function defaults") {
        auto tu = load_text(
            "translation_unit: src/main.c\n"
            "primary_file: src/main.c\n"
            "functions:\n"
            "  - name: proto\n"
            "    file: include/api.h\n"
            "    line: 4\n"
            "    column: 6\n"
            "    params:\n"
            "      - { type: int }\n"
            "      - { type: char }\n"
            "  - name: local\n"
            "    line: 9\n");

        const auto& proto = function_named(tu, "proto");
        CHECK(proto.location.file_path == "include/api.h");
        CHECK(proto.location.column == 6);
        REQUIRE(proto.parameters.size() == 2);
        CHECK(proto.parameters[0].name == "arg0");
        CHECK(proto.parameters[1].name == "arg1");

        const auto& local = function_named(tu, "local");
        CHECK(local.location.file_path == "src/main.c");
        CHECK(local.parameters.empty());
    }

    TEST_CASE("Invalid models name the offending entry") {
        SUBCASE("unknown type") {
            try {
                load_text(
                    "translation_unit: main.c\n"
                    "functions:\n"
                    "  - name: f\n"
                    "    line: 1\n"
                    "    params:\n"
                    "      - { name: x, type: widget }\n");
                FAIL("expected model_error");
            } catch (const model_error& e) {
                CHECK(e.entry() == "functions.f.params[0]");
                CHECK(std::string(e.what()).find("widget") != std::string::npos);
            }
        }

        SUBCASE("missing translation unit") {
            CHECK_THROWS_AS(load_text("functions: []\n"), model_error);
        }

        SUBCASE("unknown kind") {
            CHECK_THROWS_AS(load_text(
                "translation_unit: main.c\n"
                "types:\n"
                "  t:\n"
                "    kind: class\n"), model_error);
        }

        SUBCASE("negative line") {
            CHECK_THROWS_AS(load_text(
                "translation_unit: main.c\n"
                "functions:\n"
                "  - name: f\n"
                "    line: -2\n"), model_error);
        }

        SUBCASE("document is not a mapping") {
            CHECK_THROWS_AS(load_text("- a\n- b\n"), model_error);
        }
    }

    TEST_CASE("Loading a missing file is a frontend error") {
        YamlFrontend frontend;
        CHECK_THROWS_AS(frontend.load("/nonexistent/harnessgen/model.yaml"), frontend_error);
    }
}
