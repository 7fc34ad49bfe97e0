//
// Unit tests for the initializer synthesizer
//

#include <doctest/doctest.h>
#include <harnessgen/harness_error.hh>
#include <harnessgen/synthesizer.hh>
#include "type_fixtures.hh"

using namespace harnessgen;
using harnessgen::test::type_fixture;

TEST_SUITE("Synthesizer") {
    TEST_CASE("Read statements per primitive subkind") {
        CHECK(read_statement(type_kind::signed_int, "a") == "scanf(\"%d\", &a);");
        CHECK(read_statement(type_kind::unsigned_int, "u") == "scanf(\"%u\", &u);");
        CHECK(read_statement(type_kind::character, "c") == "scanf(\" %c\", &c);");
        CHECK_THROWS_AS(read_statement(type_kind::pointer, "p"), unsupported_type_kind_error);
    }

    TEST_CASE("Struct with two ints") {
        type_fixture f;
        auto* point = f.record("struct point", {{"a", f.int_t}, {"b", f.int_t}});

        auto inits = synthesize(flatten(*point, "p"));

        REQUIRE(inits.size() == 3);
        CHECK(inits[0].declaration == "int a;");
        CHECK(inits[1].declaration == "int b;");
        CHECK(inits[2].declaration == "struct point p;");

        CHECK(inits[0].assignments == std::vector<std::string>{"scanf(\"%d\", &a);"});
        CHECK(inits[1].assignments == std::vector<std::string>{"scanf(\"%d\", &b);"});
        CHECK(inits[2].assignments == std::vector<std::string>{"p.a = a;", "p.b = b;"});
    }

    TEST_CASE("Pointer to int") {
        type_fixture f;

        auto inits = synthesize(flatten(*f.pointer_to(f.int_t), "x"));

        REQUIRE(inits.size() == 2);
        CHECK(inits[0].declaration == "int x_v;");
        CHECK(inits[0].assignments == std::vector<std::string>{"scanf(\"%d\", &x_v);"});
        CHECK(inits[1].declaration == "int * x;");
        CHECK(inits[1].assignments == std::vector<std::string>{"x = &x_v;"});
    }

    TEST_CASE("Declaration spelling is used verbatim") {
        type_fixture f;
        auto* typedefed = f.record("point_t", {{"a", f.char_t}});

        auto inits = synthesize(flatten(*typedefed, "p"));

        REQUIRE(inits.size() == 2);
        CHECK(inits[0].declaration == "char a;");
        CHECK(inits[1].declaration == "point_t p;");
    }

    TEST_CASE("Nested struct as last field binds whole subtrees") {
        type_fixture f;
        auto* inner = f.record("struct inner", {{"c", f.int_t}, {"d", f.uint_t}});
        auto* outer = f.record("struct outer", {{"b", f.char_t}, {"a", inner}});

        auto inits = synthesize(flatten(*outer, "o"));

        REQUIRE(inits.size() == 5);
        CHECK(inits[3].assignments == std::vector<std::string>{"a.c = c;", "a.d = d;"});
        CHECK(inits[4].assignments == std::vector<std::string>{"o.b = b;", "o.a = a;"});
    }

    TEST_CASE("Struct holding a pointer to a struct") {
        type_fixture f;
        auto* leaf = f.record("struct leaf", {{"v", f.int_t}});
        auto* node = f.record("struct node", {{"next", f.pointer_to(leaf)}, {"id", f.uint_t}});

        // [0] v, [1] next_v, [2] next, [3] id, [4] n
        auto inits = synthesize(flatten(*node, "n"));

        REQUIRE(inits.size() == 5);
        CHECK(inits[1].declaration == "struct leaf next_v;");
        CHECK(inits[1].assignments == std::vector<std::string>{"next_v.v = v;"});
        CHECK(inits[2].assignments == std::vector<std::string>{"next = &next_v;"});
        CHECK(inits[3].assignments == std::vector<std::string>{"scanf(\"%u\", &id);"});
        CHECK(inits[4].assignments == std::vector<std::string>{"n.next = next;", "n.id = id;"});
    }

    TEST_CASE("Empty struct has a declaration and no assignments") {
        type_fixture f;
        auto inits = synthesize(flatten(*f.record("struct empty", {}), "e"));

        REQUIRE(inits.size() == 1);
        CHECK(inits[0].declaration == "struct empty e;");
        CHECK(inits[0].assignments.empty());
    }

    TEST_CASE("Empty sequence yields no initializers") {
        CHECK(synthesize({}).empty());
    }

    TEST_CASE("Unsupported entry is rejected at synthesis") {
        type_fixture f;
        flat_sequence seq = {{f.double_t, "d", 0}};

        try {
            synthesize(seq);
            FAIL("expected unsupported_type_kind_error");
        } catch (const unsupported_type_kind_error& e) {
            CHECK(e.stage() == pipeline_stage::synthesize);
            CHECK(e.offending_kind() == type_kind::floating_point);
        }
    }

    TEST_CASE("Malformed sequences are internal errors") {
        type_fixture f;

        SUBCASE("pointer without pointee entry") {
            flat_sequence seq = {{f.pointer_to(f.int_t), "x", 1}};
            CHECK_THROWS_AS(synthesize(seq), malformed_sequence_error);
        }

        SUBCASE("record child count disagrees with its fields") {
            auto* point = f.record("struct point", {{"a", f.int_t}, {"b", f.int_t}});
            flat_sequence seq = {{f.int_t, "a", 0}, {point, "p", 1}};
            CHECK_THROWS_AS(synthesize(seq), malformed_sequence_error);
        }

        SUBCASE("primitive claiming dependencies") {
            flat_sequence seq = {{f.int_t, "a", 0}, {f.int_t, "b", 1}};
            CHECK_THROWS_AS(synthesize(seq), malformed_sequence_error);
        }
    }
}
