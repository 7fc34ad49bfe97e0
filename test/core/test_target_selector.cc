//
// Unit tests for target selection
//

#include <doctest/doctest.h>
#include <harnessgen/harness_error.hh>
#include <harnessgen/target_selector.hh>

using namespace harnessgen;

namespace {
    function_decl make_function(const std::string& name, const std::string& file, size_t line) {
        function_decl fn;
        fn.name = name;
        fn.location = {file, line, 1};
        return fn;
    }
}

TEST_SUITE("Target Selector") {
    TEST_CASE("Greatest line in the primary file wins") {
        std::vector<function_decl> functions = {
            make_function("early", "main.c", 10),
            make_function("late", "main.c", 40),
        };

        CHECK(select_target(functions, "main.c").name == "late");
    }

    TEST_CASE("Enumeration order does not matter") {
        std::vector<function_decl> functions = {
            make_function("late", "main.c", 40),
            make_function("early", "main.c", 10),
        };

        CHECK(select_target(functions, "main.c").name == "late");
    }

    TEST_CASE("Declarations from other files never outrank the primary file") {
        std::vector<function_decl> functions = {
            make_function("printf", "/usr/include/stdio.h", 900),
            make_function("target", "main.c", 3),
            make_function("helper", "util.h", 500),
        };

        CHECK(select_target(functions, "main.c").name == "target");
    }

    TEST_CASE("Selection is not name-based") {
        std::vector<function_decl> functions = {
            make_function("zzz", "main.c", 5),
            make_function("aaa", "main.c", 6),
        };

        CHECK(select_target(functions, "main.c").name == "aaa");
    }

    TEST_CASE("Equal keys keep the first enumerated declaration") {
        std::vector<function_decl> functions = {
            make_function("first", "main.c", 7),
            make_function("second", "main.c", 7),
        };

        CHECK(select_target(functions, "main.c").name == "first");
    }

    TEST_CASE("Paths are compared after normalization") {
        std::vector<function_decl> functions = {
            make_function("f", "./src/../main.c", 2),
        };

        CHECK(is_same_file("./src/../main.c", "main.c"));
        CHECK(select_target(functions, "main.c").name == "f");
    }

    TEST_CASE("No candidate is fatal") {
        SUBCASE("empty enumeration") {
            std::vector<function_decl> functions;
            CHECK_THROWS_AS(select_target(functions, "main.c"), no_function_found_error);
        }

        SUBCASE("only declarations from other files") {
            std::vector<function_decl> functions = {
                make_function("printf", "/usr/include/stdio.h", 900),
            };
            try {
                select_target(functions, "main.c");
                FAIL("expected no_function_found_error");
            } catch (const generation_error& e) {
                CHECK(e.kind() == error_kind::no_function_found);
                CHECK(std::string(e.what()).find("main.c") != std::string::npos);
            }
        }
    }

    TEST_CASE("Selection key ordering") {
        selection_key foreign{false, 900};
        selection_key low{true, 10};
        selection_key high{true, 40};

        CHECK(foreign < low);
        CHECK(low < high);
        CHECK_FALSE(high < low);
        CHECK_FALSE(foreign < selection_key{false, 1});
        CHECK_FALSE(selection_key{false, 1} < foreign);
    }

    TEST_CASE("Selecting by name") {
        std::vector<function_decl> functions = {
            make_function("parse", "main.c", 10),
            make_function("parse", "other.c", 99),
            make_function("run", "main.c", 40),
            make_function("parse", "main.c", 20),
        };

        const auto& fn = select_target_by_name(functions, "main.c", "parse");
        CHECK(fn.location.line == 20);

        CHECK_THROWS_AS(select_target_by_name(functions, "main.c", "missing"),
                        no_function_found_error);
    }
}
