//
// Unit tests for CodeWriter
//

#include <doctest/doctest.h>
#include <harnessgen/codegen/code_writer.hh>
#include <sstream>

using namespace harnessgen::codegen;

TEST_SUITE("CodeWriter") {
    TEST_CASE("Lines follow the current depth") {
        std::ostringstream oss;
        CodeWriter writer(oss);

        writer.write_line("int a;");
        writer.indent();
        writer.write_lines({"scanf(\"%d\", &a);", "", "f(a);"});
        writer.unindent();
        writer.unindent();  // already at depth 0
        writer.write_line("done");

        CHECK(oss.str() == "int a;\n    scanf(\"%d\", &a);\n\n    f(a);\ndone\n");
        CHECK(writer.depth() == 0);
    }

    TEST_CASE("Indent unit is configurable") {
        std::ostringstream oss;
        CodeWriter writer(oss, "\t");

        writer.indent();
        writer.indent();
        writer.write_line("x = &x_v;");
        writer.write_blank_line();

        CHECK(oss.str() == "\t\tx = &x_v;\n\n");
    }

    TEST_CASE("Block comment") {
        std::ostringstream oss;
        CodeWriter writer(oss);

        writer.write_comment({"Generated.", "", "Reads f() arguments."});

        CHECK(oss.str() ==
              "/*\n"
              " * Generated.\n"
              " *\n"
              " * Reads f() arguments.\n"
              " */\n");
    }

    TEST_CASE("Streamed pieces form one line at endl") {
        std::ostringstream oss;
        CodeWriter writer(oss);
        std::string header = "main.c";

        writer << "#include \"" << header << "\"" << endl;
        writer.indent();
        writer << "return " << "0;" << endl;

        CHECK(oss.str() == "#include \"main.c\"\n    return 0;\n");
    }

    TEST_CASE("Function block closes its brace on scope exit") {
        std::ostringstream oss;
        CodeWriter writer(oss, "  ");

        {
            auto main_block = writer.write_function("int main(void)");
            CHECK(writer.depth() == 1);
            writer.write_line("tick();");
        }

        CHECK(writer.depth() == 0);
        CHECK(oss.str() == "int main(void) {\n  tick();\n}\n");
    }

    TEST_CASE("Moved-from function block writes nothing") {
        std::ostringstream oss;
        CodeWriter writer(oss);

        {
            auto outer = writer.write_function("void f(void)");
            FunctionBlock moved(std::move(outer));
            writer.write_line("g();");
        }

        CHECK(oss.str() == "void f(void) {\n    g();\n}\n");
    }
}
