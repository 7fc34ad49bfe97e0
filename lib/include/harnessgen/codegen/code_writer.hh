//
// C Code Writer
//
// Line-oriented writer for harness text. Every line is prefixed with the
// current indentation; function bodies are opened by a FunctionBlock guard
// whose destructor writes the closing brace.
//

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace harnessgen::codegen {

class FunctionBlock;

class CodeWriter {
public:
    explicit CodeWriter(std::ostream& output, std::string indent_unit = "    ");

    CodeWriter(const CodeWriter&) = delete;
    CodeWriter& operator=(const CodeWriter&) = delete;

    // ========================================================================
    // Lines
    // ========================================================================

    /// Indented line; an empty line is written without indentation
    void write_line(const std::string& line);
    void write_lines(const std::vector<std::string>& lines);
    void write_blank_line();

    /// Block comment, one " * " line per entry ("" gives a bare " *")
    void write_comment(const std::vector<std::string>& lines);

    /// "<signature> {", then one level deeper until the guard is destroyed
    FunctionBlock write_function(const std::string& signature);

    // ========================================================================
    // Indentation
    // ========================================================================

    void indent() { ++depth_; }
    void unindent();
    size_t depth() const { return depth_; }

    // ========================================================================
    // Streaming: pieces accumulate until codegen::endl
    // ========================================================================

    CodeWriter& operator<<(const std::string& text);
    CodeWriter& operator<<(const char* text);
    CodeWriter& operator<<(CodeWriter& (*manip)(CodeWriter&)) { return manip(*this); }

    friend CodeWriter& endl(CodeWriter& writer);

private:
    std::ostream& output_;
    std::string indent_unit_;
    size_t depth_ = 0;
    std::string pending_;
};

/// Flush the streamed pieces as one indented line
CodeWriter& endl(CodeWriter& writer);

class FunctionBlock {
public:
    FunctionBlock(CodeWriter& writer, const std::string& signature);
    ~FunctionBlock();

    FunctionBlock(const FunctionBlock&) = delete;
    FunctionBlock& operator=(const FunctionBlock&) = delete;
    FunctionBlock(FunctionBlock&& other) noexcept;
    FunctionBlock& operator=(FunctionBlock&&) = delete;

private:
    CodeWriter* writer_;
};

}  // namespace harnessgen::codegen
