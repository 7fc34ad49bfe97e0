//
// C Code Writer Implementation
//

#include <harnessgen/codegen/code_writer.hh>
#include <utility>

namespace harnessgen::codegen {

CodeWriter::CodeWriter(std::ostream& output, std::string indent_unit)
    : output_(output)
    , indent_unit_(std::move(indent_unit))
{
}

void CodeWriter::write_line(const std::string& line) {
    if (!line.empty()) {
        for (size_t i = 0; i < depth_; ++i) {
            output_ << indent_unit_;
        }
        output_ << line;
    }
    output_ << '\n';
}

void CodeWriter::write_lines(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        write_line(line);
    }
}

void CodeWriter::write_blank_line() {
    output_ << '\n';
}

void CodeWriter::write_comment(const std::vector<std::string>& lines) {
    write_line("/*");
    for (const auto& line : lines) {
        write_line(line.empty() ? " *" : " * " + line);
    }
    write_line(" */");
}

FunctionBlock CodeWriter::write_function(const std::string& signature) {
    return FunctionBlock(*this, signature);
}

void CodeWriter::unindent() {
    if (depth_ > 0) {
        --depth_;
    }
}

CodeWriter& CodeWriter::operator<<(const std::string& text) {
    pending_ += text;
    return *this;
}

CodeWriter& CodeWriter::operator<<(const char* text) {
    if (text) {
        pending_ += text;
    }
    return *this;
}

CodeWriter& endl(CodeWriter& writer) {
    writer.write_line(writer.pending_);
    writer.pending_.clear();
    return writer;
}

// ============================================================================
// FunctionBlock
// ============================================================================

FunctionBlock::FunctionBlock(CodeWriter& writer, const std::string& signature)
    : writer_(&writer)
{
    writer_->write_line(signature + " {");
    writer_->indent();
}

FunctionBlock::FunctionBlock(FunctionBlock&& other) noexcept
    : writer_(std::exchange(other.writer_, nullptr))
{
}

FunctionBlock::~FunctionBlock() {
    if (writer_) {
        writer_->unindent();
        writer_->write_line("}");
    }
}

}  // namespace harnessgen::codegen
