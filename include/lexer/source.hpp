//! # Source File Management
//!
//! Owns one file's text and maps byte offsets to line/column positions.
//! Tokens and AST nodes keep `std::string_view`s into the source, so a
//! `Source` must outlive everything lexed or parsed from it.

#ifndef SEMDIFF_LEXER_SOURCE_HPP
#define SEMDIFF_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace semdiff::lexer {

/// A source file with a line index for O(log n) location lookup.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Substring `[start, end)`, clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// 1-based line and column of a byte offset.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Content of a 1-based line without its line terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_;

    void build_line_index();
};

} // namespace semdiff::lexer

#endif // SEMDIFF_LEXER_SOURCE_HPP
