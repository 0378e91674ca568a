//! # Source Text
//!
//! A file's text plus an index of line start offsets, giving O(log n)
//! offset -> line/column translation for diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("let x=5\n", "<test>");
//! SourceLocation loc = source.location(5); // line 1, column 6
//! std::string_view line = source.line(1);  // "let x=5"
//! ```

#ifndef CONFORM_LEXER_SOURCE_HPP
#define CONFORM_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace conform::lexer {

/// A source file with efficient location tracking.
///
/// String views returned by `content()`, `slice()` and `line()`, and the
/// lexemes of tokens produced from this source, stay valid as long as the
/// Source object is alive and not moved. Long-lived owners hold it through
/// `Rc<const Source>` so its address never changes.
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

    /// Substring `[start, end)`, clamped to valid bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Content of a 1-based line without its line terminator.
    /// Empty if the line number is out of range.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    /// Byte offset where a 1-based line starts.
    [[nodiscard]] auto line_start(uint32_t line_num) const -> uint32_t;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a file from disk; returns an error string if it cannot be read.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace conform::lexer

#endif // CONFORM_LEXER_SOURCE_HPP
