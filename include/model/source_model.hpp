//! # Source Model
//!
//! A randomly accessible view of one revision of one file: its text, its
//! full-fidelity token stream and the structural indexes rules navigate by.
//!
//! ## Indexes
//!
//! | Query                | Cost      | Notes                                  |
//! |----------------------|-----------|----------------------------------------|
//! | `token_at(offset)`   | O(log n)  | binary search on token starts          |
//! | `prev_significant`   | O(1)      | skips whitespace, newlines, comments   |
//! | `next_significant`   | O(1)      |                                        |
//! | `parent(i)`          | O(1)      | innermost enclosing open bracket       |
//! | `matching(i)`        | O(1)      | partner of a bracket token             |
//! | `location(offset)`   | O(log n)  | via the Source line index              |
//!
//! ## Revisions
//!
//! A model is never edited in place. `with_text()` re-tokenizes a rewritten
//! text and returns a new model whose revision is one higher. Spans always
//! refer to the revision they were produced from.

#ifndef CONFORM_MODEL_SOURCE_MODEL_HPP
#define CONFORM_MODEL_SOURCE_MODEL_HPP

#include "common.hpp"
#include "lexer/frontend.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conform::model {

using lexer::ParseFailure;
using lexer::Token;
using lexer::TokenKind;

enum class DeclKind : uint8_t {
    Let,
    Var,
    Func,
    EnumCase,
    Class,
    Struct,
    Enum,
    Protocol,
    Actor,
    Typealias,
    AssociatedType,
};

/// A named declaration found by a shallow scan of the token stream.
struct Declaration {
    DeclKind kind;
    size_t keyword; ///< Index of the introducing keyword token.
    size_t name;    ///< Index of the name token.
};

[[nodiscard]] auto decl_kind_name(DeclKind kind) -> std::string_view;

/// True for class, struct, enum, protocol, actor, typealias and associatedtype.
[[nodiscard]] auto is_type_declaration(DeclKind kind) -> bool;

class SourceModel {
public:
    /// Tokenizes `source` with `frontend`. Fails if the frontend reports a
    /// syntax error.
    [[nodiscard]] static auto build(Rc<const lexer::Source> source, const lexer::Frontend& frontend,
                                    uint32_t revision = 0) -> Result<SourceModel, ParseFailure>;

    [[nodiscard]] static auto build(std::string path, std::string text,
                                    const lexer::Frontend& frontend)
        -> Result<SourceModel, ParseFailure>;

    /// Builds the next revision from a rewritten text of the same file.
    [[nodiscard]] auto with_text(std::string text, const lexer::Frontend& frontend) const
        -> Result<SourceModel, ParseFailure>;

    [[nodiscard]] auto revision() const -> uint32_t {
        return revision_;
    }

    [[nodiscard]] auto path() const -> std::string_view {
        return source_->filename();
    }

    [[nodiscard]] auto text() const -> std::string_view {
        return source_->content();
    }

    [[nodiscard]] auto source() const -> const lexer::Source& {
        return *source_;
    }

    // ========================================================================
    // Tokens
    // ========================================================================

    [[nodiscard]] auto tokens() const -> const std::vector<Token>& {
        return tokens_;
    }

    [[nodiscard]] auto token(size_t index) const -> const Token& {
        return tokens_[index];
    }

    [[nodiscard]] auto token_count() const -> size_t {
        return tokens_.size();
    }

    /// Index of the token whose span contains `offset`. An offset equal to
    /// the text length maps to the trailing `Eof` token.
    [[nodiscard]] auto token_at(uint32_t offset) const -> std::optional<size_t>;

    [[nodiscard]] auto prev_significant(size_t index) const -> std::optional<size_t>;
    [[nodiscard]] auto next_significant(size_t index) const -> std::optional<size_t>;

    /// Innermost open bracket enclosing token `index`.
    [[nodiscard]] auto parent(size_t index) const -> std::optional<size_t>;

    /// The partner of a bracket token; nullopt for other tokens.
    [[nodiscard]] auto matching(size_t index) const -> std::optional<size_t>;

    /// The leftmost statement keyword (`func`, `if`, `enum`, `let`, ...) of
    /// the statement segment that ends just before token `index`. For an
    /// open brace this names what the block belongs to.
    ///
    /// The segment starts after the previous `{`, `}`, `;` or unmatched open
    /// bracket; bracketed groups inside it are skipped.
    [[nodiscard]] auto statement_introducer(size_t index) const -> std::optional<size_t>;

    /// True if the gap between tokens `from` and `to` (exclusive) contains a
    /// newline token.
    [[nodiscard]] auto has_newline_between(size_t from, size_t to) const -> bool;

    /// True if the gap between tokens `from` and `to` (exclusive) contains a
    /// comment token.
    [[nodiscard]] auto has_comment_between(size_t from, size_t to) const -> bool;

    /// True if `offset` lies strictly inside a string literal or block comment
    /// that started earlier in the text.
    [[nodiscard]] auto inside_multiline_token(uint32_t offset) const -> bool;

    // ========================================================================
    // Lines
    // ========================================================================

    [[nodiscard]] auto location(uint32_t offset) const -> SourceLocation {
        return source_->location(offset);
    }

    [[nodiscard]] auto line_text(uint32_t line) const -> std::string_view {
        return source_->line(line);
    }

    [[nodiscard]] auto line_start(uint32_t line) const -> uint32_t {
        return source_->line_start(line);
    }

    /// Number of lines, not counting the empty remainder after a final newline.
    [[nodiscard]] auto line_count() const -> uint32_t;

    // ========================================================================
    // Declarations
    // ========================================================================

    [[nodiscard]] auto declarations() const -> const std::vector<Declaration>& {
        return declarations_;
    }

private:
    static constexpr uint32_t NONE = UINT32_MAX;

    Rc<const lexer::Source> source_;
    std::vector<Token> tokens_;
    uint32_t revision_ = 0;

    std::vector<uint32_t> prev_sig_;
    std::vector<uint32_t> next_sig_;
    std::vector<uint32_t> parent_;
    std::vector<uint32_t> match_;
    std::vector<Declaration> declarations_;

    SourceModel(Rc<const lexer::Source> source, std::vector<Token> tokens, uint32_t revision);

    void index_tokens();
    void collect_declarations(); // declarations.cpp

    [[nodiscard]] static auto to_optional(uint32_t value) -> std::optional<size_t> {
        if (value == NONE) {
            return std::nullopt;
        }
        return value;
    }
};

} // namespace conform::model

#endif // CONFORM_MODEL_SOURCE_MODEL_HPP
