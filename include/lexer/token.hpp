//! # Token Definitions
//!
//! Tokens produced by the lexer for Swift-style source files.
//!
//! ## Full-fidelity stream
//!
//! Unlike a compiler lexer, this one keeps trivia: whitespace runs,
//! newlines and comments are tokens too. Concatenating the lexemes of every
//! token reproduces the input byte-for-byte, which is what lets style rules
//! reason about spacing and lets fixes be expressed as byte-span edits.
//!
//! ## Categories
//!
//! - **Words**: identifiers (including `` `escaped` `` and `$0`), keywords
//! - **Literals**: integers, floats, strings (interpolations stay inside the
//!   string token)
//! - **Operators**: maximal-munch operator character runs (`=`, `->`, `??`)
//! - **Punctuation**: `,` `:` `;` `.` and the three bracket pairs
//! - **Trivia**: whitespace, newline, line and block comments

#ifndef CONFORM_LEXER_TOKEN_HPP
#define CONFORM_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <string_view>

namespace conform::lexer {

enum class TokenKind : uint8_t {
    Eof,

    // Words
    Identifier, ///< `foo`, `_bar`, `` `class` ``, `$0`
    Keyword,    ///< `func`, `let`, `if`, `internal`, ...

    // Literals
    IntLiteral,    ///< `42`, `0xFF`, `1_000`
    FloatLiteral,  ///< `3.14`, `1e10`
    StringLiteral, ///< `"a \(b) c"`, `"""..."""`, `#"raw"#`

    // Operators and punctuation
    Operator,  ///< `=`, `==`, `->`, `?`, `!`, `...`
    Comma,     ///< `,`
    Colon,     ///< `:`
    Semicolon, ///< `;`
    Dot,       ///< `.`
    LParen,    ///< `(`
    RParen,    ///< `)`
    LBracket,  ///< `[`
    RBracket,  ///< `]`
    LBrace,    ///< `{`
    RBrace,    ///< `}`

    // Directives
    Attribute,      ///< `@objc`, `@escaping`
    PoundDirective, ///< `#if`, `#available`, `#selector`

    // Trivia
    LineComment,  ///< `// ...` (without the newline)
    BlockComment, ///< `/* ... */`, nestable
    Whitespace,   ///< run of spaces, tabs, form feeds
    Newline,      ///< `\n` or `\r\n`
};

/// A single lexical token.
///
/// `lexeme` views into the owning Source; see Source for lifetime rules.
struct Token {
    TokenKind kind = TokenKind::Eof;
    std::string_view lexeme;
    Span span;           ///< Byte span `[start, end)`.
    SourceLocation loc;  ///< Location of `span.start`.

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// Whitespace, newline or comment.
    [[nodiscard]] auto is_trivia() const -> bool {
        return kind == TokenKind::Whitespace || kind == TokenKind::Newline ||
               kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
    }

    [[nodiscard]] auto is_comment() const -> bool {
        return kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
    }

    [[nodiscard]] auto is_keyword(std::string_view word) const -> bool {
        return kind == TokenKind::Keyword && lexeme == word;
    }

    [[nodiscard]] auto is_operator(std::string_view op) const -> bool {
        return kind == TokenKind::Operator && lexeme == op;
    }

    [[nodiscard]] auto is_open_bracket() const -> bool {
        return kind == TokenKind::LParen || kind == TokenKind::LBracket ||
               kind == TokenKind::LBrace;
    }

    [[nodiscard]] auto is_close_bracket() const -> bool {
        return kind == TokenKind::RParen || kind == TokenKind::RBracket ||
               kind == TokenKind::RBrace;
    }
};

/// Returns a stable lowercase name for a token kind ("identifier", "l-brace").
[[nodiscard]] auto token_kind_name(TokenKind kind) -> std::string_view;

/// Returns true if `word` is a reserved word of the language.
[[nodiscard]] auto is_keyword(std::string_view word) -> bool;

/// Returns the closing bracket kind for an opening one.
[[nodiscard]] auto matching_close(TokenKind open) -> TokenKind;

} // namespace conform::lexer

#endif // CONFORM_LEXER_TOKEN_HPP
