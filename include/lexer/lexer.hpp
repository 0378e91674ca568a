//! # Lexer
//!
//! Converts Swift-style source text into a full-fidelity token stream
//! (trivia included, see token.hpp).
//!
//! ## Features
//!
//! - Nestable block comments (`/* /* */ */`)
//! - String interpolation `\( ... )` scanned recursively, including nested
//!   string literals, and kept inside one `StringLiteral` token
//! - Multi-line (`"""`) and raw (`#"..."#`) strings
//! - Maximal-munch operators, with `//` and `/*` always starting a comment
//!
//! ## Error Recovery
//!
//! The lexer keeps going after an error so the stream still covers the whole
//! input; errors are collected and exposed via `errors()`. A file with lexer
//! errors is reported as a parse failure by the frontend.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("let x = 5\n");
//! Lexer lexer(source);
//! std::vector<Token> tokens = lexer.tokenize(); // let, ws, x, ws, =, ws, 5, nl, eof
//! ```

#ifndef CONFORM_LEXER_LEXER_HPP
#define CONFORM_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <vector>

namespace conform::lexer {

struct LexerError {
    std::string message;
    uint32_t offset = 0;
};

class Lexer {
public:
    /// The source must outlive the lexer and the returned tokens.
    explicit Lexer(const Source& source);

    [[nodiscard]] auto next_token() -> Token;

    /// Tokenizes the entire source; the last token is `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexerError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexerError> errors_;

    // Character access
    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;

    // Trivia (lexer_core.cpp)
    [[nodiscard]] auto lex_whitespace() -> Token;
    [[nodiscard]] auto lex_newline() -> Token;
    [[nodiscard]] auto lex_line_comment() -> Token;
    [[nodiscard]] auto lex_block_comment() -> Token;

    // Words and numbers (lexer_ident.cpp)
    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_escaped_identifier() -> Token;
    [[nodiscard]] auto lex_attribute() -> Token;
    [[nodiscard]] auto lex_pound() -> Token;
    [[nodiscard]] auto lex_number() -> Token;

    // Strings (lexer_string.cpp)
    [[nodiscard]] auto lex_string() -> Token;
    [[nodiscard]] auto lex_raw_string() -> Token;
    /// Consumes a string body after its opening delimiter. Returns false if
    /// the input ended (or a single-line string hit a newline) first.
    auto scan_string_body(bool multiline) -> bool;
    /// Consumes an interpolation after `\(` up to its matching `)`.
    auto scan_interpolation(bool multiline) -> bool;

    // Operators and punctuation (lexer_operator.cpp)
    [[nodiscard]] auto lex_operator() -> Token;
    [[nodiscard]] auto lex_punctuation() -> Token;

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
    [[nodiscard]] static auto is_operator_char(char c) -> bool;

    void report_error(const std::string& message, size_t offset);
};

} // namespace conform::lexer

#endif // CONFORM_LEXER_LEXER_HPP
