//! # String Literal Lexing
//!
//! Handles `"..."`, `"""..."""` and raw `#"..."#` literals. Interpolations
//! `\( expr )` are scanned with paren-depth tracking and may themselves
//! contain string literals; the whole literal is one token.

#include "lexer/lexer.hpp"

namespace conform::lexer {

auto Lexer::lex_string() -> Token {
    bool multiline = peek_next() == '"' && peek_n(2) == '"';
    advance();
    if (multiline) {
        advance();
        advance();
    }

    if (!scan_string_body(multiline)) {
        report_error("unterminated string literal", token_start_);
    }
    return make_token(TokenKind::StringLiteral);
}

auto Lexer::scan_string_body(bool multiline) -> bool {
    while (!is_at_end()) {
        char c = peek();

        if (!multiline && (c == '\n' || c == '\r')) {
            return false;
        }

        if (c == '\\') {
            advance();
            if (peek() == '(') {
                advance();
                if (!scan_interpolation(multiline)) {
                    return false;
                }
            } else if (!is_at_end()) {
                advance();
            }
            continue;
        }

        if (c == '"') {
            if (!multiline) {
                advance();
                return true;
            }
            if (peek_next() == '"' && peek_n(2) == '"') {
                advance();
                advance();
                advance();
                return true;
            }
        }

        advance();
    }
    return false;
}

auto Lexer::scan_interpolation(bool multiline) -> bool {
    int depth = 1;

    while (!is_at_end()) {
        char c = peek();

        if (c == '"') {
            bool nested_multiline = peek_next() == '"' && peek_n(2) == '"';
            advance();
            if (nested_multiline) {
                advance();
                advance();
            }
            if (!scan_string_body(nested_multiline)) {
                return false;
            }
            continue;
        }

        if (!multiline && (c == '\n' || c == '\r')) {
            return false;
        }

        advance();
        if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) {
                return true;
            }
        }
    }
    return false;
}

auto Lexer::lex_raw_string() -> Token {
    size_t hashes = 0;
    while (peek() == '#') {
        advance();
        ++hashes;
    }

    if (peek() != '"') {
        report_error("expected '\"' after '#' in raw string literal", token_start_);
        return make_token(TokenKind::StringLiteral);
    }

    bool multiline = peek_next() == '"' && peek_n(2) == '"';
    size_t quote_len = multiline ? 3 : 1;
    for (size_t i = 0; i < quote_len; ++i) {
        advance();
    }

    auto closes_here = [&]() {
        for (size_t i = 0; i < quote_len; ++i) {
            if (peek_n(i) != '"') {
                return false;
            }
        }
        for (size_t i = 0; i < hashes; ++i) {
            if (peek_n(quote_len + i) != '#') {
                return false;
            }
        }
        return true;
    };

    while (!is_at_end()) {
        if (!multiline && (peek() == '\n' || peek() == '\r')) {
            break;
        }
        if (closes_here()) {
            for (size_t i = 0; i < quote_len + hashes; ++i) {
                advance();
            }
            return make_token(TokenKind::StringLiteral);
        }
        advance();
    }

    report_error("unterminated raw string literal", token_start_);
    return make_token(TokenKind::StringLiteral);
}

} // namespace conform::lexer
