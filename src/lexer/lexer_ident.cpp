// Lexer - identifiers, keywords, attributes, directives and numbers

#include "lexer/lexer.hpp"

namespace conform::lexer {

auto Lexer::is_identifier_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || u >= 0x80;
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    auto text = source_.slice(token_start_, pos_);
    return make_token(is_keyword(text) ? TokenKind::Keyword : TokenKind::Identifier);
}

auto Lexer::lex_escaped_identifier() -> Token {
    advance(); // opening backtick
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    if (peek() != '`') {
        report_error("unterminated escaped identifier", token_start_);
        return make_token(TokenKind::Identifier);
    }
    advance();
    return make_token(TokenKind::Identifier);
}

auto Lexer::lex_attribute() -> Token {
    advance(); // '@'
    if (!is_identifier_start(peek())) {
        report_error("expected attribute name after '@'", token_start_);
        return make_token(TokenKind::Attribute);
    }
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    return make_token(TokenKind::Attribute);
}

auto Lexer::lex_pound() -> Token {
    advance(); // '#'
    if (!is_identifier_start(peek())) {
        report_error("expected directive name after '#'", token_start_);
        return make_token(TokenKind::PoundDirective);
    }
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }
    return make_token(TokenKind::PoundDirective);
}

auto Lexer::lex_number() -> Token {
    auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
    auto is_hex = [&](char c) {
        return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
    };

    if (peek() == '0' && (peek_next() == 'x' || peek_next() == 'X')) {
        advance();
        advance();
        while (!is_at_end() && (is_hex(peek()) || peek() == '_')) {
            advance();
        }
        return make_token(TokenKind::IntLiteral);
    }
    if (peek() == '0' && (peek_next() == 'b' || peek_next() == 'o')) {
        advance();
        advance();
        while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
            advance();
        }
        return make_token(TokenKind::IntLiteral);
    }

    bool is_float = false;
    while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
        advance();
    }
    // `1.5` is a float, `1.description` is an int followed by a member access.
    if (peek() == '.' && is_digit(peek_next())) {
        is_float = true;
        advance();
        while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
            advance();
        }
    }
    if (peek() == 'e' || peek() == 'E') {
        char after = peek_next();
        if (is_digit(after) || ((after == '+' || after == '-') && is_digit(peek_n(2)))) {
            is_float = true;
            advance();
            if (peek() == '+' || peek() == '-') {
                advance();
            }
            while (!is_at_end() && is_digit(peek())) {
                advance();
            }
        }
    }

    return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral);
}

} // namespace conform::lexer
