//! # Lexer Core
//!
//! Character access, token dispatch and trivia (whitespace, newlines,
//! comments). Literal, word and operator lexing live in sibling files.

#include "lexer/lexer.hpp"

namespace conform::lexer {

Lexer::Lexer(const Source& source) : source_(source) {}

// ============================================================================
// Character Access
// ============================================================================

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    return source_.at(pos_++);
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

auto Lexer::make_token(TokenKind kind) -> Token {
    Token token;
    token.kind = kind;
    token.span = Span{static_cast<uint32_t>(token_start_), static_cast<uint32_t>(pos_)};
    token.lexeme = source_.slice(token_start_, pos_);
    token.loc = source_.location(token_start_);
    return token;
}

void Lexer::report_error(const std::string& message, size_t offset) {
    errors_.push_back(LexerError{message, static_cast<uint32_t>(offset)});
}

// ============================================================================
// Dispatch
// ============================================================================

auto Lexer::next_token() -> Token {
    token_start_ = pos_;

    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (c == ' ' || c == '\t' || c == '\f' || c == '\v') {
        return lex_whitespace();
    }
    if (c == '\n' || c == '\r') {
        return lex_newline();
    }
    if (c == '/' && peek_next() == '/') {
        return lex_line_comment();
    }
    if (c == '/' && peek_next() == '*') {
        return lex_block_comment();
    }
    if (is_identifier_start(c)) {
        return lex_identifier();
    }
    if (c == '`') {
        return lex_escaped_identifier();
    }
    if (c >= '0' && c <= '9') {
        return lex_number();
    }
    if (c == '"') {
        return lex_string();
    }
    if (c == '#') {
        if (peek_next() == '"' || peek_next() == '#') {
            return lex_raw_string();
        }
        return lex_pound();
    }
    if (c == '@') {
        return lex_attribute();
    }
    if (is_operator_char(c) || c == '\\' || (c == '.' && peek_next() == '.')) {
        return lex_operator();
    }

    switch (c) {
    case ',':
    case ':':
    case ';':
    case '.':
    case '(':
    case ')':
    case '[':
    case ']':
    case '{':
    case '}':
        return lex_punctuation();
    default:
        break;
    }

    // Keep the stream contiguous: the bad byte becomes its own token.
    report_error(std::string("invalid character '") + c + "'", pos_);
    advance();
    return make_token(TokenKind::Operator);
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    tokens.reserve(source_.length() / 3 + 1);

    while (true) {
        Token token = next_token();
        bool eof = token.is_eof();
        tokens.push_back(token);
        if (eof) {
            break;
        }
    }

    return tokens;
}

// ============================================================================
// Trivia
// ============================================================================

auto Lexer::lex_whitespace() -> Token {
    while (!is_at_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\f' && c != '\v') {
            break;
        }
        advance();
    }
    return make_token(TokenKind::Whitespace);
}

auto Lexer::lex_newline() -> Token {
    if (peek() == '\r' && peek_next() == '\n') {
        advance();
    }
    advance();
    return make_token(TokenKind::Newline);
}

auto Lexer::lex_line_comment() -> Token {
    while (!is_at_end() && peek() != '\n') {
        if (peek() == '\r' && peek_next() == '\n') {
            break;
        }
        advance();
    }
    return make_token(TokenKind::LineComment);
}

auto Lexer::lex_block_comment() -> Token {
    advance(); // '/'
    advance(); // '*'
    int depth = 1;

    while (!is_at_end() && depth > 0) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        report_error("unterminated block comment", token_start_);
    }
    return make_token(TokenKind::BlockComment);
}

} // namespace conform::lexer
