// Lexer - operators and punctuation

#include "lexer/lexer.hpp"

namespace conform::lexer {

auto Lexer::is_operator_char(char c) -> bool {
    switch (c) {
    case '/':
    case '=':
    case '-':
    case '+':
    case '!':
    case '*':
    case '%':
    case '<':
    case '>':
    case '&':
    case '|':
    case '^':
    case '~':
    case '?':
        return true;
    default:
        return false;
    }
}

auto Lexer::lex_operator() -> Token {
    // Key-path backslash is a one-character operator.
    if (peek() == '\\') {
        advance();
        return make_token(TokenKind::Operator);
    }

    // Only operators that start with '.' may contain further dots (`...`, `..<`).
    bool dot_operator = peek() == '.';
    advance();

    while (!is_at_end()) {
        char c = peek();
        if (c == '/' && (peek_next() == '/' || peek_next() == '*')) {
            break;
        }
        if (is_operator_char(c) || (dot_operator && c == '.')) {
            advance();
            continue;
        }
        break;
    }

    return make_token(TokenKind::Operator);
}

auto Lexer::lex_punctuation() -> Token {
    char c = advance();
    switch (c) {
    case ',':
        return make_token(TokenKind::Comma);
    case ':':
        return make_token(TokenKind::Colon);
    case ';':
        return make_token(TokenKind::Semicolon);
    case '.':
        return make_token(TokenKind::Dot);
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '[':
        return make_token(TokenKind::LBracket);
    case ']':
        return make_token(TokenKind::RBracket);
    case '{':
        return make_token(TokenKind::LBrace);
    default:
        return make_token(TokenKind::RBrace);
    }
}

} // namespace conform::lexer
