#include "lexer/token.hpp"

#include <algorithm>
#include <array>

namespace conform::lexer {

namespace {

// Sorted for binary search.
constexpr std::array<std::string_view, 67> KEYWORDS = {
    "Any", "Self", "as", "associatedtype", "async", "await", "break", "case", "catch", "class",
    "continue", "convenience", "default", "defer", "deinit", "do", "dynamic", "else", "enum",
    "extension", "fallthrough", "false", "fileprivate", "final", "for", "func", "guard", "if",
    "import", "in", "indirect", "init", "inout", "internal", "is", "lazy", "let", "mutating",
    "nil", "nonmutating", "open", "operator", "override", "private", "protocol", "public",
    "repeat", "required", "rethrows", "return", "self", "some", "static", "struct",
    "subscript", "super", "switch", "throw", "throws", "true", "try", "typealias", "unowned",
    "var", "weak", "where", "while",
};

} // namespace

auto is_keyword(std::string_view word) -> bool {
    return std::binary_search(KEYWORDS.begin(), KEYWORDS.end(), word);
}

auto token_kind_name(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "eof";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Keyword:
        return "keyword";
    case TokenKind::IntLiteral:
        return "int-literal";
    case TokenKind::FloatLiteral:
        return "float-literal";
    case TokenKind::StringLiteral:
        return "string-literal";
    case TokenKind::Operator:
        return "operator";
    case TokenKind::Comma:
        return "comma";
    case TokenKind::Colon:
        return "colon";
    case TokenKind::Semicolon:
        return "semicolon";
    case TokenKind::Dot:
        return "dot";
    case TokenKind::LParen:
        return "l-paren";
    case TokenKind::RParen:
        return "r-paren";
    case TokenKind::LBracket:
        return "l-bracket";
    case TokenKind::RBracket:
        return "r-bracket";
    case TokenKind::LBrace:
        return "l-brace";
    case TokenKind::RBrace:
        return "r-brace";
    case TokenKind::Attribute:
        return "attribute";
    case TokenKind::PoundDirective:
        return "pound-directive";
    case TokenKind::LineComment:
        return "line-comment";
    case TokenKind::BlockComment:
        return "block-comment";
    case TokenKind::Whitespace:
        return "whitespace";
    case TokenKind::Newline:
        return "newline";
    }
    return "unknown";
}

auto matching_close(TokenKind open) -> TokenKind {
    switch (open) {
    case TokenKind::LParen:
        return TokenKind::RParen;
    case TokenKind::LBracket:
        return TokenKind::RBracket;
    case TokenKind::LBrace:
        return TokenKind::RBrace;
    default:
        return TokenKind::Eof;
    }
}

} // namespace conform::lexer
