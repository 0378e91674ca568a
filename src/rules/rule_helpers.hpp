// Internal helpers shared by the built-in rule groups

#ifndef CONFORM_RULES_RULE_HELPERS_HPP
#define CONFORM_RULES_RULE_HELPERS_HPP

#include "model/source_model.hpp"
#include "rules/rule.hpp"

#include <string>
#include <string_view>

namespace conform::rules::detail {

using lexer::Token;
using lexer::TokenKind;
using model::SourceModel;

/// The bytes between the end of token `left` and the start of token `right`.
inline auto gap_span(const SourceModel& model, size_t left, size_t right) -> Span {
    return Span{model.token(left).span.end, model.token(right).span.start};
}

inline auto gap_text(const SourceModel& model, size_t left, size_t right) -> std::string_view {
    Span span = gap_span(model, left, right);
    return model.text().substr(span.start, span.length());
}

/// True if the gap between two tokens is on one line and holds no comment.
inline auto plain_gap(const SourceModel& model, size_t left, size_t right) -> bool {
    return !model.has_newline_between(left, right) && !model.has_comment_between(left, right);
}

/// Binary operators that take one space on each side.
inline auto is_spaced_operator(std::string_view op) -> bool {
    static constexpr std::string_view OPS[] = {
        "=",  "==", "!=", "===", "!==", "+",  "-",  "*",  "/",  "%",  "+=", "-=", "*=",
        "/=", "%=", "&&", "||",  "??",  "->", "<=", ">=", "&",  "|",  "^",  "&=", "|=",
        "^=", "~=",
    };
    for (auto candidate : OPS) {
        if (candidate == op) {
            return true;
        }
    }
    return false;
}

/// True if `token` can end an operand, making a following operator binary.
inline auto ends_operand(const Token& token) -> bool {
    switch (token.kind) {
    case TokenKind::Identifier:
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::RParen:
    case TokenKind::RBracket:
        return true;
    case TokenKind::Keyword:
        return token.lexeme == "self" || token.lexeme == "Self" || token.lexeme == "super" ||
               token.lexeme == "true" || token.lexeme == "false" || token.lexeme == "nil";
    default:
        return false;
    }
}

inline auto strip_backticks(std::string_view name) -> std::string_view {
    if (name.size() >= 2 && name.front() == '`' && name.back() == '`') {
        return name.substr(1, name.size() - 2);
    }
    return name;
}

inline auto is_ascii(std::string_view text) -> bool {
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x80) {
            return false;
        }
    }
    return true;
}

/// Number of UTF-8 code points in `text`.
inline auto display_length(std::string_view text) -> size_t {
    size_t count = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

/// True if `offset` is strictly inside a string literal that began earlier.
inline auto inside_string(const SourceModel& model, uint32_t offset) -> bool {
    auto index = model.token_at(offset);
    if (!index) {
        return false;
    }
    const Token& token = model.token(*index);
    return token.is(TokenKind::StringLiteral) && token.span.start < offset;
}

} // namespace conform::rules::detail

#endif // CONFORM_RULES_RULE_HELPERS_HPP
