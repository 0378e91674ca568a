// Source model - shallow declaration scan for naming rules

#include "model/source_model.hpp"

#include <optional>

namespace conform::model {

auto decl_kind_name(DeclKind kind) -> std::string_view {
    switch (kind) {
    case DeclKind::Let:
        return "constant";
    case DeclKind::Var:
        return "variable";
    case DeclKind::Func:
        return "function";
    case DeclKind::EnumCase:
        return "enum case";
    case DeclKind::Class:
        return "class";
    case DeclKind::Struct:
        return "struct";
    case DeclKind::Enum:
        return "enum";
    case DeclKind::Protocol:
        return "protocol";
    case DeclKind::Actor:
        return "actor";
    case DeclKind::Typealias:
        return "typealias";
    case DeclKind::AssociatedType:
        return "associated type";
    }
    return "declaration";
}

auto is_type_declaration(DeclKind kind) -> bool {
    switch (kind) {
    case DeclKind::Class:
    case DeclKind::Struct:
    case DeclKind::Enum:
    case DeclKind::Protocol:
    case DeclKind::Actor:
    case DeclKind::Typealias:
    case DeclKind::AssociatedType:
        return true;
    default:
        return false;
    }
}

namespace {

auto keyword_decl_kind(std::string_view word) -> std::optional<DeclKind> {
    if (word == "let")
        return DeclKind::Let;
    if (word == "var")
        return DeclKind::Var;
    if (word == "func")
        return DeclKind::Func;
    if (word == "class")
        return DeclKind::Class;
    if (word == "struct")
        return DeclKind::Struct;
    if (word == "enum")
        return DeclKind::Enum;
    if (word == "protocol")
        return DeclKind::Protocol;
    if (word == "actor")
        return DeclKind::Actor;
    if (word == "typealias")
        return DeclKind::Typealias;
    if (word == "associatedtype")
        return DeclKind::AssociatedType;
    return std::nullopt;
}

} // namespace

void SourceModel::collect_declarations() {
    declarations_.clear();

    for (size_t i = 0; i < tokens_.size(); ++i) {
        const Token& token = tokens_[i];
        if (token.kind != TokenKind::Keyword) {
            continue;
        }

        if (token.lexeme == "case") {
            // Only `case` directly inside an enum body declares anything.
            auto brace = parent(i);
            if (!brace || !tokens_[*brace].is(TokenKind::LBrace)) {
                continue;
            }
            auto owner = statement_introducer(*brace);
            if (!owner || tokens_[*owner].lexeme != "enum") {
                continue;
            }

            // case a, b(Int), c = "raw"
            auto cursor = next_significant(i);
            while (cursor && tokens_[*cursor].is(TokenKind::Identifier)) {
                declarations_.push_back(Declaration{DeclKind::EnumCase, i, *cursor});
                cursor = next_significant(*cursor);
                if (cursor && tokens_[*cursor].is(TokenKind::LParen)) {
                    auto close = matching(*cursor);
                    cursor = close ? next_significant(*close) : std::nullopt;
                }
                if (cursor && tokens_[*cursor].is_operator("=")) {
                    cursor = next_significant(*cursor);
                    cursor = cursor ? next_significant(*cursor) : std::nullopt;
                }
                if (!cursor || !tokens_[*cursor].is(TokenKind::Comma)) {
                    break;
                }
                cursor = next_significant(*cursor);
            }
            continue;
        }

        auto kind = keyword_decl_kind(token.lexeme);
        if (!kind) {
            continue;
        }
        // `class func`, `class var` and tuple patterns fall through here:
        // the next significant token is not an identifier.
        auto name = next_significant(i);
        if (!name || !tokens_[*name].is(TokenKind::Identifier)) {
            continue;
        }
        declarations_.push_back(Declaration{*kind, i, *name});
    }
}

} // namespace conform::model
