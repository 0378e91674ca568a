#include "lexer/frontend.hpp"

#include "lexer/lexer.hpp"
#include "log/log.hpp"

namespace conform::lexer {

namespace {

auto bracket_text(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBracket:
        return "[";
    case TokenKind::RBracket:
        return "]";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";
    default:
        return "?";
    }
}

} // namespace

auto SwiftFrontend::parse(const Source& source) const
    -> Result<std::vector<Token>, ParseFailure> {
    Lexer lexer(source);
    std::vector<Token> tokens = lexer.tokenize();

    if (lexer.has_errors()) {
        const auto& first = lexer.errors().front();
        CONFORM_LOG_DEBUG("lexer", source.filename() << ": " << lexer.errors().size()
                                                     << " lexer error(s)");
        return ParseFailure{first.message, source.location(first.offset)};
    }

    std::vector<const Token*> open;
    for (const auto& token : tokens) {
        if (token.is_open_bracket()) {
            open.push_back(&token);
            continue;
        }
        if (!token.is_close_bracket()) {
            continue;
        }
        if (open.empty()) {
            return ParseFailure{std::string("unexpected '") + bracket_text(token.kind) + "'",
                                token.loc};
        }
        const Token* opener = open.back();
        if (matching_close(opener->kind) != token.kind) {
            return ParseFailure{std::string("mismatched '") + bracket_text(token.kind) +
                                    "', expected '" +
                                    bracket_text(matching_close(opener->kind)) + "' to close '" +
                                    bracket_text(opener->kind) + "' at line " +
                                    std::to_string(opener->loc.line),
                                token.loc};
        }
        open.pop_back();
    }

    if (!open.empty()) {
        const Token* opener = open.back();
        return ParseFailure{std::string("unclosed '") + bracket_text(opener->kind) + "'",
                            opener->loc};
    }

    return tokens;
}

} // namespace conform::lexer
