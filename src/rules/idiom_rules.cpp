// Idiom rules - trailing closures, force unwrapping, optional binding

#include "rule_helpers.hpp"
#include "rules/builtin.hpp"

namespace conform::rules {

using namespace detail;

namespace {

// ============================================================================
// empty-parens-trailing-closure
// ============================================================================

/// Statements whose braces open a body rather than a trailing closure.
auto opens_body(std::string_view keyword) -> bool {
    static constexpr std::string_view WORDS[] = {
        "catch", "class", "do",     "else",      "enum",   "extension", "for",   "func",
        "guard", "if",    "init",   "protocol",  "repeat", "struct",    "subscript",
        "switch", "where", "while",
    };
    for (auto word : WORDS) {
        if (word == keyword) {
            return true;
        }
    }
    return false;
}

void check_empty_parens_trailing_closure(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 1; i + 1 < model.token_count(); ++i) {
        const Token& open = model.token(i);
        if (!open.is(TokenKind::LParen) || !model.token(i + 1).is(TokenKind::RParen)) {
            continue;
        }
        // The callee must be attached: `foo()`, not `foo ()` or `func foo()`.
        const Token& callee = model.token(i - 1);
        if (!callee.is(TokenKind::Identifier)) {
            continue;
        }
        auto before_callee = model.prev_significant(i - 1);
        if (before_callee && model.token(*before_callee).is_keyword("func")) {
            continue;
        }

        auto brace = model.next_significant(i + 1);
        if (!brace || !model.token(*brace).is(TokenKind::LBrace) ||
            !plain_gap(model, i + 1, *brace)) {
            continue;
        }
        auto introducer = model.statement_introducer(*brace);
        if (introducer && opens_body(model.token(*introducer).lexeme)) {
            continue;
        }

        Span parens{open.span.start, model.token(i + 1).span.end};
        ctx.report(parens,
                   "empty parentheses before a trailing closure can be omitted",
                   Fix::remove(parens));
    }
}

// ============================================================================
// force-unwrap
// ============================================================================

void check_force_unwrap(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 1; i < model.token_count(); ++i) {
        const Token& bang = model.token(i);
        if (!bang.is_operator("!")) {
            continue;
        }
        const Token& attached = model.token(i - 1);
        if (attached.is_keyword("as")) {
            ctx.report(Span{attached.span.start, bang.span.end}, "avoid force casts ('as!')");
            continue;
        }
        if (!ends_operand(attached)) {
            continue;
        }
        // `var x: Int!` declares an implicitly unwrapped optional type.
        auto before = model.prev_significant(i - 1);
        if (before && (model.token(*before).is(TokenKind::Colon) ||
                       model.token(*before).is_operator("->"))) {
            continue;
        }
        ctx.report(bang.span, "avoid force unwrapping optionals");
    }
}

// ============================================================================
// shorthand-optional-binding
// ============================================================================

void check_shorthand_optional_binding(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        const Token& binder = model.token(i);
        if (!binder.is_keyword("let") && !binder.is_keyword("var")) {
            continue;
        }
        // `if case let x = x` matches a pattern; the shorthand form does not exist.
        auto before = model.prev_significant(i);
        if (before && model.token(*before).is_keyword("case")) {
            continue;
        }
        auto introducer = model.statement_introducer(i);
        if (!introducer) {
            continue;
        }
        std::string_view owner = model.token(*introducer).lexeme;
        if (owner != "if" && owner != "guard" && owner != "while" && owner != "else") {
            continue;
        }

        auto name = model.next_significant(i);
        if (!name || !model.token(*name).is(TokenKind::Identifier)) {
            continue;
        }
        auto eq = model.next_significant(*name);
        if (!eq || !model.token(*eq).is_operator("=")) {
            continue;
        }
        auto value = model.next_significant(*eq);
        if (!value || !model.token(*value).is(TokenKind::Identifier) ||
            model.token(*value).lexeme != model.token(*name).lexeme) {
            continue;
        }
        auto after = model.next_significant(*value);
        if (!after || !(model.token(*after).is(TokenKind::Comma) ||
                        model.token(*after).is(TokenKind::LBrace) ||
                        model.token(*after).is_keyword("else"))) {
            continue;
        }

        const Token& name_token = model.token(*name);
        std::string binding = std::string(binder.lexeme) + " " + std::string(name_token.lexeme);
        ctx.report(Span{binder.span.start, model.token(*value).span.end},
                   "use shorthand optional binding '" + binding + "'",
                   Fix::remove(Span{name_token.span.end, model.token(*value).span.end}));
    }
}

} // namespace

auto idiom_rules() -> std::vector<Rule> {
    std::vector<Rule> rules;

    rules.push_back(Rule{RuleInfo{.id = "empty-parens-trailing-closure",
                                  .title = "Omit empty parentheses before a trailing closure",
                                  .severity = Severity::Warning,
                                  .category = Category::Idiom,
                                  .fixable = true},
                         check_empty_parens_trailing_closure});

    rules.push_back(Rule{RuleInfo{.id = "force-unwrap",
                                  .title = "Avoid force unwrapping and force casts",
                                  .severity = Severity::Info,
                                  .category = Category::Idiom,
                                  .fixable = false,
                                  .enabled_by_default = false},
                         check_force_unwrap});

    rules.push_back(Rule{RuleInfo{.id = "shorthand-optional-binding",
                                  .title = "Use 'if let x' instead of 'if let x = x'",
                                  .severity = Severity::Warning,
                                  .category = Category::Idiom,
                                  .fixable = true},
                         check_shorthand_optional_binding});

    return rules;
}

} // namespace conform::rules
