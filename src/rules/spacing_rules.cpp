//! # Spacing Rules
//!
//! Horizontal whitespace around operators, colons, commas and opening
//! braces. Every check here compares the gap between two adjacent
//! significant tokens on the same line against the expected text and, when
//! it differs, proposes replacing exactly that gap.
//!
//! Gaps that contain a newline or a comment are never touched: line
//! breaks belong to the layout rules.

#include "rule_helpers.hpp"
#include "rules/builtin.hpp"

namespace conform::rules {

using namespace detail;

namespace {

/// Appends an edit making the gap between `left` and `right` equal `want`.
void expect_gap(const SourceModel& model, size_t left, size_t right, std::string_view want,
                Fix& fix) {
    if (!plain_gap(model, left, right)) {
        return;
    }
    if (gap_text(model, left, right) != want) {
        fix.edits.push_back(Edit{gap_span(model, left, right), std::string(want)});
    }
}

// ============================================================================
// operator-spacing
// ============================================================================

void check_operator_spacing(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        const Token& op = model.token(i);
        if (!op.is(TokenKind::Operator) || !is_spaced_operator(op.lexeme)) {
            continue;
        }
        auto prev = model.prev_significant(i);
        auto next = model.next_significant(i);
        if (!prev || !next) {
            continue;
        }
        // `-x`, `&value`, `(-1)`: prefix use, not binary.
        bool always_binary = op.lexeme == "=" || op.lexeme == "->";
        if (!always_binary && !ends_operand(model.token(*prev))) {
            continue;
        }

        Fix fix;
        expect_gap(model, *prev, i, " ", fix);
        expect_gap(model, i, *next, " ", fix);
        if (fix.empty()) {
            continue;
        }
        ctx.report(op.span,
                   "operator '" + std::string(op.lexeme) + "' should be surrounded by single spaces",
                   std::move(fix));
    }
}

// ============================================================================
// colon-spacing
// ============================================================================

/// True if the colon at `index` closes a ternary `cond ? a : b`.
auto is_ternary_colon(const SourceModel& model, size_t index) -> bool {
    auto cursor = model.prev_significant(index);
    while (cursor) {
        const Token& token = model.token(*cursor);
        if (token.is(TokenKind::LBrace) || token.is(TokenKind::RBrace) ||
            token.is(TokenKind::Semicolon) || token.is(TokenKind::Comma) ||
            token.is(TokenKind::Colon) || token.is_open_bracket()) {
            return false;
        }
        if (token.is_close_bracket()) {
            auto opener = model.matching(*cursor);
            if (!opener) {
                return false;
            }
            cursor = model.prev_significant(*opener);
            continue;
        }
        if (token.is_operator("?") && *cursor > 0) {
            // Optional chaining and `Int?` attach the `?` to the operand;
            // the ternary operator is spaced.
            const Token& before = model.token(*cursor - 1);
            if (before.is(TokenKind::Whitespace) || before.is(TokenKind::Newline)) {
                return true;
            }
        }
        if (token.kind == TokenKind::Keyword &&
            (token.lexeme == "let" || token.lexeme == "var" || token.lexeme == "case" ||
             token.lexeme == "func")) {
            return false;
        }
        cursor = model.prev_significant(*cursor);
    }
    return false;
}

/// True for argument-label lists such as `#selector(move(from:to:))`.
auto in_selector_name(const SourceModel& model, size_t index) -> bool {
    auto parent = model.parent(index);
    if (!parent || !model.token(*parent).is(TokenKind::LParen)) {
        return false;
    }
    auto close = model.matching(*parent);
    if (!close) {
        return false;
    }
    auto last = model.prev_significant(*close);
    return last && model.token(*last).is(TokenKind::Colon);
}

void check_colon_spacing(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        if (!model.token(i).is(TokenKind::Colon)) {
            continue;
        }
        auto prev = model.prev_significant(i);
        auto next = model.next_significant(i);
        if (!prev) {
            continue;
        }
        // `[:]` empty dictionary literal.
        if (model.token(*prev).is(TokenKind::LBracket) && next &&
            model.token(*next).is(TokenKind::RBracket)) {
            continue;
        }
        if (in_selector_name(model, i) || is_ternary_colon(model, i)) {
            continue;
        }

        Fix fix;
        expect_gap(model, *prev, i, "", fix);
        if (next) {
            expect_gap(model, i, *next, " ", fix);
        }
        if (fix.empty()) {
            continue;
        }
        ctx.report(model.token(i).span, "colon should have no space before and one space after",
                   std::move(fix));
    }
}

// ============================================================================
// comma-spacing
// ============================================================================

void check_comma_spacing(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        if (!model.token(i).is(TokenKind::Comma)) {
            continue;
        }
        auto prev = model.prev_significant(i);
        auto next = model.next_significant(i);

        Fix fix;
        if (prev) {
            expect_gap(model, *prev, i, "", fix);
        }
        // A trailing comma before a closing bracket keeps whatever spacing it has.
        if (next && !model.token(*next).is_close_bracket()) {
            expect_gap(model, i, *next, " ", fix);
        }
        if (fix.empty()) {
            continue;
        }
        ctx.report(model.token(i).span, "comma should have no space before and one space after",
                   std::move(fix));
    }
}

// ============================================================================
// space-before-brace
// ============================================================================

void check_space_before_brace(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        if (!model.token(i).is(TokenKind::LBrace)) {
            continue;
        }
        auto prev = model.prev_significant(i);
        if (!prev || !plain_gap(model, *prev, i)) {
            continue;
        }
        const Token& before = model.token(*prev);
        // Closure arguments `f({ ... })`, `[{ ... }]`; and gaps already owned
        // by the comma, colon and operator rules.
        if (before.is_open_bracket() || before.is(TokenKind::Comma) ||
            before.is(TokenKind::Colon) ||
            (before.is(TokenKind::Operator) && is_spaced_operator(before.lexeme))) {
            continue;
        }
        if (gap_text(model, *prev, i) == " ") {
            continue;
        }
        ctx.report(model.token(i).span, "opening brace should be preceded by a single space",
                   Fix::replace(gap_span(model, *prev, i), " "));
    }
}

} // namespace

auto spacing_rules() -> std::vector<Rule> {
    std::vector<Rule> rules;

    rules.push_back(Rule{RuleInfo{.id = "colon-spacing",
                                  .title = "No space before a colon, one space after",
                                  .severity = Severity::Error,
                                  .category = Category::Spacing,
                                  .fixable = true},
                         check_colon_spacing});

    rules.push_back(Rule{RuleInfo{.id = "comma-spacing",
                                  .title = "No space before a comma, one space after",
                                  .severity = Severity::Error,
                                  .category = Category::Spacing,
                                  .fixable = true},
                         check_comma_spacing});

    rules.push_back(Rule{RuleInfo{.id = "operator-spacing",
                                  .title = "Binary operators are surrounded by single spaces",
                                  .severity = Severity::Error,
                                  .category = Category::Spacing,
                                  .fixable = true},
                         check_operator_spacing});

    rules.push_back(Rule{RuleInfo{.id = "space-before-brace",
                                  .title = "Opening braces are preceded by one space",
                                  .severity = Severity::Error,
                                  .category = Category::Spacing,
                                  .fixable = true},
                         check_space_before_brace});

    return rules;
}

} // namespace conform::rules
