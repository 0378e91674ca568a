//! # Layout Rules
//!
//! Line-oriented checks (tabs, trailing whitespace, blank lines, line
//! length, final newline) and brace placement across line breaks.
//!
//! Line checks skip content that lives inside a multi-line string literal:
//! whitespace there is part of the value.

#include "rule_helpers.hpp"
#include "rules/builtin.hpp"

#include <algorithm>

namespace conform::rules {

using namespace detail;

namespace {

auto is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t") == std::string_view::npos;
}

// ============================================================================
// brace-same-line
// ============================================================================

/// Tokens after which a brace on the next line still opens the body of the
/// preceding declaration or condition.
auto can_own_block(const Token& token) -> bool {
    switch (token.kind) {
    case TokenKind::Identifier:
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::RParen:
    case TokenKind::RBracket:
        return true;
    case TokenKind::Operator:
        return token.lexeme == "?" || token.lexeme == "!" || token.lexeme == ">";
    case TokenKind::Keyword:
        return token.lexeme != "return" && token.lexeme != "in" && token.lexeme != "throw" &&
               token.lexeme != "try" && token.lexeme != "await" && token.lexeme != "case" &&
               token.lexeme != "default" && token.lexeme != "let" && token.lexeme != "var" &&
               token.lexeme != "is" && token.lexeme != "as";
    default:
        return false;
    }
}

void check_brace_same_line(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        if (!model.token(i).is(TokenKind::LBrace)) {
            continue;
        }
        auto prev = model.prev_significant(i);
        if (!prev || !model.has_newline_between(*prev, i) ||
            model.has_comment_between(*prev, i) || !can_own_block(model.token(*prev))) {
            continue;
        }
        ctx.report(model.token(i).span,
                   "opening brace should be on the same line as its declaration",
                   Fix::replace(gap_span(model, *prev, i), " "));
    }
}

// ============================================================================
// else-same-line
// ============================================================================

void check_else_same_line(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        const Token& token = model.token(i);
        if (!token.is_keyword("else") && !token.is_keyword("catch")) {
            continue;
        }
        auto prev = model.prev_significant(i);
        if (!prev || !model.token(*prev).is(TokenKind::RBrace) ||
            !model.has_newline_between(*prev, i) || model.has_comment_between(*prev, i)) {
            continue;
        }
        ctx.report(token.span,
                   "'" + std::string(token.lexeme) +
                       "' should be on the same line as the preceding closing brace",
                   Fix::replace(gap_span(model, *prev, i), " "));
    }
}

// ============================================================================
// file-trailing-newline
// ============================================================================

void check_file_trailing_newline(RuleContext& ctx) {
    std::string_view text = ctx.model().text();
    size_t last = text.find_last_not_of(" \t\r\n\f\v");
    if (last == std::string_view::npos) {
        return;
    }

    auto length = static_cast<uint32_t>(text.size());
    std::string_view tail = text.substr(last + 1);
    size_t first_newline = tail.find('\n');

    if (first_newline == std::string_view::npos) {
        ctx.report(Span{length, length}, "file should end with a newline",
                   Fix::insert(length, "\n"));
        return;
    }

    auto keep_end = static_cast<uint32_t>(last + 1 + first_newline + 1);
    if (keep_end == length) {
        return;
    }
    ctx.report(Span{keep_end, length}, "file should end with exactly one newline",
               Fix::remove(Span{keep_end, length}));
}

// ============================================================================
// line-length
// ============================================================================

void check_line_length(RuleContext& ctx) {
    const auto& model = ctx.model();
    auto limit = static_cast<size_t>(ctx.options().line_length);
    bool ignore_comments = ctx.param_bool("ignore_comments");

    for (uint32_t line = 1; line <= model.line_count(); ++line) {
        std::string_view text = model.line_text(line);
        size_t length = text.size();
        if (length <= limit) {
            continue;
        }

        uint32_t start = model.line_start(line);
        if (ignore_comments) {
            size_t first = text.find_first_not_of(" \t");
            if (first != std::string_view::npos) {
                auto index = model.token_at(start + static_cast<uint32_t>(first));
                if (index && model.token(*index).is_comment()) {
                    continue;
                }
            }
        }

        // Lengths are in bytes, like columns, so the violation sits at limit + 1.
        Span span{start + static_cast<uint32_t>(limit), start + static_cast<uint32_t>(length)};
        ctx.report(span, "line is " + std::to_string(length) + " columns long, limit is " +
                             std::to_string(limit));
    }
}

// ============================================================================
// no-tabs
// ============================================================================

void check_no_tabs(RuleContext& ctx) {
    const auto& model = ctx.model();
    std::string indent_unit(static_cast<size_t>(std::max<int64_t>(ctx.options().indent_width, 1)),
                            ' ');

    for (uint32_t line = 1; line <= model.line_count(); ++line) {
        std::string_view text = model.line_text(line);
        size_t indent_end = text.find_first_not_of(" \t");
        if (indent_end == std::string_view::npos) {
            continue; // blank lines belong to trailing-whitespace
        }
        std::string_view indent = text.substr(0, indent_end);
        if (indent.find('\t') == std::string_view::npos) {
            continue;
        }

        uint32_t start = model.line_start(line);
        if (model.inside_multiline_token(start)) {
            continue;
        }

        std::string expanded;
        for (char c : indent) {
            if (c == '\t') {
                expanded += indent_unit;
            } else {
                expanded += c;
            }
        }
        Span span{start, start + static_cast<uint32_t>(indent.size())};
        ctx.report(span, "indentation should use spaces, not tabs",
                   Fix::replace(span, std::move(expanded)));
    }
}

// ============================================================================
// trailing-whitespace
// ============================================================================

void check_trailing_whitespace(RuleContext& ctx) {
    const auto& model = ctx.model();
    bool ignore_empty = ctx.param_bool("ignore_empty_lines");

    for (uint32_t line = 1; line <= model.line_count(); ++line) {
        std::string_view text = model.line_text(line);
        size_t last = text.find_last_not_of(" \t");
        size_t from = last == std::string_view::npos ? 0 : last + 1;
        if (from == text.size()) {
            continue;
        }
        if (last == std::string_view::npos && ignore_empty) {
            continue;
        }

        uint32_t start = model.line_start(line);
        Span span{start + static_cast<uint32_t>(from), start + static_cast<uint32_t>(text.size())};
        if (inside_string(model, span.start)) {
            continue;
        }
        ctx.report(span, "trailing whitespace", Fix::remove(span));
    }
}

// ============================================================================
// vertical-whitespace
// ============================================================================

void check_vertical_whitespace(RuleContext& ctx) {
    const auto& model = ctx.model();
    int64_t max_empty = ctx.param_int("max_empty_lines");
    if (max_empty < 0) {
        throw RuleError("max_empty_lines must not be negative");
    }
    auto allowed = static_cast<uint32_t>(max_empty);

    uint32_t lines = model.line_count();
    uint32_t run_start = 0;
    uint32_t run_length = 0;

    // One step past the last line flushes a run that reaches the end of file.
    for (uint32_t line = 1; line <= lines + 1; ++line) {
        bool blank = line <= lines && is_blank(model.line_text(line)) &&
                     !model.inside_multiline_token(model.line_start(line));
        if (blank) {
            if (run_length == 0) {
                run_start = line;
            }
            ++run_length;
            continue;
        }

        if (run_length > allowed) {
            uint32_t first_extra = run_start + allowed;
            Span span{model.line_start(first_extra), model.line_start(run_start + run_length)};
            ctx.report(span,
                       std::to_string(run_length) + " consecutive blank lines, at most " +
                           std::to_string(allowed) + " allowed",
                       Fix::remove(span));
        }
        run_length = 0;
    }
}

} // namespace

auto layout_rules() -> std::vector<Rule> {
    std::vector<Rule> rules;

    rules.push_back(Rule{RuleInfo{.id = "brace-same-line",
                                  .title = "Opening braces stay on the line of their declaration",
                                  .severity = Severity::Error,
                                  .category = Category::Layout,
                                  .fixable = true},
                         check_brace_same_line});

    rules.push_back(Rule{RuleInfo{.id = "else-same-line",
                                  .title = "'else' and 'catch' follow the closing brace",
                                  .severity = Severity::Warning,
                                  .category = Category::Layout,
                                  .fixable = true},
                         check_else_same_line});

    rules.push_back(Rule{RuleInfo{.id = "file-trailing-newline",
                                  .title = "Files end with exactly one newline",
                                  .severity = Severity::Warning,
                                  .category = Category::Layout,
                                  .fixable = true},
                         check_file_trailing_newline});

    rules.push_back(Rule{RuleInfo{.id = "line-length",
                                  .title = "Lines fit within the configured length",
                                  .severity = Severity::Warning,
                                  .category = Category::Layout,
                                  .fixable = false,
                                  .enabled_by_default = true,
                                  .params = {ParamSpec{"ignore_comments", false,
                                                       "skip lines that start with a comment"}}},
                         check_line_length});

    rules.push_back(Rule{RuleInfo{.id = "no-tabs",
                                  .title = "Indentation uses spaces",
                                  .severity = Severity::Error,
                                  .category = Category::Layout,
                                  .fixable = true},
                         check_no_tabs});

    rules.push_back(Rule{RuleInfo{.id = "trailing-whitespace",
                                  .title = "Lines do not end with whitespace",
                                  .severity = Severity::Error,
                                  .category = Category::Layout,
                                  .fixable = true,
                                  .enabled_by_default = true,
                                  .params = {ParamSpec{"ignore_empty_lines", false,
                                                       "allow whitespace-only lines"}}},
                         check_trailing_whitespace});

    rules.push_back(Rule{RuleInfo{.id = "vertical-whitespace",
                                  .title = "Limit consecutive blank lines",
                                  .severity = Severity::Warning,
                                  .category = Category::Layout,
                                  .fixable = true,
                                  .enabled_by_default = true,
                                  .params = {ParamSpec{"max_empty_lines", int64_t{1},
                                                       "blank lines allowed in a row"}}},
                         check_vertical_whitespace});

    return rules;
}

} // namespace conform::rules
