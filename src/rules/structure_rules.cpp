// Structure rules - semicolons, redundant access control, import order

#include "rule_helpers.hpp"
#include "rules/builtin.hpp"

#include <algorithm>
#include <cctype>

namespace conform::rules {

using namespace detail;

namespace {

// ============================================================================
// no-semicolons
// ============================================================================

void check_no_semicolons(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        const Token& semi = model.token(i);
        if (!semi.is(TokenKind::Semicolon)) {
            continue;
        }

        // Only a semicolon that ends its line; `a; b` separates statements.
        size_t j = i + 1;
        while (j < model.token_count() &&
               (model.token(j).is(TokenKind::Whitespace) || model.token(j).is_comment())) {
            ++j;
        }
        if (j < model.token_count() && !model.token(j).is(TokenKind::Newline) &&
            !model.token(j).is_eof()) {
            continue;
        }

        uint32_t start = semi.span.start;
        auto prev = model.prev_significant(i);
        if (prev && plain_gap(model, *prev, i)) {
            start = model.token(*prev).span.end;
        }
        ctx.report(semi.span, "statements should not end with a semicolon",
                   Fix::remove(Span{start, semi.span.end}));
    }
}

// ============================================================================
// redundant-internal
// ============================================================================

void check_redundant_internal(RuleContext& ctx) {
    const auto& model = ctx.model();

    for (size_t i = 0; i < model.token_count(); ++i) {
        const Token& token = model.token(i);
        if (!token.is_keyword("internal")) {
            continue;
        }
        auto next = model.next_significant(i);
        // `internal(set)` narrows a setter and is not redundant.
        if (!next || model.token(*next).is(TokenKind::LParen)) {
            continue;
        }
        uint32_t end = plain_gap(model, i, *next) ? model.token(*next).span.start : token.span.end;
        ctx.report(token.span, "'internal' is the default access level and can be omitted",
                   Fix::remove(Span{token.span.start, end}));
    }
}

// ============================================================================
// sorted-imports
// ============================================================================

struct ImportLine {
    uint32_t line;
    std::string key;
};

auto lowercase(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto import_less(const ImportLine& a, const ImportLine& b) -> bool {
    std::string la = lowercase(a.key);
    std::string lb = lowercase(b.key);
    if (la != lb) {
        return la < lb;
    }
    return a.key < b.key;
}

/// Import statements that start their own line (attributes allowed) and
/// end it, in source order.
auto collect_imports(const SourceModel& model) -> std::vector<ImportLine> {
    std::vector<ImportLine> imports;

    for (size_t i = 0; i < model.token_count(); ++i) {
        const Token& token = model.token(i);
        if (!token.is_keyword("import")) {
            continue;
        }

        size_t first = i;
        auto prev = model.prev_significant(i);
        while (prev && model.token(*prev).is(TokenKind::Attribute) &&
               !model.has_newline_between(*prev, first)) {
            first = *prev;
            prev = model.prev_significant(*prev);
        }
        if (prev && !model.has_newline_between(*prev, first)) {
            continue;
        }

        std::string key;
        bool own_line = true;
        size_t last = i;
        for (auto cursor = model.next_significant(i); cursor;
             cursor = model.next_significant(*cursor)) {
            if (model.has_newline_between(last, *cursor)) {
                break;
            }
            last = *cursor;
            const Token& part = model.token(*cursor);
            if (part.is(TokenKind::Semicolon)) {
                own_line = false;
                break;
            }
            if (!key.empty() && !part.is(TokenKind::Dot) && key.back() != '.') {
                key += ' ';
            }
            key += part.lexeme;
        }
        if (!own_line || key.empty()) {
            continue;
        }
        imports.push_back(ImportLine{token.loc.line, std::move(key)});
    }

    return imports;
}

void check_sorted_imports(RuleContext& ctx) {
    const auto& model = ctx.model();
    std::vector<ImportLine> imports = collect_imports(model);

    size_t group_start = 0;
    while (group_start < imports.size()) {
        size_t group_end = group_start + 1;
        while (group_end < imports.size() &&
               imports[group_end].line == imports[group_end - 1].line + 1) {
            ++group_end;
        }

        std::vector<ImportLine> group(imports.begin() + static_cast<std::ptrdiff_t>(group_start),
                                      imports.begin() + static_cast<std::ptrdiff_t>(group_end));
        group_start = group_end;

        auto unsorted = std::is_sorted_until(
            group.begin(), group.end(),
            [](const ImportLine& a, const ImportLine& b) { return import_less(a, b); });
        if (unsorted == group.end()) {
            continue;
        }

        uint32_t first_line = group.front().line;
        uint32_t last_line = group.back().line;
        uint32_t begin = model.line_start(first_line);
        uint32_t end = model.line_start(last_line) +
                       static_cast<uint32_t>(model.line_text(last_line).size());
        bool crlf = model.text().substr(model.line_start(first_line) +
                                            model.line_text(first_line).size(),
                                        2) == "\r\n";

        std::vector<ImportLine> sorted = group;
        std::stable_sort(sorted.begin(), sorted.end(), import_less);
        std::string replacement;
        for (size_t k = 0; k < sorted.size(); ++k) {
            if (k > 0) {
                replacement += crlf ? "\r\n" : "\n";
            }
            replacement += model.line_text(sorted[k].line);
        }

        uint32_t bad_line = unsorted->line;
        Span span{model.line_start(bad_line),
                  model.line_start(bad_line) +
                      static_cast<uint32_t>(model.line_text(bad_line).size())};
        Fix fix = Fix::replace(Span{begin, end}, std::move(replacement));
        ctx.report(span, "imports should be sorted alphabetically ('" + unsorted->key +
                             "' is out of order)",
                   std::move(fix));
    }
}

} // namespace

auto structure_rules() -> std::vector<Rule> {
    std::vector<Rule> rules;

    rules.push_back(Rule{RuleInfo{.id = "no-semicolons",
                                  .title = "Statements are not terminated by semicolons",
                                  .severity = Severity::Warning,
                                  .category = Category::Structure,
                                  .fixable = true},
                         check_no_semicolons});

    rules.push_back(Rule{RuleInfo{.id = "redundant-internal",
                                  .title = "Omit the default 'internal' access modifier",
                                  .severity = Severity::Info,
                                  .category = Category::Structure,
                                  .fixable = true},
                         check_redundant_internal});

    rules.push_back(Rule{RuleInfo{.id = "sorted-imports",
                                  .title = "Consecutive imports are sorted",
                                  .severity = Severity::Warning,
                                  .category = Category::Structure,
                                  .fixable = true},
                         check_sorted_imports});

    return rules;
}

} // namespace conform::rules
