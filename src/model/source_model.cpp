#include "model/source_model.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace conform::model {

namespace {

auto is_significant(const Token& token) -> bool {
    return !token.is_trivia() && !token.is_eof();
}

auto is_statement_keyword(std::string_view word) -> bool {
    static constexpr std::string_view WORDS[] = {
        "actor", "catch",    "class",  "defer",  "deinit", "do",    "else", "enum",
        "extension", "for",  "func",   "guard",  "if",     "init",  "let",  "protocol",
        "repeat", "return",  "struct", "subscript", "switch", "var", "where", "while",
    };
    return std::find(std::begin(WORDS), std::end(WORDS), word) != std::end(WORDS);
}

} // namespace

SourceModel::SourceModel(Rc<const lexer::Source> source, std::vector<Token> tokens,
                         uint32_t revision)
    : source_(std::move(source)), tokens_(std::move(tokens)), revision_(revision) {
    index_tokens();
    collect_declarations();
}

auto SourceModel::build(Rc<const lexer::Source> source, const lexer::Frontend& frontend,
                        uint32_t revision) -> Result<SourceModel, ParseFailure> {
    auto parsed = frontend.parse(*source);
    if (is_err(parsed)) {
        return std::move(unwrap_err(parsed));
    }
    CONFORM_LOG_TRACE("model", source->filename() << " r" << revision << ": "
                                                  << unwrap(parsed).size() << " tokens");
    return SourceModel(std::move(source), std::move(unwrap(parsed)), revision);
}

auto SourceModel::build(std::string path, std::string text, const lexer::Frontend& frontend)
    -> Result<SourceModel, ParseFailure> {
    auto source = make_rc<const lexer::Source>(std::move(path), std::move(text));
    return build(std::move(source), frontend, 0);
}

auto SourceModel::with_text(std::string text, const lexer::Frontend& frontend) const
    -> Result<SourceModel, ParseFailure> {
    auto source = make_rc<const lexer::Source>(std::string(path()), std::move(text));
    return build(std::move(source), frontend, revision_ + 1);
}

// ============================================================================
// Structural Index
// ============================================================================

void SourceModel::index_tokens() {
    size_t n = tokens_.size();
    prev_sig_.assign(n, NONE);
    next_sig_.assign(n, NONE);
    parent_.assign(n, NONE);
    match_.assign(n, NONE);

    uint32_t last = NONE;
    for (size_t i = 0; i < n; ++i) {
        prev_sig_[i] = last;
        if (is_significant(tokens_[i])) {
            last = static_cast<uint32_t>(i);
        }
    }

    last = NONE;
    for (size_t i = n; i-- > 0;) {
        next_sig_[i] = last;
        if (is_significant(tokens_[i])) {
            last = static_cast<uint32_t>(i);
        }
    }

    // The frontend guarantees balanced brackets; a stray closer is tolerated.
    std::vector<uint32_t> open;
    for (size_t i = 0; i < n; ++i) {
        const Token& token = tokens_[i];
        if (token.is_close_bracket() && !open.empty()) {
            uint32_t opener = open.back();
            open.pop_back();
            match_[opener] = static_cast<uint32_t>(i);
            match_[i] = opener;
        }
        parent_[i] = open.empty() ? NONE : open.back();
        if (token.is_open_bracket()) {
            open.push_back(static_cast<uint32_t>(i));
        }
    }
}

auto SourceModel::token_at(uint32_t offset) const -> std::optional<size_t> {
    if (offset > text().size() || tokens_.empty()) {
        return std::nullopt;
    }
    auto it = std::upper_bound(tokens_.begin(), tokens_.end(), offset,
                               [](uint32_t value, const Token& token) {
                                   return value < token.span.start;
                               });
    if (it == tokens_.begin()) {
        return std::nullopt;
    }
    // Step back over empty tokens (only Eof) so the containing token wins.
    size_t index = static_cast<size_t>(std::distance(tokens_.begin(), it)) - 1;
    while (index > 0 && tokens_[index].span.empty() && tokens_[index - 1].span.end > offset) {
        --index;
    }
    return index;
}

auto SourceModel::prev_significant(size_t index) const -> std::optional<size_t> {
    return to_optional(prev_sig_[index]);
}

auto SourceModel::next_significant(size_t index) const -> std::optional<size_t> {
    return to_optional(next_sig_[index]);
}

auto SourceModel::parent(size_t index) const -> std::optional<size_t> {
    return to_optional(parent_[index]);
}

auto SourceModel::matching(size_t index) const -> std::optional<size_t> {
    return to_optional(match_[index]);
}

auto SourceModel::statement_introducer(size_t index) const -> std::optional<size_t> {
    // A line break ends the segment unless one side of it continues the
    // expression (`a +\n b`, `foo\n    .bar`, `f(a,\n b)`).
    auto continues = [this](size_t left, size_t right) {
        const Token& l = tokens_[left];
        const Token& r = tokens_[right];
        return l.is(TokenKind::Operator) || l.is(TokenKind::Comma) || l.is(TokenKind::Colon) ||
               l.is(TokenKind::Dot) || r.is(TokenKind::Operator) || r.is(TokenKind::Dot);
    };

    std::optional<size_t> found;
    size_t after = index;
    auto cursor = prev_significant(index);

    while (cursor) {
        const Token& token = tokens_[*cursor];
        if (token.is(TokenKind::LBrace) || token.is(TokenKind::RBrace) ||
            token.is(TokenKind::Semicolon) || token.is_open_bracket()) {
            break;
        }
        if (after != index && has_newline_between(*cursor, after) && !continues(*cursor, after)) {
            break;
        }
        if (token.is_close_bracket()) {
            auto opener = matching(*cursor);
            if (!opener) {
                break;
            }
            after = *opener;
            cursor = prev_significant(*opener);
            continue;
        }
        if (token.kind == TokenKind::Keyword && is_statement_keyword(token.lexeme)) {
            found = *cursor;
        }
        after = *cursor;
        cursor = prev_significant(*cursor);
    }

    return found;
}

auto SourceModel::has_newline_between(size_t from, size_t to) const -> bool {
    for (size_t i = from + 1; i < to && i < tokens_.size(); ++i) {
        if (tokens_[i].is(TokenKind::Newline)) {
            return true;
        }
    }
    return false;
}

auto SourceModel::has_comment_between(size_t from, size_t to) const -> bool {
    for (size_t i = from + 1; i < to && i < tokens_.size(); ++i) {
        if (tokens_[i].is_comment()) {
            return true;
        }
    }
    return false;
}

auto SourceModel::inside_multiline_token(uint32_t offset) const -> bool {
    auto index = token_at(offset);
    if (!index) {
        return false;
    }
    const Token& token = tokens_[*index];
    return (token.is(TokenKind::StringLiteral) || token.is(TokenKind::BlockComment)) &&
           token.span.start < offset;
}

auto SourceModel::line_count() const -> uint32_t {
    uint32_t count = source_->line_count();
    if (count > 1 && !text().empty() && text().back() == '\n') {
        --count;
    }
    return count;
}

} // namespace conform::model
