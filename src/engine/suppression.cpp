#include "engine/suppression.hpp"

#include "log/log.hpp"

namespace conform::engine {

namespace {

constexpr std::string_view NEXT_LINE = "conform:disable-next-line";
constexpr std::string_view SAME_LINE = "conform:disable-line";

auto trim(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of(" \t");
    if (start == std::string_view::npos) {
        return {};
    }
    size_t end = text.find_last_not_of(" \t");
    return text.substr(start, end - start + 1);
}

/// Splits "a, b,c" into rule ids; an empty list means every rule.
auto parse_rule_list(std::string_view text) -> std::set<std::string, std::less<>> {
    std::set<std::string, std::less<>> ids;
    while (!text.empty()) {
        size_t comma = text.find(',');
        std::string_view item = trim(text.substr(0, comma));
        if (!item.empty()) {
            ids.emplace(item);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        text.remove_prefix(comma + 1);
    }
    if (ids.empty()) {
        ids.emplace("all");
    }
    return ids;
}

} // namespace

auto Suppressions::scan(const model::SourceModel& model) -> Suppressions {
    Suppressions result;
    for (const auto& token : model.tokens()) {
        if (token.kind != lexer::TokenKind::LineComment) {
            continue;
        }
        std::string_view body = trim(std::string_view(token.lexeme).substr(2));

        uint32_t line = 0;
        if (body.rfind(NEXT_LINE, 0) == 0) {
            body.remove_prefix(NEXT_LINE.size());
            line = token.loc.line + 1;
        } else if (body.rfind(SAME_LINE, 0) == 0) {
            body.remove_prefix(SAME_LINE.size());
            line = token.loc.line;
        } else {
            continue;
        }
        // "conform:disable-lines" and the like are not directives.
        if (!body.empty() && body.front() != ' ' && body.front() != '\t') {
            continue;
        }

        auto ids = parse_rule_list(body);
        CONFORM_LOG_TRACE("engine", model.path() << ":" << line << ": suppressing "
                                                 << ids.size() << " rule(s)");
        result.lines_[line].merge(ids);
    }
    return result;
}

auto Suppressions::is_suppressed(std::string_view rule_id, uint32_t line) const -> bool {
    auto it = lines_.find(line);
    if (it == lines_.end()) {
        return false;
    }
    return it->second.count("all") > 0 || it->second.find(rule_id) != it->second.end();
}

} // namespace conform::engine
