#include "rules/rule.hpp"

namespace conform::rules {

auto edits_overlap(const Edit& a, const Edit& b) -> bool {
    const Span& x = a.span;
    const Span& y = b.span;

    if (x.empty() && y.empty()) {
        return x.start == y.start;
    }
    if (x.empty()) {
        return x.start > y.start && x.start < y.end;
    }
    if (y.empty()) {
        return y.start > x.start && y.start < x.end;
    }
    return x.start < y.end && y.start < x.end;
}

auto Fix::replace(Span span, std::string text) -> Fix {
    return Fix{{Edit{span, std::move(text)}}};
}

auto Fix::insert(uint32_t offset, std::string text) -> Fix {
    return Fix{{Edit{Span{offset, offset}, std::move(text)}}};
}

auto Fix::remove(Span span) -> Fix {
    return Fix{{Edit{span, ""}}};
}

auto Fix::validate(size_t text_length) const -> std::optional<std::string> {
    for (size_t i = 0; i < edits.size(); ++i) {
        const Span& span = edits[i].span;
        if (span.start > span.end) {
            return "edit " + std::to_string(i) + " has an inverted span";
        }
        if (span.end > text_length) {
            return "edit " + std::to_string(i) + " ends past the end of the text";
        }
        if (i == 0) {
            continue;
        }
        const Edit& prev = edits[i - 1];
        if (prev.span.start > span.start) {
            return "edits are not sorted by start offset";
        }
        if (edits_overlap(prev, edits[i]) || prev.span.end > span.start) {
            return "edits " + std::to_string(i - 1) + " and " + std::to_string(i) + " overlap";
        }
    }
    return std::nullopt;
}

} // namespace conform::rules
