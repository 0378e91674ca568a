#include "rules/rule.hpp"

#include <algorithm>

namespace conform::rules {

// ============================================================================
// Names
// ============================================================================

auto severity_name(Severity severity) -> std::string_view {
    switch (severity) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    }
    return "unknown";
}

auto parse_severity(std::string_view name) -> std::optional<Severity> {
    if (name == "error")
        return Severity::Error;
    if (name == "warning")
        return Severity::Warning;
    if (name == "info")
        return Severity::Info;
    return std::nullopt;
}

auto category_name(Category category) -> std::string_view {
    switch (category) {
    case Category::Naming:
        return "naming";
    case Category::Spacing:
        return "spacing";
    case Category::Layout:
        return "layout";
    case Category::Structure:
        return "structure";
    case Category::Idiom:
        return "idiom";
    }
    return "unknown";
}

auto parse_category(std::string_view name) -> std::optional<Category> {
    if (name == "naming")
        return Category::Naming;
    if (name == "spacing")
        return Category::Spacing;
    if (name == "layout")
        return Category::Layout;
    if (name == "structure")
        return Category::Structure;
    if (name == "idiom")
        return Category::Idiom;
    return std::nullopt;
}

auto param_type_name(const ParamValue& value) -> std::string_view {
    switch (value.index()) {
    case 0:
        return "bool";
    case 1:
        return "integer";
    case 2:
        return "string";
    default:
        return "string list";
    }
}

auto RuleInfo::find_param(std::string_view name) const -> const ParamSpec* {
    auto it = std::find_if(params.begin(), params.end(),
                           [&](const ParamSpec& spec) { return spec.name == name; });
    return it == params.end() ? nullptr : &*it;
}

// ============================================================================
// RuleContext
// ============================================================================

RuleContext::RuleContext(const model::SourceModel& model, const RuleInfo& info,
                         Severity severity, const ParamMap& params, const RuleOptions& options)
    : model_(model), info_(info), severity_(severity), params_(params), options_(options) {}

void RuleContext::report(Span span, std::string message, std::optional<Fix> fix) {
    size_t length = model_.text().size();
    if (span.start > span.end || span.end > length) {
        throw RuleError("violation span [" + std::to_string(span.start) + ", " +
                        std::to_string(span.end) + ") is outside the text");
    }
    if (fix) {
        if (auto problem = fix->validate(length)) {
            throw RuleError("malformed fix: " + *problem);
        }
        if (fix->empty()) {
            fix.reset();
        }
    }

    Violation violation;
    violation.rule_id = info_.id;
    violation.severity = severity_;
    violation.category = info_.category;
    violation.span = span;
    violation.loc = model_.location(span.start);
    violation.message = std::move(message);
    violation.fix = std::move(fix);
    violations_.push_back(std::move(violation));
}

auto RuleContext::param(std::string_view name) const -> const ParamValue& {
    auto it = params_.find(std::string(name));
    if (it == params_.end()) {
        throw RuleError("rule reads undeclared parameter '" + std::string(name) + "'");
    }
    return it->second;
}

auto RuleContext::param_bool(std::string_view name) const -> bool {
    const auto& value = param(name);
    if (const auto* b = std::get_if<bool>(&value)) {
        return *b;
    }
    throw RuleError("parameter '" + std::string(name) + "' is not a bool");
}

auto RuleContext::param_int(std::string_view name) const -> int64_t {
    const auto& value = param(name);
    if (const auto* i = std::get_if<int64_t>(&value)) {
        return *i;
    }
    throw RuleError("parameter '" + std::string(name) + "' is not an integer");
}

auto RuleContext::param_string(std::string_view name) const -> const std::string& {
    const auto& value = param(name);
    if (const auto* s = std::get_if<std::string>(&value)) {
        return *s;
    }
    throw RuleError("parameter '" + std::string(name) + "' is not a string");
}

auto RuleContext::param_list(std::string_view name) const -> const std::vector<std::string>& {
    const auto& value = param(name);
    if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        return *list;
    }
    throw RuleError("parameter '" + std::string(name) + "' is not a string list");
}

} // namespace conform::rules
