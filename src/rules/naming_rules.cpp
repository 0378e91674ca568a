// Naming rules - casing and length of declared names

#include "rule_helpers.hpp"
#include "rules/builtin.hpp"

#include <algorithm>

namespace conform::rules {

using namespace detail;

namespace {

auto is_lower_camel_case(std::string_view name) -> bool {
    return !name.empty() && name[0] >= 'a' && name[0] <= 'z' &&
           name.find('_') == std::string_view::npos;
}

auto is_upper_camel_case(std::string_view name) -> bool {
    return !name.empty() && name[0] >= 'A' && name[0] <= 'Z' &&
           name.find('_') == std::string_view::npos;
}

/// Shared body of the two naming rules.
void check_names(RuleContext& ctx, bool types, const char* casing,
                 bool (*well_cased)(std::string_view)) {
    const auto& model = ctx.model();
    int64_t min_length = ctx.param_int("min_length");
    int64_t max_length = ctx.param_int("max_length");
    const auto& allowed = ctx.param_list("allowed_names");

    for (const auto& decl : model.declarations()) {
        if (model::is_type_declaration(decl.kind) != types) {
            continue;
        }
        const Token& token = model.token(decl.name);
        std::string_view name = strip_backticks(token.lexeme);
        if (name == "_" || name.empty() || name[0] == '$') {
            continue;
        }
        if (std::find(allowed.begin(), allowed.end(), name) != allowed.end()) {
            continue;
        }

        // A leading underscore marks private storage; the rest must still be cased.
        std::string_view core = name.substr(std::min(name.find_first_not_of('_'), name.size()));
        std::string kind(model::decl_kind_name(decl.kind));

        if (!core.empty() && is_ascii(core) && !well_cased(core)) {
            ctx.report(token.span,
                       kind + " name '" + std::string(name) + "' should be " + casing);
            continue;
        }

        auto length = static_cast<int64_t>(display_length(name));
        if (length < min_length) {
            ctx.report(token.span, kind + " name '" + std::string(name) +
                                       "' should be at least " + std::to_string(min_length) +
                                       " characters long");
        } else if (length > max_length) {
            ctx.report(token.span, kind + " name '" + std::string(name) +
                                       "' should be at most " + std::to_string(max_length) +
                                       " characters long");
        }
    }
}

void check_identifier_name(RuleContext& ctx) {
    check_names(ctx, false, "lowerCamelCase", is_lower_camel_case);
}

void check_type_name(RuleContext& ctx) {
    check_names(ctx, true, "UpperCamelCase", is_upper_camel_case);
}

auto naming_params(int64_t min_length, int64_t max_length) -> std::vector<ParamSpec> {
    return {
        ParamSpec{"min_length", min_length, "shortest accepted name"},
        ParamSpec{"max_length", max_length, "longest accepted name"},
        ParamSpec{"allowed_names", std::vector<std::string>{}, "names that are never reported"},
    };
}

} // namespace

auto naming_rules() -> std::vector<Rule> {
    std::vector<Rule> rules;

    rules.push_back(Rule{RuleInfo{.id = "identifier-name",
                                  .title = "Variables, functions and enum cases are lowerCamelCase",
                                  .severity = Severity::Error,
                                  .category = Category::Naming,
                                  .fixable = false,
                                  .enabled_by_default = true,
                                  .params = naming_params(1, 60)},
                         check_identifier_name});

    rules.push_back(Rule{RuleInfo{.id = "type-name",
                                  .title = "Type names are UpperCamelCase",
                                  .severity = Severity::Error,
                                  .category = Category::Naming,
                                  .fixable = false,
                                  .enabled_by_default = true,
                                  .params = naming_params(3, 40)},
                         check_type_name});

    return rules;
}

} // namespace conform::rules
