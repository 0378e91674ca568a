#include "registry/registry.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace conform::registry {

namespace {

auto by_id(const Rc<const rules::Rule>& rule, std::string_view id) -> bool {
    return rule->info.id < id;
}

} // namespace

auto RuleRegistry::load(std::vector<rules::Rule> builtins, const config::Config& config)
    -> Result<RuleRegistry, config::ConfigError> {
    using config::ConfigError;

    RuleRegistry registry;
    registry.options_.line_length = config.line_length;
    registry.options_.indent_width = config.indent_width;

    for (auto& rule : builtins) {
        registry.rules_.push_back(make_rc<const rules::Rule>(std::move(rule)));
    }
    std::sort(registry.rules_.begin(), registry.rules_.end(),
              [](const auto& a, const auto& b) { return a->info.id < b->info.id; });

    for (size_t i = 1; i < registry.rules_.size(); ++i) {
        if (registry.rules_[i]->info.id == registry.rules_[i - 1]->info.id) {
            return ConfigError{"duplicate rule id '" + registry.rules_[i]->info.id + "'", "", 0};
        }
    }

    // Validate overrides before resolving anything.
    for (const auto& [name, override_] : config.categories) {
        if (!rules::parse_category(name)) {
            return ConfigError{"unknown category '" + name + "'", config.path, override_.line};
        }
    }
    for (const auto& [id, override_] : config.rules) {
        const rules::Rule* rule = registry.find(id);
        if (!rule) {
            return ConfigError{"unknown rule '" + id + "'", config.path, override_.line};
        }
        for (const auto& [param, value] : override_.params) {
            auto line_it = override_.param_lines.find(param);
            uint32_t line = line_it == override_.param_lines.end() ? override_.line
                                                                   : line_it->second;
            const rules::ParamSpec* spec = rule->info.find_param(param);
            if (!spec) {
                return ConfigError{"unknown parameter '" + param + "' for rule '" + id + "'",
                                   config.path, line};
            }
            if (spec->default_value.index() != value.index()) {
                return ConfigError{"parameter '" + param + "' of rule '" + id + "' expects " +
                                       std::string(rules::param_type_name(spec->default_value)) +
                                       ", got " + std::string(rules::param_type_name(value)),
                                   config.path, line};
            }
        }
    }

    // Resolve: rule default < category override < rule override.
    for (const auto& rule : registry.rules_) {
        const auto& info = rule->info;
        bool enabled = info.enabled_by_default;
        rules::Severity severity = info.severity;

        auto category = config.categories.find(std::string(rules::category_name(info.category)));
        if (category != config.categories.end()) {
            enabled = category->second.enabled.value_or(enabled);
            severity = category->second.severity.value_or(severity);
        }

        rules::ParamMap params;
        for (const auto& spec : info.params) {
            params[spec.name] = spec.default_value;
        }

        auto override_ = config.rules.find(info.id);
        if (override_ != config.rules.end()) {
            enabled = override_->second.enabled.value_or(enabled);
            severity = override_->second.severity.value_or(severity);
            for (const auto& [param, value] : override_->second.params) {
                params[param] = value;
            }
        }

        if (!enabled) {
            CONFORM_LOG_DEBUG("registry", "rule " << info.id << " disabled");
            continue;
        }
        registry.active_.push_back(ActiveRule{rule, severity, std::move(params)});
    }

    CONFORM_LOG_INFO("registry", registry.active_.size() << " of " << registry.rules_.size()
                                                         << " rules active");
    return registry;
}

auto RuleRegistry::find(std::string_view id) const -> const rules::Rule* {
    auto it = std::lower_bound(rules_.begin(), rules_.end(), id, by_id);
    if (it == rules_.end() || (*it)->info.id != id) {
        return nullptr;
    }
    return it->get();
}

auto RuleRegistry::find_active(std::string_view id) const -> const ActiveRule* {
    auto it = std::lower_bound(active_.begin(), active_.end(), id,
                               [](const ActiveRule& rule, std::string_view key) {
                                   return rule.id() < key;
                               });
    if (it == active_.end() || it->id() != id) {
        return nullptr;
    }
    return &*it;
}

} // namespace conform::registry
