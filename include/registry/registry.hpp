//! # Rule Registry
//!
//! The immutable set of rules for one process run: every known rule plus
//! the resolved severity, enablement and parameters of each active one.
//!
//! ## Resolution Order
//!
//! ```text
//! rule default  <  [categories.<name>] override  <  [rules.<id>] override
//! ```
//!
//! ## Ordering
//!
//! `all()` and `active()` are sorted by rule id regardless of the order the
//! built-ins were supplied in. That order is the tie-break for diagnostics
//! and for fix conflicts, so identical inputs give identical output.
//!
//! The registry is built once and only read afterwards; worker threads
//! share it without locking.

#ifndef CONFORM_REGISTRY_REGISTRY_HPP
#define CONFORM_REGISTRY_REGISTRY_HPP

#include "common.hpp"
#include "config/config.hpp"
#include "rules/rule.hpp"

#include <string_view>
#include <vector>

namespace conform::registry {

struct ActiveRule {
    Rc<const rules::Rule> rule;
    rules::Severity severity;
    rules::ParamMap params;

    [[nodiscard]] auto id() const -> const std::string& {
        return rule->info.id;
    }
};

class RuleRegistry {
public:
    /// Validates `config` against `builtins` and resolves the active set.
    ///
    /// Fails on duplicate rule ids, unknown categories, unknown rule ids,
    /// unknown parameters and parameters of the wrong type.
    [[nodiscard]] static auto load(std::vector<rules::Rule> builtins, const config::Config& config)
        -> Result<RuleRegistry, config::ConfigError>;

    /// Every known rule, sorted by id.
    [[nodiscard]] auto all() const -> const std::vector<Rc<const rules::Rule>>& {
        return rules_;
    }

    /// Enabled rules with resolved settings, sorted by id.
    [[nodiscard]] auto active() const -> const std::vector<ActiveRule>& {
        return active_;
    }

    [[nodiscard]] auto find(std::string_view id) const -> const rules::Rule*;
    [[nodiscard]] auto find_active(std::string_view id) const -> const ActiveRule*;

    [[nodiscard]] auto is_active(std::string_view id) const -> bool {
        return find_active(id) != nullptr;
    }

    [[nodiscard]] auto options() const -> const rules::RuleOptions& {
        return options_;
    }

private:
    std::vector<Rc<const rules::Rule>> rules_;
    std::vector<ActiveRule> active_;
    rules::RuleOptions options_;
};

} // namespace conform::registry

#endif // CONFORM_REGISTRY_REGISTRY_HPP
