//! # Matcher Engine
//!
//! Runs every active rule of a registry over one model revision.
//!
//! ## Guarantees
//!
//! - Rules run in registry order and only see the model, never each
//!   other's output.
//! - Violations come back sorted by `(start, rule id, end, message)`.
//! - A rule that throws loses everything it reported in this run and
//!   produces one `rule-fault` diagnostic instead; the others still run.

#ifndef CONFORM_ENGINE_MATCHER_HPP
#define CONFORM_ENGINE_MATCHER_HPP

#include "engine/diagnostic.hpp"
#include "model/source_model.hpp"
#include "registry/registry.hpp"
#include "rules/rule.hpp"

#include <vector>

namespace conform::engine {

struct CheckOptions {
    bool apply_suppressions = true;
};

struct CheckResult {
    std::vector<rules::Violation> violations;
    std::vector<ToolDiagnostic> faults;
    size_t suppressed = 0;
};

[[nodiscard]] auto check(const model::SourceModel& model, const registry::RuleRegistry& registry,
                         const CheckOptions& options = {}) -> CheckResult;

/// Total order used for every list of violations the engine hands out.
[[nodiscard]] auto violation_less(const rules::Violation& a, const rules::Violation& b) -> bool;

} // namespace conform::engine

#endif // CONFORM_ENGINE_MATCHER_HPP
