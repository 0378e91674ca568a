//! # Matcher Engine
//!
//! ```text
//! check()
//!   ├─ for each active rule (id order)
//!   │     ├─ RuleContext with resolved severity/params
//!   │     ├─ rule.check(ctx)         - throws -> rule-fault, output dropped
//!   │     └─ collect violations
//!   ├─ drop suppressed violations
//!   └─ sort (start, rule id, end, message)
//! ```

#include "engine/matcher.hpp"

#include "engine/suppression.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <tuple>

namespace conform::engine {

auto tool_severity_name(ToolSeverity severity) -> std::string_view {
    return severity == ToolSeverity::Error ? "tool-error" : "tool-warning";
}

auto violation_less(const rules::Violation& a, const rules::Violation& b) -> bool {
    return std::tie(a.span.start, a.rule_id, a.span.end, a.message) <
           std::tie(b.span.start, b.rule_id, b.span.end, b.message);
}

auto check(const model::SourceModel& model, const registry::RuleRegistry& registry,
           const CheckOptions& options) -> CheckResult {
    CheckResult result;

    for (const auto& active : registry.active()) {
        rules::RuleContext ctx(model, active.rule->info, active.severity, active.params,
                               registry.options());
        try {
            active.rule->check(ctx);
        } catch (const std::exception& e) {
            CONFORM_LOG_WARN("engine", "rule " << active.id() << " failed on " << model.path()
                                               << ": " << e.what());
            result.faults.push_back(ToolDiagnostic{
                .id = diag::RULE_FAULT,
                .severity = ToolSeverity::Error,
                .message = "rule '" + active.id() + "' failed: " + e.what(),
                .loc = SourceLocation{},
                .rule_id = active.id(),
            });
            continue;
        }

        auto found = ctx.take_violations();
        CONFORM_LOG_TRACE("engine", active.id() << ": " << found.size() << " violation(s)");
        result.violations.insert(result.violations.end(), std::make_move_iterator(found.begin()),
                                 std::make_move_iterator(found.end()));
    }

    if (options.apply_suppressions && !result.violations.empty()) {
        auto suppressions = Suppressions::scan(model);
        if (!suppressions.empty()) {
            auto removed = std::remove_if(
                result.violations.begin(), result.violations.end(),
                [&](const rules::Violation& v) {
                    return suppressions.is_suppressed(v.rule_id, v.loc.line);
                });
            result.suppressed = static_cast<size_t>(result.violations.end() - removed);
            result.violations.erase(removed, result.violations.end());
        }
    }

    std::sort(result.violations.begin(), result.violations.end(), violation_less);

    CONFORM_LOG_DEBUG("engine", model.path() << " rev " << model.revision() << ": "
                                             << result.violations.size() << " violation(s), "
                                             << result.suppressed << " suppressed");
    return result;
}

} // namespace conform::engine
