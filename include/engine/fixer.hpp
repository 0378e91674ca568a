//! # Fix Resolution & Applier
//!
//! Turns the fixes of one check pass into one rewrite of the text, then
//! re-checks until nothing more can be fixed.
//!
//! ## Resolution
//!
//! ```text
//! violations with a fix
//!   → flatten to edits tagged with rule id
//!   → sort by (start, rule id, end)
//!   → accept a fix iff none of its edits overlaps an accepted edit
//! ```
//!
//! A fix is taken whole or not at all, so a violation is either fixed or
//! left for the next pass. The earlier rule id wins a conflict at the same
//! offset; the loser is re-evaluated against the rewritten text.
//!
//! ## Fix Loop
//!
//! `fix_until_stable()` repeats check → resolve → apply for at most
//! `max_iterations` passes. It stops early when a pass accepts nothing.
//! A rewrite that no longer parses is discarded (`fix-broke-syntax`); a
//! loop that runs out of passes with fixes still pending reports
//! `fix-not-converged`.

#ifndef CONFORM_ENGINE_FIXER_HPP
#define CONFORM_ENGINE_FIXER_HPP

#include "engine/diagnostic.hpp"
#include "engine/matcher.hpp"
#include "lexer/frontend.hpp"
#include "model/source_model.hpp"
#include "registry/registry.hpp"
#include "rules/rule.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace conform::engine {

// ============================================================================
// Resolution
// ============================================================================

struct TaggedEdit {
    rules::Edit edit;
    std::string rule_id;
    size_t violation = 0; ///< Index into the resolved violation list.
};

struct Resolution {
    /// Accepted edits in application order: by start, insertions first.
    std::vector<TaggedEdit> accepted;
    /// Violations whose whole fix was accepted.
    std::vector<size_t> applied;
    /// Violations with a fix that conflicted with an accepted one.
    std::vector<size_t> deferred;
};

[[nodiscard]] auto resolve(const std::vector<rules::Violation>& violations) -> Resolution;

/// Applies non-overlapping edits to `text` in one pass. The edits may come
/// in any order. Throws `std::invalid_argument` for overlapping or
/// out-of-range edits.
[[nodiscard]] auto apply_edits(std::string_view text, std::vector<rules::Edit> edits)
    -> std::string;

// ============================================================================
// Fix Loop
// ============================================================================

struct FixOptions {
    int64_t max_iterations = 10;
    CheckOptions check;
};

struct FixOutcome {
    model::SourceModel model;              ///< Last revision that parsed.
    std::vector<rules::Violation> remaining; ///< Violations of `model`.
    std::vector<rules::Violation> fixed;   ///< Pass by pass, as reported before the fix.
    std::vector<ToolDiagnostic> diagnostics;
    size_t applied_edits = 0;
    int64_t passes = 0; ///< Passes whose rewrite was kept.
    bool converged = true;

    [[nodiscard]] auto changed() const -> bool {
        return passes > 0;
    }
};

[[nodiscard]] auto fix_until_stable(model::SourceModel model,
                                    const registry::RuleRegistry& registry,
                                    const lexer::Frontend& frontend, const FixOptions& options)
    -> FixOutcome;

} // namespace conform::engine

#endif // CONFORM_ENGINE_FIXER_HPP
