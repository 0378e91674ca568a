#include "engine/fixer.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <tuple>

namespace conform::engine {

// ============================================================================
// Resolution
// ============================================================================

namespace {

struct Candidate {
    const rules::Edit* edit;
    const std::string* rule_id;
    size_t violation;
};

auto application_less(const rules::Edit& a, const rules::Edit& b) -> bool {
    return std::tie(a.span.start, a.span.end) < std::tie(b.span.start, b.span.end);
}

} // namespace

auto resolve(const std::vector<rules::Violation>& violations) -> Resolution {
    std::vector<Candidate> candidates;
    for (size_t i = 0; i < violations.size(); ++i) {
        if (!violations[i].has_fix()) {
            continue;
        }
        for (const auto& edit : violations[i].fix->edits) {
            candidates.push_back(Candidate{&edit, &violations[i].rule_id, i});
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) {
                         return std::tie(a.edit->span.start, *a.rule_id, a.edit->span.end) <
                                std::tie(b.edit->span.start, *b.rule_id, b.edit->span.end);
                     });

    Resolution resolution;
    std::vector<bool> decided(violations.size(), false);

    for (const auto& candidate : candidates) {
        if (decided[candidate.violation]) {
            continue;
        }
        decided[candidate.violation] = true;

        // The whole fix is decided at its earliest edit.
        const auto& fix = *violations[candidate.violation].fix;
        bool conflict = std::any_of(fix.edits.begin(), fix.edits.end(), [&](const auto& edit) {
            return std::any_of(resolution.accepted.begin(), resolution.accepted.end(),
                               [&](const TaggedEdit& taken) {
                                   return rules::edits_overlap(taken.edit, edit);
                               });
        });

        if (conflict) {
            CONFORM_LOG_TRACE("fix", "deferring " << *candidate.rule_id << " at "
                                                  << candidate.edit->span.start);
            resolution.deferred.push_back(candidate.violation);
            continue;
        }
        for (const auto& edit : fix.edits) {
            resolution.accepted.push_back(TaggedEdit{edit, *candidate.rule_id, candidate.violation});
        }
        resolution.applied.push_back(candidate.violation);
    }

    std::stable_sort(resolution.accepted.begin(), resolution.accepted.end(),
                     [](const TaggedEdit& a, const TaggedEdit& b) {
                         return application_less(a.edit, b.edit);
                     });
    std::sort(resolution.applied.begin(), resolution.applied.end());
    std::sort(resolution.deferred.begin(), resolution.deferred.end());
    return resolution;
}

auto apply_edits(std::string_view text, std::vector<rules::Edit> edits) -> std::string {
    std::stable_sort(edits.begin(), edits.end(), application_less);

    std::string out;
    out.reserve(text.size());
    size_t cursor = 0;
    for (size_t i = 0; i < edits.size(); ++i) {
        const auto& edit = edits[i];
        if (edit.span.start > edit.span.end || edit.span.end > text.size()) {
            throw std::invalid_argument("edit [" + std::to_string(edit.span.start) + ", " +
                                        std::to_string(edit.span.end) +
                                        ") is outside the text");
        }
        if (i > 0 && rules::edits_overlap(edits[i - 1], edit)) {
            throw std::invalid_argument("overlapping edits at offset " +
                                        std::to_string(edit.span.start));
        }
        out.append(text.substr(cursor, edit.span.start - cursor));
        out.append(edit.replacement);
        cursor = edit.span.end;
    }
    out.append(text.substr(cursor));
    return out;
}

// ============================================================================
// Fix Loop
// ============================================================================

namespace {

auto has_pending_fix(const std::vector<rules::Violation>& violations) -> bool {
    return std::any_of(violations.begin(), violations.end(),
                       [](const rules::Violation& v) { return v.has_fix(); });
}

auto rule_list(const Resolution& resolution) -> std::string {
    std::set<std::string> ids;
    for (const auto& tagged : resolution.accepted) {
        ids.insert(tagged.rule_id);
    }
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) {
            out += ", ";
        }
        out += id;
    }
    return out;
}

} // namespace

auto fix_until_stable(model::SourceModel model, const registry::RuleRegistry& registry,
                      const lexer::Frontend& frontend, const FixOptions& options) -> FixOutcome {
    std::vector<rules::Violation> fixed;
    std::vector<rules::Violation> remaining;
    std::vector<ToolDiagnostic> diagnostics;
    std::set<std::string> faulted;
    size_t applied_edits = 0;
    int64_t passes = 0;
    bool settled = false;

    // A broken rule would fault on every pass; report it once per file.
    auto collect_faults = [&](std::vector<ToolDiagnostic>& faults) {
        for (auto& fault : faults) {
            if (faulted.insert(fault.rule_id).second) {
                diagnostics.push_back(std::move(fault));
            }
        }
    };

    for (int64_t pass = 0; pass < options.max_iterations; ++pass) {
        CheckResult result = check(model, registry, options.check);
        collect_faults(result.faults);

        Resolution resolution = resolve(result.violations);
        if (resolution.accepted.empty()) {
            remaining = std::move(result.violations);
            settled = true;
            break;
        }

        std::vector<rules::Edit> edits;
        edits.reserve(resolution.accepted.size());
        for (const auto& tagged : resolution.accepted) {
            edits.push_back(tagged.edit);
        }
        std::string rewritten = apply_edits(model.text(), std::move(edits));
        if (rewritten == model.text()) {
            CONFORM_LOG_DEBUG("fix", model.path() << ": pass " << pass + 1
                                                  << " changed nothing, stopping");
            remaining = std::move(result.violations);
            settled = true;
            break;
        }

        auto next = model.with_text(std::move(rewritten), frontend);
        if (is_err(next)) {
            const auto& failure = unwrap_err(next);
            CONFORM_LOG_WARN("fix", model.path() << ": fixes from " << rule_list(resolution)
                                                 << " broke the file: " << failure.message);
            diagnostics.push_back(ToolDiagnostic{
                .id = diag::FIX_BROKE_SYNTAX,
                .severity = ToolSeverity::Error,
                .message = "fixes from " + rule_list(resolution) +
                           " produced text that does not parse (" + failure.message +
                           "); the pass was discarded",
                .loc = model.location(resolution.accepted.front().edit.span.start),
                .rule_id = "",
            });
            remaining = std::move(result.violations);
            settled = true;
            break;
        }

        for (size_t index : resolution.applied) {
            fixed.push_back(result.violations[index]);
        }
        applied_edits += resolution.accepted.size();
        passes++;
        CONFORM_LOG_DEBUG("fix", model.path() << ": pass " << passes << " fixed "
                                              << resolution.applied.size() << ", deferred "
                                              << resolution.deferred.size());
        model = std::move(unwrap(next));
    }

    bool converged = true;
    if (!settled) {
        CheckResult result = check(model, registry, options.check);
        collect_faults(result.faults);
        remaining = std::move(result.violations);
        if (has_pending_fix(remaining)) {
            converged = false;
            CONFORM_LOG_WARN("fix", model.path() << ": not stable after "
                                                 << options.max_iterations << " passes");
            diagnostics.push_back(ToolDiagnostic{
                .id = diag::FIX_NOT_CONVERGED,
                .severity = ToolSeverity::Warning,
                .message = "fixes did not converge after " +
                           std::to_string(options.max_iterations) + " passes",
                .loc = SourceLocation{},
                .rule_id = "",
            });
        }
    }

    return FixOutcome{
        .model = std::move(model),
        .remaining = std::move(remaining),
        .fixed = std::move(fixed),
        .diagnostics = std::move(diagnostics),
        .applied_edits = applied_edits,
        .passes = passes,
        .converged = converged,
    };
}

} // namespace conform::engine
