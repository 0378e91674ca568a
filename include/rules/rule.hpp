//! # Rules
//!
//! A rule is plain data plus one check function: metadata (`RuleInfo`)
//! describing id, severity, category, fixability and parameters, and a
//! callable that inspects a `SourceModel` through a `RuleContext` and
//! reports violations, each with an optional `Fix`.
//!
//! ## Rule Contract
//!
//! - A rule only reads the model it is given; it keeps no state between
//!   files and never looks at another rule's output.
//! - Every edit of a `Fix` refers to the model revision being checked.
//! - Edits inside one `Fix` are sorted by start offset and do not overlap.
//!   Reporting a malformed fix throws `RuleError`, which the matcher turns
//!   into a `rule-fault` diagnostic.
//! - Applying a rule's fixes and re-checking must not produce the same
//!   violation again.
//!
//! ## Example
//!
//! ```cpp
//! Rule rule;
//! rule.info = RuleInfo{.id = "no-tabs", .title = "Indent with spaces", ...};
//! rule.check = [](RuleContext& ctx) {
//!     for (const auto& token : ctx.model().tokens()) { ... ctx.report(span, "...", fix); }
//! };
//! ```

#ifndef CONFORM_RULES_RULE_HPP
#define CONFORM_RULES_RULE_HPP

#include "common.hpp"
#include "model/source_model.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace conform::rules {

// ============================================================================
// Severity and Category
// ============================================================================

enum class Severity : uint8_t { Error, Warning, Info };

enum class Category : uint8_t { Naming, Spacing, Layout, Structure, Idiom };

[[nodiscard]] auto severity_name(Severity severity) -> std::string_view;
[[nodiscard]] auto parse_severity(std::string_view name) -> std::optional<Severity>;

[[nodiscard]] auto category_name(Category category) -> std::string_view;
[[nodiscard]] auto parse_category(std::string_view name) -> std::optional<Category>;

// ============================================================================
// Parameters
// ============================================================================

/// A typed rule parameter value: bool, integer, string or list of strings.
using ParamValue = std::variant<bool, int64_t, std::string, std::vector<std::string>>;

using ParamMap = std::map<std::string, ParamValue>;

/// "bool", "integer", "string" or "string list".
[[nodiscard]] auto param_type_name(const ParamValue& value) -> std::string_view;

struct ParamSpec {
    std::string name;
    ParamValue default_value;
    std::string description;
};

// ============================================================================
// Edits and Fixes
// ============================================================================

/// Replace the bytes in `span` with `replacement`. An empty span inserts.
struct Edit {
    Span span;
    std::string replacement;

    [[nodiscard]] auto operator==(const Edit& other) const -> bool = default;
};

/// True if applying both edits in one pass would be ambiguous.
///
/// Two non-empty spans overlap when they intersect; an insertion overlaps a
/// replacement it falls strictly inside; two insertions at the same offset
/// overlap. Spans that only touch do not.
[[nodiscard]] auto edits_overlap(const Edit& a, const Edit& b) -> bool;

struct Fix {
    std::vector<Edit> edits;

    [[nodiscard]] auto empty() const -> bool {
        return edits.empty();
    }

    [[nodiscard]] static auto replace(Span span, std::string text) -> Fix;
    [[nodiscard]] static auto insert(uint32_t offset, std::string text) -> Fix;
    [[nodiscard]] static auto remove(Span span) -> Fix;

    /// Returns a description of the first problem, or nullopt if the edits
    /// are sorted, non-overlapping and inside `[0, text_length]`.
    [[nodiscard]] auto validate(size_t text_length) const -> std::optional<std::string>;
};

// ============================================================================
// Violations
// ============================================================================

struct Violation {
    std::string rule_id;
    Severity severity = Severity::Warning;
    Category category = Category::Layout;
    Span span;
    SourceLocation loc;
    std::string message;
    std::optional<Fix> fix;

    [[nodiscard]] auto has_fix() const -> bool {
        return fix.has_value() && !fix->empty();
    }
};

// ============================================================================
// Rule Definition
// ============================================================================

struct RuleInfo {
    std::string id; ///< Kebab-case, unique.
    std::string title;
    Severity severity = Severity::Warning;
    Category category = Category::Layout;
    bool fixable = false;
    bool enabled_by_default = true;
    std::vector<ParamSpec> params;

    [[nodiscard]] auto find_param(std::string_view name) const -> const ParamSpec*;
};

/// Process-wide settings every rule may consult.
struct RuleOptions {
    int64_t line_length = 120;
    int64_t indent_width = 4;
};

/// Thrown by a rule (or by `RuleContext` on its behalf) to signal a bug in
/// the rule itself.
class RuleError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RuleContext;

using CheckFn = std::function<void(RuleContext&)>;

struct Rule {
    RuleInfo info;
    CheckFn check;
};

// ============================================================================
// Rule Context
// ============================================================================

/// What one rule sees while checking one model revision.
class RuleContext {
public:
    RuleContext(const model::SourceModel& model, const RuleInfo& info, Severity severity,
                const ParamMap& params, const RuleOptions& options);

    [[nodiscard]] auto model() const -> const model::SourceModel& {
        return model_;
    }

    [[nodiscard]] auto options() const -> const RuleOptions& {
        return options_;
    }

    [[nodiscard]] auto info() const -> const RuleInfo& {
        return info_;
    }

    /// Records a violation. Throws `RuleError` if `fix` is malformed or the
    /// span lies outside the text.
    void report(Span span, std::string message, std::optional<Fix> fix = std::nullopt);

    // Parameter access; throws `RuleError` for an undeclared or mistyped name.
    [[nodiscard]] auto param_bool(std::string_view name) const -> bool;
    [[nodiscard]] auto param_int(std::string_view name) const -> int64_t;
    [[nodiscard]] auto param_string(std::string_view name) const -> const std::string&;
    [[nodiscard]] auto param_list(std::string_view name) const
        -> const std::vector<std::string>&;

    [[nodiscard]] auto take_violations() -> std::vector<Violation> {
        return std::move(violations_);
    }

private:
    const model::SourceModel& model_;
    const RuleInfo& info_;
    Severity severity_;
    const ParamMap& params_;
    const RuleOptions& options_;
    std::vector<Violation> violations_;

    [[nodiscard]] auto param(std::string_view name) const -> const ParamValue&;
};

} // namespace conform::rules

#endif // CONFORM_RULES_RULE_HPP
