//! # Fix Resolution & Applier Tests
//!
//! Conflict resolution between fixes, single-pass application and the
//! fix-until-stable loop with its failure modes.

#include "engine/fixer.hpp"

#include "../test_helpers.hpp"

#include <gtest/gtest.h>
#include <set>
#include <stdexcept>

using namespace conform;
using namespace conform::engine;
using conform::test_support::build_model;
using conform::test_support::frontend;
using conform::test_support::registry_with;

namespace {

auto make_rule(std::string id, rules::CheckFn check) -> rules::Rule {
    rules::Rule rule;
    rule.info.id = std::move(id);
    rule.info.title = "test rule";
    rule.info.severity = rules::Severity::Warning;
    rule.info.fixable = true;
    rule.check = std::move(check);
    return rule;
}

auto load(std::vector<rules::Rule> rules) -> registry::RuleRegistry {
    auto loaded = registry::RuleRegistry::load(std::move(rules), config::Config{});
    if (is_err(loaded)) {
        throw std::runtime_error(unwrap_err(loaded).to_string());
    }
    return std::move(unwrap(loaded));
}

auto violation(std::string rule_id, rules::Fix fix) -> rules::Violation {
    rules::Violation v;
    v.rule_id = std::move(rule_id);
    v.span = fix.edits.front().span;
    v.message = "test";
    v.fix = std::move(fix);
    return v;
}

auto count_diagnostics(const FixOutcome& outcome, std::string_view id) -> size_t {
    size_t count = 0;
    for (const auto& d : outcome.diagnostics) {
        if (d.id == id) {
            count++;
        }
    }
    return count;
}

} // namespace

// ============================================================================
// Resolution
// ============================================================================

TEST(ResolveTest, DisjointFixesAreAllAccepted) {
    std::vector<rules::Violation> violations = {
        violation("a-rule", rules::Fix::replace(Span{0, 2}, "x")),
        violation("b-rule", rules::Fix::insert(5, " ")),
    };
    auto resolution = resolve(violations);

    ASSERT_EQ(resolution.accepted.size(), 2u);
    EXPECT_EQ(resolution.applied, (std::vector<size_t>{0, 1}));
    EXPECT_TRUE(resolution.deferred.empty());
}

TEST(ResolveTest, EarlierRuleIdWinsAConflict) {
    std::vector<rules::Violation> violations = {
        violation("zz-rule", rules::Fix::replace(Span{2, 4}, "y")),
        violation("aa-rule", rules::Fix::replace(Span{2, 5}, "x")),
    };
    auto resolution = resolve(violations);

    ASSERT_EQ(resolution.accepted.size(), 1u);
    EXPECT_EQ(resolution.accepted[0].rule_id, "aa-rule");
    EXPECT_EQ(resolution.applied, (std::vector<size_t>{1}));
    EXPECT_EQ(resolution.deferred, (std::vector<size_t>{0}));
}

TEST(ResolveTest, FixIsTakenWholeOrNotAtAll) {
    rules::Fix two_edits;
    two_edits.edits = {rules::Edit{Span{0, 1}, "a"}, rules::Edit{Span{6, 7}, "b"}};
    std::vector<rules::Violation> violations = {
        violation("a-rule", rules::Fix::replace(Span{5, 8}, "z")),
        violation("b-rule", std::move(two_edits)),
    };
    auto resolution = resolve(violations);

    // b-rule starts first, so its fix is accepted and a-rule's conflicts.
    ASSERT_EQ(resolution.accepted.size(), 2u);
    EXPECT_EQ(resolution.accepted[0].rule_id, "b-rule");
    EXPECT_EQ(resolution.accepted[1].rule_id, "b-rule");
    EXPECT_EQ(resolution.deferred, (std::vector<size_t>{0}));
}

TEST(ResolveTest, ViolationsWithoutFixAreIgnored) {
    rules::Violation plain;
    plain.rule_id = "plain";
    std::vector<rules::Violation> violations = {plain};
    auto resolution = resolve(violations);

    EXPECT_TRUE(resolution.accepted.empty());
    EXPECT_TRUE(resolution.applied.empty());
    EXPECT_TRUE(resolution.deferred.empty());
}

TEST(ResolveTest, InsertionsAtTheSameOffsetConflict) {
    std::vector<rules::Violation> violations = {
        violation("a-rule", rules::Fix::insert(3, "(")),
        violation("b-rule", rules::Fix::insert(3, ")")),
    };
    auto resolution = resolve(violations);

    ASSERT_EQ(resolution.accepted.size(), 1u);
    EXPECT_EQ(resolution.accepted[0].edit.replacement, "(");
    EXPECT_EQ(resolution.deferred, (std::vector<size_t>{1}));
}

// ============================================================================
// Application
// ============================================================================

TEST(ApplyEditsTest, AppliesInAnyOrder) {
    std::vector<rules::Edit> edits = {
        rules::Edit{Span{6, 7}, " 2"},
        rules::Edit{Span{0, 3}, "var"},
        rules::Edit{Span{5, 5}, " "},
    };
    EXPECT_EQ(apply_edits("let x=1", std::move(edits)), "var x = 2");
}

TEST(ApplyEditsTest, NoEditsKeepsText) {
    EXPECT_EQ(apply_edits("let x = 1\n", {}), "let x = 1\n");
}

TEST(ApplyEditsTest, EditAtEndOfText) {
    EXPECT_EQ(apply_edits("x", {rules::Edit{Span{1, 1}, "\n"}}), "x\n");
}

TEST(ApplyEditsTest, OverlapThrows) {
    std::vector<rules::Edit> edits = {
        rules::Edit{Span{0, 3}, "a"},
        rules::Edit{Span{2, 4}, "b"},
    };
    EXPECT_THROW((void)apply_edits("abcdef", std::move(edits)), std::invalid_argument);
}

TEST(ApplyEditsTest, OutOfRangeThrows) {
    EXPECT_THROW((void)apply_edits("abc", {rules::Edit{Span{2, 9}, ""}}), std::invalid_argument);
}

// ============================================================================
// Fix Loop
// ============================================================================

TEST(FixLoopTest, DeferredFixIsAppliedOnTheNextPass) {
    auto registry = registry_with({"operator-spacing", "shorthand-optional-binding"});
    auto outcome = fix_until_stable(build_model("if let x=x {\n}\n"), registry, frontend(),
                                    FixOptions{});

    EXPECT_EQ(outcome.model.text(), "if let x {\n}\n");
    EXPECT_EQ(outcome.passes, 2);
    EXPECT_TRUE(outcome.converged);
    EXPECT_TRUE(outcome.remaining.empty());
    ASSERT_EQ(outcome.fixed.size(), 2u);
    EXPECT_EQ(outcome.fixed[0].rule_id, "operator-spacing");
    EXPECT_EQ(outcome.fixed[1].rule_id, "shorthand-optional-binding");
}

TEST(FixLoopTest, CleanTextTakesNoPass) {
    auto registry = registry_with({"operator-spacing"});
    auto outcome =
        fix_until_stable(build_model("let x = 1\n"), registry, frontend(), FixOptions{});

    EXPECT_EQ(outcome.passes, 0);
    EXPECT_FALSE(outcome.changed());
    EXPECT_TRUE(outcome.diagnostics.empty());
}

TEST(FixLoopTest, FullRuleSetReachesAFixedPoint) {
    auto loaded = registry::RuleRegistry::load(rules::builtin_rules(), config::Config{});
    ASSERT_TRUE(is_ok(loaded));
    const auto& registry = unwrap(loaded);

    std::string input = "import UIKit\n"
                        "import Foundation\n"
                        "func doWork(a:Int,b:Int)->Int{\n"
                        "\tlet x=a+b;\n"
                        "\treturn x\n"
                        "}\n";
    auto first = fix_until_stable(build_model(input), registry, frontend(), FixOptions{});
    EXPECT_EQ(first.model.text(), "import Foundation\n"
                                  "import UIKit\n"
                                  "func doWork(a: Int, b: Int) -> Int {\n"
                                  "    let x = a + b\n"
                                  "    return x\n"
                                  "}\n");
    EXPECT_TRUE(first.converged);
    EXPECT_TRUE(first.diagnostics.empty());

    // Settles in no more passes than there are distinct rules that fixed something.
    std::set<std::string> fixed_rules;
    for (const auto& v : first.fixed) {
        fixed_rules.insert(v.rule_id);
    }
    EXPECT_GE(first.passes, 1);
    EXPECT_LE(first.passes, static_cast<int64_t>(fixed_rules.size()));

    auto second = fix_until_stable(build_model(std::string(first.model.text())), registry,
                                   frontend(), FixOptions{});
    EXPECT_EQ(second.passes, 0);
    EXPECT_EQ(second.model.text(), first.model.text());
}

TEST(FixLoopTest, NonConvergenceIsReported) {
    std::vector<rules::Rule> rules;
    rules.push_back(make_rule("grower", [](rules::RuleContext& ctx) {
        ctx.report(Span{0, 0}, "always wants a newline", rules::Fix::insert(0, "\n"));
    }));
    auto registry = load(std::move(rules));

    FixOptions options;
    options.max_iterations = 3;
    auto outcome = fix_until_stable(build_model("x\n"), registry, frontend(), options);

    EXPECT_FALSE(outcome.converged);
    EXPECT_EQ(outcome.passes, 3);
    EXPECT_EQ(outcome.fixed.size(), 3u);
    EXPECT_EQ(outcome.model.text(), "\n\n\nx\n");
    ASSERT_EQ(outcome.diagnostics.size(), 1u);
    EXPECT_EQ(outcome.diagnostics[0].id, diag::FIX_NOT_CONVERGED);
    EXPECT_EQ(outcome.diagnostics[0].severity, ToolSeverity::Warning);
    EXPECT_EQ(outcome.diagnostics[0].message, "fixes did not converge after 3 passes");
}

TEST(FixLoopTest, PassThatBreaksSyntaxIsDiscarded) {
    std::vector<rules::Rule> rules;
    rules.push_back(make_rule("breaker", [](rules::RuleContext& ctx) {
        ctx.report(Span{0, 1}, "opens a paren", rules::Fix::insert(0, "("));
    }));
    auto registry = load(std::move(rules));

    auto outcome = fix_until_stable(build_model("x\n"), registry, frontend(), FixOptions{});

    EXPECT_EQ(outcome.model.text(), "x\n");
    EXPECT_EQ(outcome.passes, 0);
    EXPECT_TRUE(outcome.fixed.empty());
    ASSERT_EQ(outcome.remaining.size(), 1u);
    ASSERT_EQ(outcome.diagnostics.size(), 1u);
    const auto& d = outcome.diagnostics[0];
    EXPECT_EQ(d.id, diag::FIX_BROKE_SYNTAX);
    EXPECT_TRUE(d.is_error());
    EXPECT_EQ(d.message,
              "fixes from breaker produced text that does not parse (unclosed '('); "
              "the pass was discarded");
    EXPECT_EQ(d.loc.line, 1u);
    EXPECT_EQ(d.loc.column, 1u);
}

TEST(FixLoopTest, RewriteThatChangesNothingStops) {
    std::vector<rules::Rule> rules;
    rules.push_back(make_rule("same", [](rules::RuleContext& ctx) {
        ctx.report(Span{0, 1}, "rewrites itself", rules::Fix::replace(Span{0, 1}, "x"));
    }));
    auto registry = load(std::move(rules));

    auto outcome = fix_until_stable(build_model("x\n"), registry, frontend(), FixOptions{});

    EXPECT_EQ(outcome.passes, 0);
    EXPECT_TRUE(outcome.converged);
    EXPECT_EQ(outcome.remaining.size(), 1u);
    EXPECT_TRUE(outcome.diagnostics.empty());
}

TEST(FixLoopTest, RuleFaultIsReportedOncePerFile) {
    std::vector<rules::Rule> rules;
    rules.push_back(make_rule("grower", [](rules::RuleContext& ctx) {
        ctx.report(Span{0, 0}, "always wants a newline", rules::Fix::insert(0, "\n"));
    }));
    rules.push_back(make_rule("thrower", [](rules::RuleContext&) {
        throw rules::RuleError("boom");
    }));
    auto registry = load(std::move(rules));

    FixOptions options;
    options.max_iterations = 4;
    auto outcome = fix_until_stable(build_model("x\n"), registry, frontend(), options);

    EXPECT_EQ(outcome.passes, 4);
    EXPECT_EQ(count_diagnostics(outcome, diag::RULE_FAULT), 1u);
    EXPECT_EQ(count_diagnostics(outcome, diag::FIX_NOT_CONVERGED), 1u);
}

TEST(FixLoopTest, MaxIterationsZeroOnlyChecks) {
    auto registry = registry_with({"operator-spacing"});
    FixOptions options;
    options.max_iterations = 0;
    auto outcome = fix_until_stable(build_model("let x=1\n"), registry, frontend(), options);

    EXPECT_EQ(outcome.passes, 0);
    EXPECT_EQ(outcome.model.text(), "let x=1\n");
    EXPECT_EQ(outcome.remaining.size(), 1u);
    EXPECT_FALSE(outcome.converged);
}
