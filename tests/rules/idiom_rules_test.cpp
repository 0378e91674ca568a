//! # Idiom Rule Tests

#include "../test_helpers.hpp"

#include <gtest/gtest.h>

using namespace conform;
using conform::test_support::fixed_text;
using conform::test_support::violations_of;

// ============================================================================
// empty-parens-trailing-closure
// ============================================================================

TEST(EmptyParensTrailingClosureTest, DropsParentheses) {
    std::string text = "items.forEach() { print($0) }\n";
    auto violations = violations_of("empty-parens-trailing-closure", text);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].message, "empty parentheses before a trailing closure can be omitted");
    EXPECT_EQ(fixed_text({"empty-parens-trailing-closure"}, text),
              "items.forEach { print($0) }\n");
}

TEST(EmptyParensTrailingClosureTest, BodiesAreNotClosures) {
    EXPECT_TRUE(violations_of("empty-parens-trailing-closure", "func f() {}\n").empty());
    EXPECT_TRUE(violations_of("empty-parens-trailing-closure", "if check() {\n}\n").empty());
    EXPECT_TRUE(violations_of("empty-parens-trailing-closure", "run(1) { }\n").empty());
}

// ============================================================================
// force-unwrap
// ============================================================================

TEST(ForceUnwrapTest, ReportsUnwrapsAndCasts) {
    auto violations = violations_of("force-unwrap", "let a = b!\nlet c = d as! Int\n");
    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0].message, "avoid force unwrapping optionals");
    EXPECT_EQ(violations[1].message, "avoid force casts ('as!')");
    EXPECT_FALSE(violations[0].has_fix());
}

TEST(ForceUnwrapTest, NegationAndImplicitlyUnwrappedTypes) {
    EXPECT_TRUE(violations_of("force-unwrap", "if !flag {\n}\n").empty());
    EXPECT_TRUE(violations_of("force-unwrap", "var label: UILabel!\n").empty());
    EXPECT_TRUE(violations_of("force-unwrap", "let same = a != b\n").empty());
}

// ============================================================================
// shorthand-optional-binding
// ============================================================================

TEST(ShorthandOptionalBindingTest, IfLetAndGuardLet) {
    auto violations = violations_of("shorthand-optional-binding", "if let value = value {\n}\n");
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].message, "use shorthand optional binding 'let value'");
    EXPECT_EQ(fixed_text({"shorthand-optional-binding"}, "if let value = value {\n}\n"),
              "if let value {\n}\n");
    EXPECT_EQ(fixed_text({"shorthand-optional-binding"},
                         "guard var item = item, let other = other else {\n    return\n}\n"),
              "guard var item, let other else {\n    return\n}\n");
}

TEST(ShorthandOptionalBindingTest, DifferentNamesAndPlainBindings) {
    EXPECT_TRUE(violations_of("shorthand-optional-binding", "if let a = b {\n}\n").empty());
    EXPECT_TRUE(violations_of("shorthand-optional-binding", "let value = value\n").empty());
    EXPECT_TRUE(
        violations_of("shorthand-optional-binding", "if let a = a.first {\n}\n").empty());
}

TEST(ShorthandOptionalBindingTest, CasePatternsAreNotOptionalBindings) {
    std::string code = "if case let x = x {\n}\nguard case var y = y else {\n    return\n}\n";
    EXPECT_TRUE(violations_of("shorthand-optional-binding", code).empty());
    EXPECT_EQ(fixed_text({"shorthand-optional-binding"}, code), code);
    EXPECT_EQ(fixed_text({"shorthand-optional-binding"}, "if let a = a, case let b = b {\n}\n"),
              "if let a, case let b = b {\n}\n");
}
