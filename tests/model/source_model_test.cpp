//! # Source Model Tests

#include "../test_helpers.hpp"

#include <gtest/gtest.h>

using namespace conform;
using namespace conform::model;
using conform::test_support::build_model;
using conform::test_support::frontend;

class SourceModelTest : public ::testing::Test {
protected:
    /// Index of the first token with the given lexeme.
    static auto index_of(const SourceModel& model, std::string_view lexeme) -> size_t {
        for (size_t i = 0; i < model.token_count(); ++i) {
            if (model.token(i).lexeme == lexeme) {
                return i;
            }
        }
        ADD_FAILURE() << "no token '" << lexeme << "'";
        return 0;
    }
};

// ============================================================================
// Revisions
// ============================================================================

TEST_F(SourceModelTest, RewriteProducesNextRevision) {
    auto first = build_model("let x=5\n", "a.swift");
    EXPECT_EQ(first.revision(), 0u);

    auto second = first.with_text("let x = 5\n", frontend());
    ASSERT_TRUE(is_ok(second));
    EXPECT_EQ(unwrap(second).revision(), 1u);
    EXPECT_EQ(unwrap(second).path(), "a.swift");
    EXPECT_EQ(unwrap(second).text(), "let x = 5\n");
    EXPECT_EQ(first.text(), "let x=5\n");
}

TEST_F(SourceModelTest, RewriteThatDoesNotParseFails) {
    auto model = build_model("f()\n");
    auto next = model.with_text("f(\n", frontend());
    ASSERT_TRUE(is_err(next));
    EXPECT_EQ(unwrap_err(next).message, "unclosed '('");
}

TEST_F(SourceModelTest, BuildRejectsBrokenText) {
    auto built = SourceModel::build("bad.swift", "}", frontend());
    EXPECT_TRUE(is_err(built));
}

// ============================================================================
// Token Navigation
// ============================================================================

TEST_F(SourceModelTest, TokenAtOffset) {
    auto model = build_model("let x = 5\n");
    auto at_x = model.token_at(4);
    ASSERT_TRUE(at_x.has_value());
    EXPECT_EQ(model.token(*at_x).lexeme, "x");

    auto at_end = model.token_at(10);
    ASSERT_TRUE(at_end.has_value());
    EXPECT_TRUE(model.token(*at_end).is_eof());

    EXPECT_FALSE(model.token_at(11).has_value());
}

TEST_F(SourceModelTest, SignificantNeighboursSkipTrivia) {
    auto model = build_model("a /* c */ // d\n  b");
    size_t a = index_of(model, "a");
    size_t b = index_of(model, "b");

    EXPECT_EQ(model.next_significant(a), b);
    EXPECT_EQ(model.prev_significant(b), a);
    EXPECT_FALSE(model.prev_significant(a).has_value());
    EXPECT_FALSE(model.next_significant(b).has_value());
    EXPECT_TRUE(model.has_newline_between(a, b));
    EXPECT_TRUE(model.has_comment_between(a, b));
}

TEST_F(SourceModelTest, BracketPartnersAndParents) {
    auto model = build_model("f(a[1])");
    size_t paren = index_of(model, "(");
    size_t close_paren = index_of(model, ")");
    size_t bracket = index_of(model, "[");
    size_t one = index_of(model, "1");

    EXPECT_EQ(model.matching(paren), close_paren);
    EXPECT_EQ(model.matching(close_paren), paren);
    EXPECT_EQ(model.parent(one), bracket);
    EXPECT_EQ(model.parent(bracket), paren);
    EXPECT_FALSE(model.parent(0).has_value());
    EXPECT_FALSE(model.matching(0).has_value());
}

TEST_F(SourceModelTest, StatementIntroducerOfFunctionBody) {
    auto model = build_model("func f(a: Int) -> Int {\n    a\n}\n");
    auto owner = model.statement_introducer(index_of(model, "{"));
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(model.token(*owner).lexeme, "func");
}

TEST_F(SourceModelTest, StatementIntroducerStopsAtClosingBrace) {
    auto model = build_model("if a {\n} else {\n}\n");
    size_t second_brace = 0;
    for (size_t i = 0; i < model.token_count(); ++i) {
        if (model.token(i).is(TokenKind::LBrace)) {
            second_brace = i;
        }
    }
    auto owner = model.statement_introducer(second_brace);
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(model.token(*owner).lexeme, "else");
}

TEST_F(SourceModelTest, ClosureHasNoIntroducer) {
    auto model = build_model("items.map { $0 }\n");
    EXPECT_FALSE(model.statement_introducer(index_of(model, "{")).has_value());
}

TEST_F(SourceModelTest, InsideMultilineToken) {
    std::string text = "let s = \"\"\"\nabc\n\"\"\"\n";
    auto model = build_model(text);
    EXPECT_TRUE(model.inside_multiline_token(static_cast<uint32_t>(text.find("abc"))));
    EXPECT_FALSE(model.inside_multiline_token(0));
    EXPECT_FALSE(model.inside_multiline_token(static_cast<uint32_t>(text.find('"'))));
}

// ============================================================================
// Lines
// ============================================================================

TEST_F(SourceModelTest, LineQueries) {
    auto model = build_model("a\r\nbb\n");
    EXPECT_EQ(model.line_count(), 2u);
    EXPECT_EQ(model.line_text(1), "a");
    EXPECT_EQ(model.line_text(2), "bb");
    EXPECT_EQ(model.line_start(2), 3u);

    auto loc = model.location(4);
    EXPECT_EQ(loc.line, 2u);
    EXPECT_EQ(loc.column, 2u);
}

TEST_F(SourceModelTest, LineCountWithoutFinalNewline) {
    EXPECT_EQ(build_model("a\nb").line_count(), 2u);
    EXPECT_EQ(build_model("").line_count(), 1u);
}

// ============================================================================
// Declarations
// ============================================================================

TEST_F(SourceModelTest, DeclarationScan) {
    auto model = build_model("struct Point {\n"
                             "    let x: Int\n"
                             "    func move() {}\n"
                             "}\n"
                             "enum Dir { case north, south(Int), east = 1 }\n");
    std::vector<std::pair<DeclKind, std::string>> found;
    for (const auto& decl : model.declarations()) {
        found.emplace_back(decl.kind, std::string(model.token(decl.name).lexeme));
    }

    std::vector<std::pair<DeclKind, std::string>> expected = {
        {DeclKind::Struct, "Point"},   {DeclKind::Let, "x"},
        {DeclKind::Func, "move"},      {DeclKind::Enum, "Dir"},
        {DeclKind::EnumCase, "north"}, {DeclKind::EnumCase, "south"},
        {DeclKind::EnumCase, "east"},
    };
    EXPECT_EQ(found, expected);
}

TEST_F(SourceModelTest, SwitchCasesAreNotDeclarations) {
    auto model = build_model("switch v {\ncase .a: break\ndefault: break\n}\n");
    EXPECT_TRUE(model.declarations().empty());
}

TEST_F(SourceModelTest, DeclKindNames) {
    EXPECT_EQ(decl_kind_name(DeclKind::EnumCase), "enum case");
    EXPECT_EQ(decl_kind_name(DeclKind::Let), "constant");
    EXPECT_TRUE(is_type_declaration(DeclKind::Protocol));
    EXPECT_FALSE(is_type_declaration(DeclKind::Func));
}
