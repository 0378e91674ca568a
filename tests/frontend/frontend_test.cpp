//! # Frontend Tests
//!
//! The Swift frontend either yields the whole token stream or the first
//! syntax error with its location.

#include "lexer/frontend.hpp"

#include <gtest/gtest.h>

using namespace conform;
using namespace conform::lexer;

class FrontendTest : public ::testing::Test {
protected:
    auto parse(const std::string& code) -> Result<std::vector<Token>, ParseFailure> {
        source_ = std::make_unique<Source>(Source::from_string(code, "input.swift"));
        return frontend_.parse(*source_);
    }

    SwiftFrontend frontend_;
    std::unique_ptr<Source> source_;
};

TEST_F(FrontendTest, BalancedInputYieldsTokens) {
    auto result = parse("func f(a: [Int]) {\n    g(a)\n}\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).back().is_eof());
    EXPECT_EQ(frontend_.name(), "swift");
}

TEST_F(FrontendTest, EmptyInputIsValid) {
    auto result = parse("");
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).size(), 1u);
}

TEST_F(FrontendTest, LexerErrorIsReportedFirst) {
    auto result = parse("let s = \"abc\nf(\n");
    ASSERT_TRUE(is_err(result));
    const auto& failure = unwrap_err(result);
    EXPECT_EQ(failure.message, "unterminated string literal");
    EXPECT_EQ(failure.loc.line, 1u);
    EXPECT_EQ(failure.loc.column, 9u);
}

TEST_F(FrontendTest, UnexpectedCloser) {
    auto result = parse("let a = 1\n)\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "unexpected ')'");
    EXPECT_EQ(unwrap_err(result).loc.line, 2u);
    EXPECT_EQ(unwrap_err(result).loc.column, 1u);
}

TEST_F(FrontendTest, MismatchedCloser) {
    auto result = parse("f(a]");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "mismatched ']', expected ')' to close '(' at line 1");
    EXPECT_EQ(unwrap_err(result).loc.column, 4u);
}

TEST_F(FrontendTest, UnclosedBraceReportsTheOpener) {
    auto result = parse("func f() {\n    let x = 5\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "unclosed '{'");
    EXPECT_EQ(unwrap_err(result).loc.line, 1u);
    EXPECT_EQ(unwrap_err(result).loc.column, 10u);
}

TEST_F(FrontendTest, BracketsInsideStringsAndCommentsAreIgnored) {
    auto result = parse("let s = \"(\" // )\n/* { */\n");
    EXPECT_TRUE(is_ok(result));
}
