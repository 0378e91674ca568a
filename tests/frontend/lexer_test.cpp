//! # Lexer Tests
//!
//! Token kinds, spans and trivia for Swift-style sources, plus the
//! byte-for-byte reconstruction property.

#include "lexer/lexer.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace conform;
using namespace conform::lexer;

class LexerTest : public ::testing::Test {
protected:
    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto tokens = lexer.tokenize();
        errors_ = lexer.errors();
        return tokens;
    }

    /// Kinds of the non-trivia tokens, without the final Eof.
    auto kinds(const std::string& code) -> std::vector<TokenKind> {
        std::vector<TokenKind> out;
        for (const auto& token : lex(code)) {
            if (!token.is_trivia() && !token.is_eof()) {
                out.push_back(token.kind);
            }
        }
        return out;
    }

    auto lexemes(const std::string& code) -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& token : lex(code)) {
            if (!token.is_trivia() && !token.is_eof()) {
                out.emplace_back(token.lexeme);
            }
        }
        return out;
    }

    std::unique_ptr<Source> source_;
    std::vector<LexerError> errors_;
};

// ============================================================================
// Words
// ============================================================================

TEST_F(LexerTest, KeywordsAndIdentifiers) {
    auto result = kinds("let value = other");
    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[0], TokenKind::Keyword);
    EXPECT_EQ(result[1], TokenKind::Identifier);
    EXPECT_EQ(result[2], TokenKind::Operator);
    EXPECT_EQ(result[3], TokenKind::Identifier);
}

TEST_F(LexerTest, ContextualWordsAreIdentifiers) {
    auto result = kinds("actor Worker");
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], TokenKind::Identifier);
}

TEST_F(LexerTest, EscapedIdentifier) {
    auto tokens = lexemes("let `class` = 1");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1], "`class`");
    EXPECT_EQ(kinds("`class`")[0], TokenKind::Identifier);
}

TEST_F(LexerTest, AttributesAndDirectives) {
    auto result = kinds("@objc #if DEBUG");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], TokenKind::Attribute);
    EXPECT_EQ(result[1], TokenKind::PoundDirective);
    EXPECT_EQ(result[2], TokenKind::Identifier);
}

// ============================================================================
// Numbers
// ============================================================================

TEST_F(LexerTest, IntegerForms) {
    for (const char* code : {"42", "0xFF", "0b1010", "0o17", "1_000_000"}) {
        auto result = kinds(code);
        ASSERT_EQ(result.size(), 1u) << code;
        EXPECT_EQ(result[0], TokenKind::IntLiteral) << code;
    }
}

TEST_F(LexerTest, FloatForms) {
    for (const char* code : {"3.14", "1e10", "2.5e-3"}) {
        auto result = kinds(code);
        ASSERT_EQ(result.size(), 1u) << code;
        EXPECT_EQ(result[0], TokenKind::FloatLiteral) << code;
    }
}

TEST_F(LexerTest, MemberAccessOnIntegerIsNotAFloat) {
    auto result = kinds("tuple.0");
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[1], TokenKind::Dot);
    EXPECT_EQ(result[2], TokenKind::IntLiteral);
}

// ============================================================================
// Strings
// ============================================================================

TEST_F(LexerTest, StringWithInterpolation) {
    auto tokens = lexemes(R"(let s = "a \(b + "c") d")");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[3], R"("a \(b + "c") d")");
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, MultilineString) {
    std::string code = "let s = \"\"\"\n  line one\n  line two\n  \"\"\"\n";
    auto result = kinds(code);
    ASSERT_EQ(result.size(), 4u);
    EXPECT_EQ(result[3], TokenKind::StringLiteral);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, RawString) {
    auto tokens = lexemes(R"(let r = #"no \(interp) "quotes""#)");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[3], R"(#"no \(interp) "quotes""#)");
}

TEST_F(LexerTest, UnterminatedStringIsAnError) {
    lex("let s = \"open\nlet t = 1\n");
    ASSERT_FALSE(errors_.empty());
    EXPECT_EQ(errors_[0].message, "unterminated string literal");
    EXPECT_EQ(errors_[0].offset, 8u);
}

// ============================================================================
// Operators and Punctuation
// ============================================================================

TEST_F(LexerTest, MaximalMunchOperators) {
    auto tokens = lexemes("a ?? b === c ... d ..< e");
    std::vector<std::string> expected = {"a", "??", "b", "===", "c", "...", "d", "..<", "e"};
    EXPECT_EQ(tokens, expected);
}

TEST_F(LexerTest, OperatorStopsAtComment) {
    auto tokens = lex("a+//note\n");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].lexeme, "+");
    EXPECT_EQ(tokens[2].kind, TokenKind::LineComment);
}

TEST_F(LexerTest, Punctuation) {
    auto result = kinds("f(a: [1], b) { x; }");
    std::vector<TokenKind> expected = {
        TokenKind::Identifier, TokenKind::LParen,   TokenKind::Identifier, TokenKind::Colon,
        TokenKind::LBracket,   TokenKind::IntLiteral, TokenKind::RBracket, TokenKind::Comma,
        TokenKind::Identifier, TokenKind::RParen,   TokenKind::LBrace,     TokenKind::Identifier,
        TokenKind::Semicolon,  TokenKind::RBrace,
    };
    EXPECT_EQ(result, expected);
}

TEST_F(LexerTest, InvalidCharacterIsReported) {
    auto tokens = lex("let a = 1 \x01");
    ASSERT_FALSE(errors_.empty());
    EXPECT_EQ(errors_[0].offset, 10u);
    EXPECT_TRUE(tokens.back().is_eof());
}

// ============================================================================
// Trivia
// ============================================================================

TEST_F(LexerTest, NestedBlockComment) {
    auto tokens = lex("/* a /* b */ c */x");
    ASSERT_GE(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::BlockComment);
    EXPECT_EQ(tokens[0].lexeme, "/* a /* b */ c */");
    EXPECT_EQ(tokens[1].lexeme, "x");
}

TEST_F(LexerTest, UnterminatedBlockCommentIsAnError) {
    lex("/* never closed");
    ASSERT_FALSE(errors_.empty());
    EXPECT_EQ(errors_[0].message, "unterminated block comment");
}

TEST_F(LexerTest, CrLfIsOneNewlineToken) {
    auto tokens = lex("a\r\nb");
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Newline);
    EXPECT_EQ(tokens[1].lexeme, "\r\n");
    EXPECT_EQ(tokens[2].loc.line, 2u);
    EXPECT_EQ(tokens[2].loc.column, 1u);
}

TEST_F(LexerTest, TokensReconstructTheInput) {
    std::string code = "import Foundation\n\n"
                       "struct Point {\n"
                       "\tvar x: Int = 0 // origin\n"
                       "    /* doc */ let s = \"a\\(x)b\"\r\n"
                       "}\n";
    std::string rebuilt;
    for (const auto& token : lex(code)) {
        rebuilt += token.lexeme;
    }
    EXPECT_EQ(rebuilt, code);
    EXPECT_TRUE(errors_.empty());
}

TEST_F(LexerTest, SpansAreContiguous) {
    auto tokens = lex("func f(a: Int) -> Int { a }\n");
    uint32_t expected = 0;
    for (const auto& token : tokens) {
        EXPECT_EQ(token.span.start, expected);
        expected = token.span.end;
    }
    EXPECT_TRUE(tokens.back().is_eof());
}
