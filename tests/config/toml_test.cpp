//! # TOML Reader Tests

#include "config/toml_reader.hpp"

#include <gtest/gtest.h>

using namespace conform;
using namespace conform::config;

namespace {

auto parse_ok(std::string_view text) -> TomlDocument {
    auto result = parse_toml(text);
    if (is_err(result)) {
        ADD_FAILURE() << "line " << unwrap_err(result).line << ": " << unwrap_err(result).message;
        return TomlDocument{};
    }
    return std::move(unwrap(result));
}

auto parse_error(std::string_view text) -> TomlError {
    auto result = parse_toml(text);
    if (is_ok(result)) {
        ADD_FAILURE() << "expected an error";
        return TomlError{};
    }
    return unwrap_err(result);
}

} // namespace

TEST(TomlTest, TablesAndScalarValues) {
    auto doc = parse_ok("# settings\n"
                        "[conform]\n"
                        "line_length = 1_000   # wide\n"
                        "fix = true\n"
                        "name = \"a \\\"b\\\" # not a comment\"\n");
    ASSERT_EQ(doc.tables.size(), 2u);
    EXPECT_TRUE(doc.tables[0].name.empty());

    const auto& table = doc.tables[1];
    EXPECT_EQ(table.name, "conform");
    EXPECT_EQ(table.line, 2u);
    ASSERT_EQ(table.entries.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(table.entries[0].value), 1000);
    EXPECT_EQ(table.entries[0].line, 3u);
    EXPECT_TRUE(std::get<bool>(table.entries[1].value));
    EXPECT_EQ(std::get<std::string>(table.entries[2].value), "a \"b\" # not a comment");
}

TEST(TomlTest, DottedTableNamesWithDashes) {
    auto doc = parse_ok("[rules.line-length]\nenabled = false\n");
    ASSERT_EQ(doc.tables.size(), 2u);
    EXPECT_EQ(doc.tables[1].name, "rules.line-length");
}

TEST(TomlTest, MultiLineStringArray) {
    auto doc = parse_ok("[conform]\n"
                        "exclude = [\"Pods/\",  # vendored\n"
                        "           \"Generated\"]\n"
                        "jobs = 2\n");
    const auto& entries = doc.tables[1].entries;
    ASSERT_EQ(entries.size(), 2u);
    auto list = std::get<std::vector<std::string>>(entries[0].value);
    EXPECT_EQ(list, (std::vector<std::string>{"Pods/", "Generated"}));
    EXPECT_EQ(entries[1].line, 4u);
}

TEST(TomlTest, EmptyArray) {
    auto doc = parse_ok("[a]\nlist = []\n");
    EXPECT_TRUE(std::get<std::vector<std::string>>(doc.tables[1].entries[0].value).empty());
}

TEST(TomlTest, RejectsUnsupportedSyntax) {
    EXPECT_EQ(parse_error("[a]\nx = { y = 1 }\n").message, "inline tables are not supported");
    EXPECT_EQ(parse_error("[[a]]\n").message, "arrays of tables are not supported");
    EXPECT_EQ(parse_error("[a]\nx = [1, 2]\n").message, "arrays may only contain strings");
    EXPECT_EQ(parse_error("[a]\nx = 1.5\n").message, "unsupported value: 1.5");
    EXPECT_EQ(parse_error("[a]\nx.y = 1\n").message, "invalid key 'x.y'");
}

TEST(TomlTest, ErrorsCarryLineNumbers) {
    auto error = parse_error("[a]\nx = 1\n\nbroken line\n");
    EXPECT_EQ(error.message, "expected 'key = value'");
    EXPECT_EQ(error.line, 4u);

    EXPECT_EQ(parse_error("[a]\nx = \"open\n").message, "unterminated string");
    EXPECT_EQ(parse_error("[a]\nx = [\"a\"\n").message, "unterminated array");
}

TEST(TomlTest, DuplicatesAreErrors) {
    EXPECT_EQ(parse_error("[a]\n[a]\n").message, "duplicate table [a]");

    auto error = parse_error("[a]\nx = 1\nx = 2\n");
    EXPECT_EQ(error.message, "duplicate key 'x'");
    EXPECT_EQ(error.line, 3u);

    // The same key in different tables is fine.
    parse_ok("[a]\nx = 1\n[b]\nx = 2\n");
}
