//! # CLI Tests
//!
//! Drives `run_check` and `run_rules` end to end against scratch
//! directories and checks output and exit codes.

#include "cli/commands.hpp"
#include "cli/discovery.hpp"
#include "json/json.hpp"

#include "../test_helpers.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace conform;
using namespace conform::cli;
using conform::test_support::TempDir;

class CliTest : public ::testing::Test {
protected:
    CliTest() : dir_("cli") {
        config_ = dir_.write("conform.toml", "[conform]\njobs = 2\n");
    }

    /// Runs `conform check --config <scratch config> args...`.
    auto check(std::vector<std::string> args) -> int {
        args.insert(args.begin(), {"--config", config_});
        out_.str("");
        err_.str("");
        return run_check(args, out_, err_);
    }

    auto rules(std::vector<std::string> args) -> int {
        args.insert(args.begin(), {"--config", config_});
        out_.str("");
        err_.str("");
        return run_rules(args, out_, err_);
    }

    TempDir dir_;
    std::string config_;
    std::ostringstream out_;
    std::ostringstream err_;
};

// ============================================================================
// check
// ============================================================================

TEST_F(CliTest, CleanFileExitsZero) {
    std::string file = dir_.write("src/a.swift", "let x = 5\n");
    EXPECT_EQ(check({file}), 0);
    EXPECT_EQ(out_.str(), "checked 1 file: 0 errors, 0 warnings, 0 infos, 0 fixed\n");
}

TEST_F(CliTest, ErrorViolationExitsOne) {
    std::string file = dir_.write("src/a.swift", "let x=5\n");
    EXPECT_EQ(check({file}), 1);
    EXPECT_NE(out_.str().find(file + ":1:6: error: operator '=' should be surrounded by single "
                                     "spaces [operator-spacing]\n"),
              std::string::npos)
        << out_.str();
    EXPECT_EQ(dir_.read("src/a.swift"), "let x=5\n");
}

TEST_F(CliTest, FixRewritesAndExitsZero) {
    std::string file = dir_.write("src/a.swift", "let x=5");
    EXPECT_EQ(check({"--fix", file}), 0);
    EXPECT_EQ(dir_.read("src/a.swift"), "let x = 5\n");
    EXPECT_NE(out_.str().find("(fixed)"), std::string::npos);
}

TEST_F(CliTest, ParseFailureExitsTwo) {
    std::string file = dir_.write("src/bad.swift", "let s = \"open\n");
    EXPECT_EQ(check({file}), 2);
    EXPECT_NE(out_.str().find("tool-error: unterminated string literal [parse-failure]"),
              std::string::npos)
        << out_.str();
}

TEST_F(CliTest, MissingPathExitsTwo) {
    EXPECT_EQ(check({(dir_.path() / "nowhere").generic_string()}), 2);
    EXPECT_NE(out_.str().find("no such file or directory [io-error]"), std::string::npos);
}

TEST_F(CliTest, DirectoryIsWalked) {
    dir_.write("src/a.swift", "let x=5\n");
    dir_.write("src/nested/b.swift", "let y = 6\n");
    dir_.write("src/readme.txt", "let z=7\n");
    EXPECT_EQ(check({"--quiet", (dir_.path() / "src").generic_string()}), 1);

    std::string out = out_.str();
    EXPECT_NE(out.find("a.swift:1:6"), std::string::npos);
    EXPECT_EQ(out.find("readme.txt"), std::string::npos);
    EXPECT_EQ(out.find("checked"), std::string::npos);
}

TEST_F(CliTest, JsonOutput) {
    std::string file = dir_.write("src/a.swift", "let x=5\n");
    EXPECT_EQ(check({"--format", "json", file}), 1);

    auto parsed = json::parse_json(out_.str());
    ASSERT_TRUE(is_ok(parsed)) << out_.str();
    const auto& records = unwrap(parsed);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].get("ruleId")->as_string(), "operator-spacing");
    EXPECT_EQ(records[0].get("path")->as_string(), file);
}

TEST_F(CliTest, SuppressionCommentsAndOverride) {
    std::string file =
        dir_.write("src/a.swift", "let x=5 // conform:disable-line operator-spacing\n");
    EXPECT_EQ(check({file}), 0);
    EXPECT_EQ(check({"--ignore-suppressions", file}), 1);
}

TEST_F(CliTest, ConfigDisablesRule) {
    config_ = dir_.write("strict.toml", "[rules.operator-spacing]\nenabled = false\n");
    std::string file = dir_.write("src/a.swift", "let x=5\n");
    EXPECT_EQ(check({file}), 0);
}

TEST_F(CliTest, ConfigErrorExitsTwo) {
    config_ = dir_.write("broken.toml", "[linting]\n");
    std::string file = dir_.write("src/a.swift", "let x = 5\n");
    EXPECT_EQ(check({file}), 2);
    EXPECT_NE(err_.str().find("conform: config error: "), std::string::npos);
    EXPECT_NE(err_.str().find("unknown section [linting]"), std::string::npos);
}

TEST_F(CliTest, UnknownRuleInConfigExitsTwo) {
    config_ = dir_.write("typo.toml", "[rules.no-such-rule]\nenabled = true\n");
    std::string file = dir_.write("src/a.swift", "let x = 5\n");
    EXPECT_EQ(check({file}), 2);
    EXPECT_NE(err_.str().find("unknown rule 'no-such-rule'"), std::string::npos);
}

TEST_F(CliTest, BadUsageExitsTwo) {
    EXPECT_EQ(check({"--bogus"}), 2);
    EXPECT_NE(err_.str().find("unknown option '--bogus'"), std::string::npos);

    EXPECT_EQ(check({"--format", "xml"}), 2);
    EXPECT_NE(err_.str().find("unknown format 'xml'"), std::string::npos);

    EXPECT_EQ(check({"--jobs", "-3"}), 2);
    EXPECT_NE(err_.str().find("invalid job count '-3'"), std::string::npos);
}

// ============================================================================
// rules
// ============================================================================

TEST_F(CliTest, RulesTable) {
    EXPECT_EQ(rules({}), 0);
    std::string out = out_.str();
    EXPECT_EQ(out.rfind("ID", 0), 0u);
    EXPECT_NE(out.find("force-unwrap"), std::string::npos);
    EXPECT_NE(out.find("operator-spacing"), std::string::npos);
}

TEST_F(CliTest, RulesJson) {
    EXPECT_EQ(rules({"--format", "json"}), 0);

    auto parsed = json::parse_json(out_.str());
    ASSERT_TRUE(is_ok(parsed)) << out_.str();
    const auto& list = unwrap(parsed);
    ASSERT_EQ(list.size(), conform::rules::builtin_rules().size());

    bool saw_force_unwrap = false;
    for (size_t i = 0; i < list.size(); ++i) {
        const auto& entry = list[i];
        if (entry.get("id")->as_string() == "force-unwrap") {
            saw_force_unwrap = true;
            EXPECT_FALSE(entry.get("enabled")->as_bool());
            EXPECT_EQ(entry.get("severity")->as_string(), "info");
        }
        if (entry.get("id")->as_string() == "vertical-whitespace") {
            EXPECT_EQ(entry.get("params")->get("max_empty_lines")->as_i64(), 1);
        }
    }
    EXPECT_TRUE(saw_force_unwrap);
}

TEST_F(CliTest, RulesRejectsUnknownArgument) {
    EXPECT_EQ(rules({"--fix"}), 2);
}

// ============================================================================
// Discovery
// ============================================================================

TEST(DiscoveryTest, WalksSortsAndExcludes) {
    TempDir dir("discovery");
    std::string b = dir.write("b.swift", "");
    std::string a = dir.write("sub/a.swift", "");
    dir.write("Pods/vendored.swift", "");
    dir.write("notes.md", "");

    auto found = discover_files({dir.path().generic_string()}, {"Pods/"});

    ASSERT_EQ(found.files.size(), 2u);
    EXPECT_EQ(found.files[0], b);
    EXPECT_EQ(found.files[1], a);
    EXPECT_TRUE(found.errors.empty());
}

TEST(DiscoveryTest, ExplicitFileIsAlwaysChecked) {
    TempDir dir("discovery_explicit");
    std::string notes = dir.write("Pods/notes.md", "");

    auto found = discover_files({notes, notes}, {"Pods/"});

    ASSERT_EQ(found.files.size(), 1u);
    EXPECT_EQ(found.files[0], notes);
}

TEST(DiscoveryTest, MissingPathBecomesAnError) {
    auto found = discover_files({"/definitely/not/here.swift"}, {});

    EXPECT_TRUE(found.files.empty());
    ASSERT_EQ(found.errors.size(), 1u);
    EXPECT_EQ(found.errors[0].diagnostics[0].message, "no such file or directory");
}
