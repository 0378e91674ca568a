//! # Test Helpers
//!
//! Shortcuts for building models and registries with a chosen rule set.

#ifndef CONFORM_TESTS_TEST_HELPERS_HPP
#define CONFORM_TESTS_TEST_HELPERS_HPP

#include "config/config.hpp"
#include "engine/fixer.hpp"
#include "engine/matcher.hpp"
#include "lexer/frontend.hpp"
#include "model/source_model.hpp"
#include "registry/registry.hpp"
#include "rules/builtin.hpp"

#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace conform::test_support {

inline auto frontend() -> const lexer::SwiftFrontend& {
    static const lexer::SwiftFrontend instance;
    return instance;
}

inline auto build_model(std::string text, std::string path = "test.swift") -> model::SourceModel {
    auto built = model::SourceModel::build(std::move(path), std::move(text), frontend());
    if (is_err(built)) {
        throw std::runtime_error("test source does not parse: " + unwrap_err(built).message);
    }
    return std::move(unwrap(built));
}

/// Config that enables exactly `ids` among the built-in rules.
inline auto config_with(std::initializer_list<std::string> ids, config::Config base = {})
    -> config::Config {
    std::set<std::string> wanted(ids);
    for (const auto& rule : rules::builtin_rules()) {
        base.rules[rule.info.id].enabled = wanted.count(rule.info.id) > 0;
    }
    return base;
}

inline auto registry_with(std::initializer_list<std::string> ids, config::Config base = {})
    -> registry::RuleRegistry {
    auto loaded = registry::RuleRegistry::load(rules::builtin_rules(), config_with(ids, base));
    if (is_err(loaded)) {
        throw std::runtime_error(unwrap_err(loaded).to_string());
    }
    return std::move(unwrap(loaded));
}

/// Violations of a single rule on `text`.
inline auto violations_of(const std::string& id, std::string text, config::Config base = {})
    -> std::vector<rules::Violation> {
    auto registry = registry_with({id}, std::move(base));
    return engine::check(build_model(std::move(text)), registry).violations;
}

/// Text after fixing with the given rules until stable.
inline auto fixed_text(std::initializer_list<std::string> ids, std::string text,
                       config::Config base = {}) -> std::string {
    auto registry = registry_with(ids, std::move(base));
    auto outcome = engine::fix_until_stable(build_model(std::move(text)), registry, frontend(),
                                            engine::FixOptions{});
    return std::string(outcome.model.text());
}

/// A fresh scratch directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        path_ = std::filesystem::temp_directory_path() /
                ("conform_test_" + name + "_" + std::to_string(std::random_device{}()));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

    auto write(const std::string& relative, const std::string& content) const -> std::string {
        auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file.generic_string();
    }

    [[nodiscard]] auto read(const std::string& relative) const -> std::string {
        std::ifstream in(path_ / relative, std::ios::binary);
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

private:
    std::filesystem::path path_;
};

} // namespace conform::test_support

#endif // CONFORM_TESTS_TEST_HELPERS_HPP
