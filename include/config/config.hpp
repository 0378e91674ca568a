//! # Configuration
//!
//! Loads `conform.toml`.
//!
//! ## File Layout
//!
//! ```toml
//! [conform]
//! max_fix_iterations = 10   # fix passes per file
//! line_length = 120
//! indent_width = 4
//! jobs = 0                  # 0 = one worker per hardware thread
//! exclude = ["Generated", "Pods/"]
//!
//! [categories.naming]
//! enabled = true
//! severity = "warning"
//!
//! [rules.line-length]
//! enabled = true
//! severity = "error"
//! ignore_comments = true    # any other key is a rule parameter
//! ```
//!
//! ## Validation
//!
//! Unknown sections, unknown `[conform]` keys, wrongly typed values and bad
//! severities fail here. Whether a category, rule or rule parameter exists
//! is checked when the registry is loaded; every override keeps its line
//! number so those errors point into the file as well.

#ifndef CONFORM_CONFIG_CONFIG_HPP
#define CONFORM_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "rules/rule.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace conform::config {

/// File name looked up in the working directory when `--config` is absent.
constexpr const char* CONFIG_FILE_NAME = "conform.toml";

struct ConfigError {
    std::string message;
    std::string path; ///< Empty for errors not tied to a file.
    uint32_t line = 0;

    /// "path:line: message", omitting the parts that are unknown.
    [[nodiscard]] auto to_string() const -> std::string;
};

struct CategoryOverride {
    std::optional<bool> enabled;
    std::optional<rules::Severity> severity;
    uint32_t line = 0;
};

struct RuleOverride {
    std::optional<bool> enabled;
    std::optional<rules::Severity> severity;
    rules::ParamMap params;
    std::map<std::string, uint32_t> param_lines;
    uint32_t line = 0;
};

struct Config {
    int64_t max_fix_iterations = 10;
    int64_t line_length = 120;
    int64_t indent_width = 4;
    int64_t jobs = 0;
    std::vector<std::string> exclude;

    std::map<std::string, CategoryOverride> categories;
    std::map<std::string, RuleOverride> rules;

    std::string path; ///< Where the config came from; empty for defaults.
};

/// Parses configuration text. `path` is only used in error messages.
[[nodiscard]] auto parse_config(std::string_view text, const std::string& path = "")
    -> Result<Config, ConfigError>;

/// Reads and parses a configuration file.
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<Config, ConfigError>;

/// Returns `dir/conform.toml` if it exists.
[[nodiscard]] auto find_config(const std::filesystem::path& dir)
    -> std::optional<std::filesystem::path>;

} // namespace conform::config

#endif // CONFORM_CONFIG_CONFIG_HPP
