//! # Configuration Loading
//!
//! Maps the tables of a parsed TOML document onto `Config`:
//!
//! | Table                | Target                         |
//! |----------------------|--------------------------------|
//! | `[conform]`          | global options                 |
//! | `[categories.<name>]`| `Config::categories[name]`     |
//! | `[rules.<id>]`       | `Config::rules[id]`            |

#include "config/config.hpp"

#include "config/toml_reader.hpp"
#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace conform::config {

auto ConfigError::to_string() const -> std::string {
    std::string out;
    if (!path.empty()) {
        out += path;
        out += ':';
        if (line > 0) {
            out += std::to_string(line);
            out += ':';
        }
        out += ' ';
    } else if (line > 0) {
        out += "line " + std::to_string(line) + ": ";
    }
    out += message;
    return out;
}

namespace {

struct Loader {
    const std::string& path;
    Config config;

    auto error(std::string message, uint32_t line) const -> ConfigError {
        return ConfigError{std::move(message), path, line};
    }

    auto expect_int(const TomlEntry& entry, int64_t min) const -> Result<int64_t, ConfigError> {
        const auto* value = std::get_if<int64_t>(&entry.value);
        if (!value) {
            return error("'" + entry.key + "' must be an integer", entry.line);
        }
        if (*value < min) {
            return error("'" + entry.key + "' must be at least " + std::to_string(min),
                         entry.line);
        }
        return *value;
    }

    auto expect_bool(const TomlEntry& entry) const -> Result<bool, ConfigError> {
        const auto* value = std::get_if<bool>(&entry.value);
        if (!value) {
            return error("'" + entry.key + "' must be true or false", entry.line);
        }
        return *value;
    }

    auto expect_severity(const TomlEntry& entry) const -> Result<rules::Severity, ConfigError> {
        const auto* value = std::get_if<std::string>(&entry.value);
        if (!value) {
            return error("'severity' must be a string", entry.line);
        }
        auto severity = rules::parse_severity(*value);
        if (!severity) {
            return error("unknown severity '" + *value + "' (expected error, warning or info)",
                         entry.line);
        }
        return *severity;
    }

    auto load_global(const TomlTable& table) -> std::optional<ConfigError> {
        for (const auto& entry : table.entries) {
            int64_t* target = nullptr;
            int64_t min = 0;
            if (entry.key == "max_fix_iterations") {
                target = &config.max_fix_iterations;
                min = 1;
            } else if (entry.key == "line_length") {
                target = &config.line_length;
                min = 1;
            } else if (entry.key == "indent_width") {
                target = &config.indent_width;
                min = 1;
            } else if (entry.key == "jobs") {
                target = &config.jobs;
            } else if (entry.key == "exclude") {
                const auto* list = std::get_if<std::vector<std::string>>(&entry.value);
                if (!list) {
                    return error("'exclude' must be an array of strings", entry.line);
                }
                config.exclude = *list;
                continue;
            } else {
                return error("unknown key '" + entry.key + "' in [conform]", entry.line);
            }

            auto value = expect_int(entry, min);
            if (is_err(value)) {
                return unwrap_err(value);
            }
            *target = unwrap(value);
        }
        return std::nullopt;
    }

    auto load_category(const std::string& name, const TomlTable& table)
        -> std::optional<ConfigError> {
        CategoryOverride override_;
        override_.line = table.line;
        for (const auto& entry : table.entries) {
            if (entry.key == "enabled") {
                auto value = expect_bool(entry);
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                override_.enabled = unwrap(value);
            } else if (entry.key == "severity") {
                auto value = expect_severity(entry);
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                override_.severity = unwrap(value);
            } else {
                return error("unknown key '" + entry.key + "' in [categories." + name + "]",
                             entry.line);
            }
        }
        config.categories[name] = std::move(override_);
        return std::nullopt;
    }

    auto load_rule(const std::string& id, const TomlTable& table) -> std::optional<ConfigError> {
        RuleOverride override_;
        override_.line = table.line;
        for (const auto& entry : table.entries) {
            if (entry.key == "enabled") {
                auto value = expect_bool(entry);
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                override_.enabled = unwrap(value);
            } else if (entry.key == "severity") {
                auto value = expect_severity(entry);
                if (is_err(value)) {
                    return unwrap_err(value);
                }
                override_.severity = unwrap(value);
            } else {
                // Parameters are validated against the rule by the registry.
                override_.params[entry.key] = entry.value;
                override_.param_lines[entry.key] = entry.line;
            }
        }
        config.rules[id] = std::move(override_);
        return std::nullopt;
    }

    auto load(const TomlDocument& doc) -> std::optional<ConfigError> {
        for (const auto& table : doc.tables) {
            std::optional<ConfigError> failure;
            if (table.name.empty()) {
                if (!table.entries.empty()) {
                    return error("key '" + table.entries.front().key +
                                     "' must be inside a section",
                                 table.entries.front().line);
                }
            } else if (table.name == "conform") {
                failure = load_global(table);
            } else if (table.name.rfind("categories.", 0) == 0) {
                failure = load_category(table.name.substr(11), table);
            } else if (table.name.rfind("rules.", 0) == 0) {
                failure = load_rule(table.name.substr(6), table);
            } else {
                failure = error("unknown section [" + table.name + "]", table.line);
            }
            if (failure) {
                return failure;
            }
        }
        return std::nullopt;
    }
};

} // namespace

auto parse_config(std::string_view text, const std::string& path) -> Result<Config, ConfigError> {
    auto doc = parse_toml(text);
    if (is_err(doc)) {
        const auto& err = unwrap_err(doc);
        return ConfigError{err.message, path, err.line};
    }

    Loader loader{path, Config{}};
    if (auto failure = loader.load(unwrap(doc))) {
        return std::move(*failure);
    }

    loader.config.path = path;
    CONFORM_LOG_DEBUG("config", "loaded " << (path.empty() ? "<text>" : path) << ": "
                                          << loader.config.rules.size() << " rule override(s), "
                                          << loader.config.categories.size()
                                          << " category override(s)");
    return std::move(loader.config);
}

auto load_config(const std::filesystem::path& path) -> Result<Config, ConfigError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return ConfigError{"cannot open configuration file", path.string(), 0};
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str(), path.string());
}

auto find_config(const std::filesystem::path& dir) -> std::optional<std::filesystem::path> {
    std::error_code ec;
    auto candidate = dir / CONFIG_FILE_NAME;
    if (std::filesystem::is_regular_file(candidate, ec)) {
        return candidate;
    }
    return std::nullopt;
}

} // namespace conform::config
