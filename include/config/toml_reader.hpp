//! # TOML Reader
//!
//! A line-oriented reader for the TOML subset used by `conform.toml`.
//!
//! ## Supported Syntax
//!
//! ```toml
//! # comment
//! [section]
//! [section.sub-name]
//! key = true
//! count = 1_000
//! name = "text \"quoted\""
//! list = ["a", "b",
//!         "c"]          # arrays may span lines
//! ```
//!
//! Inline tables, dotted keys, floats, dates and arrays of anything other
//! than strings are rejected with the offending line number.

#ifndef CONFORM_CONFIG_TOML_READER_HPP
#define CONFORM_CONFIG_TOML_READER_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace conform::config {

using TomlValue = std::variant<bool, int64_t, std::string, std::vector<std::string>>;

struct TomlEntry {
    std::string key;
    TomlValue value;
    uint32_t line = 0;
};

struct TomlTable {
    std::string name; ///< Empty for keys before the first header.
    uint32_t line = 0;
    std::vector<TomlEntry> entries;
};

struct TomlDocument {
    std::vector<TomlTable> tables;
};

struct TomlError {
    std::string message;
    uint32_t line = 0;
};

/// Parses a whole document. Duplicate tables and duplicate keys within a
/// table are errors.
[[nodiscard]] auto parse_toml(std::string_view text) -> Result<TomlDocument, TomlError>;

} // namespace conform::config

#endif // CONFORM_CONFIG_TOML_READER_HPP
