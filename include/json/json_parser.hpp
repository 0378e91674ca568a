//! # JSON Parser
//!
//! Recursive-descent parser producing a `JsonValue` tree. Numbers without a
//! fraction or exponent are kept as exact integers. Nesting is capped at
//! `MAX_DEPTH` levels.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>

namespace conform::json {

class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses the whole input; trailing non-whitespace is an error.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;
    static constexpr size_t MAX_DEPTH = 512;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_literal(std::string_view word, JsonValue value) -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace conform::json
