//! # JSON Value Types
//!
//! `JsonValue` is a variant over null, bool, number, string, array and
//! object. Objects are ordered by key (`std::map`), which keeps serialized
//! output deterministic: two runs that build the same values produce
//! byte-identical text.
//!
//! Arrays and objects are boxed, so `JsonValue` is move-only; use `clone()`
//! for an explicit deep copy.
//!
//! ## Example
//!
//! ```cpp
//! JsonValue record(JsonObject{});
//! record.set("path", JsonValue("Sources/App.swift"));
//! record.set("line", JsonValue(12));
//! std::string text = record.to_string();
//! ```

#pragma once

#include "common.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace conform::json {

struct JsonValue;

using JsonArray = std::vector<JsonValue>;

/// Key-ordered object.
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number that keeps integers exact.
///
/// Literals without a fraction or exponent that fit in `int64_t` are stored
/// as `Int64`; everything else is a `Double`.
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Double };

    Kind kind;
    union {
        int64_t i64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind == Kind::Int64 && other.kind == Kind::Int64) {
            return i64 == other.i64;
        }
        return as_f64() == other.as_f64();
    }
};

// ============================================================================
// JsonValue
// ============================================================================

struct JsonValue {
    using Null = std::monostate;

    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(uint32_t value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}
    explicit JsonValue(JsonNumber value) : data(value) {}

    // Type queries

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }

    // Accessors; throw std::bad_variant_access on a type mismatch.

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    /// Integer value of a number; throws std::bad_variant_access if not a number.
    [[nodiscard]] auto as_i64() const -> int64_t {
        const auto& num = as_number();
        return num.is_integer() ? num.i64 : static_cast<int64_t>(num.f64);
    }

    /// Looks up a key; nullptr if this is not an object or the key is absent.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array()[index];
    }

    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    // Mutation

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // Serialization (json_serializer.cpp)

    [[nodiscard]] auto to_string() const -> std::string;
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    /// Deep copy.
    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
};

} // namespace conform::json
