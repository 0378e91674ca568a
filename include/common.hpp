//! # Common Definitions
//!
//! This module provides common types and utilities used throughout conform.
//! It establishes the foundational abstractions that every other component
//! (lexer, source model, rules, engine, reporter) depends on.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Spans and Locations**: Byte spans and line/column positions
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **Errors as values**: Fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared
//! - **Immutable snapshots**: Spans always refer to one fixed revision of a text

#ifndef CONFORM_COMMON_HPP
#define CONFORM_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace conform {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Source Positions
// ============================================================================

/// A half-open byte range `[start, end)` into one revision of a source text.
///
/// An empty span (`start == end`) denotes an insertion point.
struct Span {
    uint32_t start = 0;
    uint32_t end = 0;

    [[nodiscard]] auto length() const -> uint32_t {
        return end - start;
    }

    [[nodiscard]] auto empty() const -> bool {
        return start == end;
    }

    [[nodiscard]] auto contains(uint32_t offset) const -> bool {
        return offset >= start && offset < end;
    }

    [[nodiscard]] auto operator==(const Span& other) const -> bool = default;
};

/// A 1-based line/column position resolved from a byte offset.
struct SourceLocation {
    uint32_t line = 1;   ///< Line number (1-based).
    uint32_t column = 1; ///< Column number in bytes (1-based).
    uint32_t offset = 0; ///< Byte offset from start of text (0-based).

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Config, ConfigError> loaded = load_config(path);
/// if (is_err(loaded)) {
///     report(unwrap_err(loaded));
///     return 2;
/// }
/// Config& config = unwrap(loaded);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace conform

#endif // CONFORM_COMMON_HPP
