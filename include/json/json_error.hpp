//! # JSON Error Type
//!
//! Parse errors carry a message and the 1-based line/column where they
//! occurred (0 when unknown).

#pragma once

#include <cstddef>
#include <string>

namespace conform::json {

struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0)
        -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats as `"line X, column Y: message"` when a location is known.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        return message;
    }
};

} // namespace conform::json
