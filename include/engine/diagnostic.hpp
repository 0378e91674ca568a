//! # Tool Diagnostics
//!
//! Problems of the tool itself rather than of the checked code: a file that
//! does not parse, a rule that threw, a fix loop that did not settle, an
//! unreadable file. They are reported next to violations but are never
//! suppressed and always land in the `tool-error` category.
//!
//! | Id                  | Severity | Scope |
//! |---------------------|----------|-------|
//! | `parse-failure`     | error    | file  |
//! | `rule-fault`        | error    | rule  |
//! | `fix-broke-syntax`  | error    | pass  |
//! | `fix-not-converged` | warning  | file  |
//! | `io-error`          | error    | file  |
//! | `interrupted`       | error    | run   |

#ifndef CONFORM_ENGINE_DIAGNOSTIC_HPP
#define CONFORM_ENGINE_DIAGNOSTIC_HPP

#include "common.hpp"

#include <string>
#include <string_view>

namespace conform::engine {

enum class ToolSeverity : uint8_t { Error, Warning };

/// "tool-error" or "tool-warning".
[[nodiscard]] auto tool_severity_name(ToolSeverity severity) -> std::string_view;

namespace diag {
constexpr const char* PARSE_FAILURE = "parse-failure";
constexpr const char* RULE_FAULT = "rule-fault";
constexpr const char* FIX_BROKE_SYNTAX = "fix-broke-syntax";
constexpr const char* FIX_NOT_CONVERGED = "fix-not-converged";
constexpr const char* IO_ERROR = "io-error";
constexpr const char* INTERRUPTED = "interrupted";
} // namespace diag

struct ToolDiagnostic {
    std::string id;
    ToolSeverity severity = ToolSeverity::Error;
    std::string message;
    SourceLocation loc;
    std::string rule_id; ///< Set for `rule-fault`, empty otherwise.

    [[nodiscard]] auto is_error() const -> bool {
        return severity == ToolSeverity::Error;
    }
};

} // namespace conform::engine

#endif // CONFORM_ENGINE_DIAGNOSTIC_HPP
