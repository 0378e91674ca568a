//! # Diagnostic Reporter
//!
//! Renders a `RunReport` and decides the process exit status. The reporter
//! is the only component that writes to stdout.
//!
//! ## Formats
//!
//! ```text
//! text:  Sources/App.swift:3:6: error: operator '=' should be surrounded by single spaces [operator-spacing]
//!        Sources/App.swift:9:1: warning: ... [sorted-imports] (fixed)
//!        Sources/Bad.swift:2:9: tool-error: unterminated string literal [parse-failure]
//!        checked 2 files: 1 error, 0 warnings, 0 infos, 1 fixed, 1 tool error
//!
//! json:  [{"column":6,"fixed":false,"line":3,"message":"...","path":"...",
//!          "ruleId":"operator-spacing","severity":"error"}, ...]
//! ```
//!
//! ## Outcome
//!
//! | Outcome             | Exit | When                                          |
//! |---------------------|------|-----------------------------------------------|
//! | `clean`             | 0    | nothing below applies                         |
//! | `violations-remain` | 1    | an error-severity violation is left unresolved |
//! | `tool-error`        | 2    | any tool error, or the run was interrupted    |

#ifndef CONFORM_REPORT_REPORTER_HPP
#define CONFORM_REPORT_REPORTER_HPP

#include "engine/runner.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace conform::report {

enum class Format : uint8_t { Text, Json };

[[nodiscard]] auto parse_format(std::string_view name) -> std::optional<Format>;

enum class RunOutcome : uint8_t { Clean, ViolationsRemain, ToolError };

[[nodiscard]] auto run_outcome_name(RunOutcome outcome) -> std::string_view;
[[nodiscard]] auto exit_code(RunOutcome outcome) -> int;
[[nodiscard]] auto compute_outcome(const engine::RunReport& report) -> RunOutcome;

/// One output line / JSON element.
struct Record {
    std::string path;
    uint32_t line = 0;
    uint32_t column = 0;
    std::string severity; ///< error, warning, info, tool-error, tool-warning
    std::string rule_id;  ///< Rule id, or the tool diagnostic id.
    std::string message;
    bool fixed = false;
};

struct Summary {
    size_t files = 0;
    size_t errors = 0;
    size_t warnings = 0;
    size_t infos = 0;
    size_t fixed = 0;
    size_t tool_errors = 0;
    size_t tool_warnings = 0;
};

struct ReporterOptions {
    Format format = Format::Text;
    bool quiet = false;
    bool color = false;
};

class Reporter {
public:
    explicit Reporter(ReporterOptions options) : options_(options) {}

    /// Flattens the report into records: files by path, and within a file
    /// tool diagnostics first, then remaining violations by position, then
    /// fixed violations in the order they were fixed.
    [[nodiscard]] static auto collect(const engine::RunReport& report) -> std::vector<Record>;
    [[nodiscard]] static auto summarize(const engine::RunReport& report) -> Summary;

    /// Writes the report and returns the outcome.
    auto render(const engine::RunReport& report, std::ostream& out) const -> RunOutcome;

private:
    ReporterOptions options_;

    void render_text(const std::vector<Record>& records, const Summary& summary,
                     std::ostream& out) const;
    void render_json(const std::vector<Record>& records, std::ostream& out) const;
};

} // namespace conform::report

#endif // CONFORM_REPORT_REPORTER_HPP
