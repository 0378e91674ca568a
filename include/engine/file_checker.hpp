//! # Per-File Pipeline
//!
//! ```text
//! check_file()
//!   ├─ read file                    - failure -> io-error
//!   ├─ SourceModel::build()         - failure -> parse-failure, no rules run
//!   ├─ check() or fix_until_stable()
//!   ├─ write back (fix mode, text changed)
//!   └─ classify outcome
//! ```
//!
//! A `FileChecker` holds only shared read-only state, so one instance
//! serves every worker thread.

#ifndef CONFORM_ENGINE_FILE_CHECKER_HPP
#define CONFORM_ENGINE_FILE_CHECKER_HPP

#include "engine/diagnostic.hpp"
#include "engine/fixer.hpp"
#include "lexer/frontend.hpp"
#include "registry/registry.hpp"
#include "rules/rule.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace conform::engine {

enum class FileOutcome : uint8_t { Clean, ViolationsRemain, Fixed, ToolError };

/// "clean", "violations-remain", "fixed" or "tool-error".
[[nodiscard]] auto file_outcome_name(FileOutcome outcome) -> std::string_view;

struct FileResult {
    std::string path;
    std::vector<rules::Violation> violations; ///< Unresolved, in final-text positions.
    std::vector<rules::Violation> fixed;
    std::vector<ToolDiagnostic> diagnostics;
    size_t applied_edits = 0;
    int64_t passes = 0;
    bool changed = false;
    std::optional<std::string> final_text; ///< Set when `changed`.
    FileOutcome outcome = FileOutcome::Clean;

    [[nodiscard]] auto has_tool_error() const -> bool;
    [[nodiscard]] auto has_error_violation() const -> bool;
};

/// tool-error > violations-remain (error severity) > fixed > clean.
[[nodiscard]] auto classify(const FileResult& result) -> FileOutcome;

struct CheckerOptions {
    bool fix = false;
    FixOptions fix_options;
};

class FileChecker {
public:
    FileChecker(const registry::RuleRegistry& registry, const lexer::Frontend& frontend,
                CheckerOptions options);

    /// Reads, checks and (in fix mode) rewrites the file at `path`.
    [[nodiscard]] auto check_file(const std::string& path) const -> FileResult;

    /// Same pipeline on in-memory text; nothing is written.
    [[nodiscard]] auto check_text(std::string path, std::string text) const -> FileResult;

    [[nodiscard]] auto options() const -> const CheckerOptions& {
        return options_;
    }

private:
    const registry::RuleRegistry& registry_;
    const lexer::Frontend& frontend_;
    CheckerOptions options_;
};

/// A result carrying only an `io-error` diagnostic.
[[nodiscard]] auto io_error_result(std::string path, std::string message) -> FileResult;

} // namespace conform::engine

#endif // CONFORM_ENGINE_FILE_CHECKER_HPP
