#include "engine/file_checker.hpp"

#include "lexer/source.hpp"
#include "log/log.hpp"
#include "model/source_model.hpp"

#include <algorithm>
#include <fstream>

namespace conform::engine {

auto file_outcome_name(FileOutcome outcome) -> std::string_view {
    switch (outcome) {
    case FileOutcome::Clean:
        return "clean";
    case FileOutcome::ViolationsRemain:
        return "violations-remain";
    case FileOutcome::Fixed:
        return "fixed";
    case FileOutcome::ToolError:
        return "tool-error";
    }
    return "clean";
}

auto FileResult::has_tool_error() const -> bool {
    return std::any_of(diagnostics.begin(), diagnostics.end(),
                       [](const ToolDiagnostic& d) { return d.is_error(); });
}

auto FileResult::has_error_violation() const -> bool {
    return std::any_of(violations.begin(), violations.end(), [](const rules::Violation& v) {
        return v.severity == rules::Severity::Error;
    });
}

auto classify(const FileResult& result) -> FileOutcome {
    if (result.has_tool_error()) {
        return FileOutcome::ToolError;
    }
    if (result.has_error_violation()) {
        return FileOutcome::ViolationsRemain;
    }
    if (result.changed) {
        return FileOutcome::Fixed;
    }
    return FileOutcome::Clean;
}

auto io_error_result(std::string path, std::string message) -> FileResult {
    FileResult result;
    result.path = std::move(path);
    result.diagnostics.push_back(ToolDiagnostic{
        .id = diag::IO_ERROR,
        .severity = ToolSeverity::Error,
        .message = std::move(message),
        .loc = SourceLocation{},
        .rule_id = "",
    });
    result.outcome = FileOutcome::ToolError;
    return result;
}

FileChecker::FileChecker(const registry::RuleRegistry& registry, const lexer::Frontend& frontend,
                         CheckerOptions options)
    : registry_(registry), frontend_(frontend), options_(std::move(options)) {}

auto FileChecker::check_text(std::string path, std::string text) const -> FileResult {
    FileResult result;
    result.path = path;

    auto built = model::SourceModel::build(std::move(path), std::move(text), frontend_);
    if (is_err(built)) {
        const auto& failure = unwrap_err(built);
        CONFORM_LOG_INFO("engine", result.path << ":" << failure.loc.line << ":"
                                               << failure.loc.column << ": " << failure.message);
        result.diagnostics.push_back(ToolDiagnostic{
            .id = diag::PARSE_FAILURE,
            .severity = ToolSeverity::Error,
            .message = failure.message,
            .loc = failure.loc,
            .rule_id = "",
        });
        result.outcome = FileOutcome::ToolError;
        return result;
    }
    auto& model = unwrap(built);

    if (options_.fix) {
        FixOutcome outcome = fix_until_stable(std::move(model), registry_, frontend_,
                                              options_.fix_options);
        result.violations = std::move(outcome.remaining);
        result.fixed = std::move(outcome.fixed);
        result.diagnostics = std::move(outcome.diagnostics);
        result.applied_edits = outcome.applied_edits;
        result.passes = outcome.passes;
        result.changed = outcome.changed();
        if (result.changed) {
            result.final_text = std::string(outcome.model.text());
        }
    } else {
        CheckResult checked = check(model, registry_, options_.fix_options.check);
        result.violations = std::move(checked.violations);
        result.diagnostics = std::move(checked.faults);
    }

    result.outcome = classify(result);
    return result;
}

auto FileChecker::check_file(const std::string& path) const -> FileResult {
    auto source = lexer::Source::from_file(path);
    if (is_err(source)) {
        CONFORM_LOG_ERROR("engine", unwrap_err(source));
        return io_error_result(path, unwrap_err(source));
    }

    FileResult result = check_text(path, std::string(unwrap(source).content()));
    if (!result.final_text) {
        return result;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (out) {
        out << *result.final_text;
    }
    if (!out) {
        CONFORM_LOG_ERROR("engine", "cannot write fixed file: " << path);
        result.diagnostics.push_back(ToolDiagnostic{
            .id = diag::IO_ERROR,
            .severity = ToolSeverity::Error,
            .message = "cannot write fixed file: " + path,
            .loc = SourceLocation{},
            .rule_id = "",
        });
        result.outcome = classify(result);
        return result;
    }
    CONFORM_LOG_INFO("engine", "fixed " << path << " (" << result.applied_edits << " edit(s), "
                                        << result.passes << " pass(es))");
    return result;
}

} // namespace conform::engine
