#include "report/reporter.hpp"

#include "json/json.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <tuple>

namespace conform::report {

// ============================================================================
// ANSI Color Codes
// ============================================================================

namespace {

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* Dim = "\033[2m";
    static constexpr const char* Red = "\033[31m";
    static constexpr const char* Green = "\033[32m";
    static constexpr const char* Yellow = "\033[33m";
    static constexpr const char* Cyan = "\033[36m";
    static constexpr const char* BrightRed = "\033[91m";
};

auto severity_color(std::string_view severity) -> const char* {
    if (severity == "error") {
        return Colors::Red;
    }
    if (severity == "warning") {
        return Colors::Yellow;
    }
    if (severity == "info") {
        return Colors::Cyan;
    }
    return Colors::BrightRed;
}

auto plural(size_t count, std::string_view word) -> std::string {
    std::string out = std::to_string(count) + " " + std::string(word);
    if (count != 1) {
        out += 's';
    }
    return out;
}

auto record_less(const Record& a, const Record& b) -> bool {
    return std::tie(a.line, a.column, a.rule_id, a.message, a.fixed) <
           std::tie(b.line, b.column, b.rule_id, b.message, b.fixed);
}

auto violation_record(const std::string& path, const rules::Violation& v, bool fixed) -> Record {
    return Record{
        .path = path,
        .line = v.loc.line,
        .column = v.loc.column,
        .severity = std::string(rules::severity_name(v.severity)),
        .rule_id = v.rule_id,
        .message = v.message,
        .fixed = fixed,
    };
}

} // namespace

// ============================================================================
// Outcome
// ============================================================================

auto parse_format(std::string_view name) -> std::optional<Format> {
    if (name == "text") {
        return Format::Text;
    }
    if (name == "json") {
        return Format::Json;
    }
    return std::nullopt;
}

auto run_outcome_name(RunOutcome outcome) -> std::string_view {
    switch (outcome) {
    case RunOutcome::Clean:
        return "clean";
    case RunOutcome::ViolationsRemain:
        return "violations-remain";
    case RunOutcome::ToolError:
        return "tool-error";
    }
    return "clean";
}

auto exit_code(RunOutcome outcome) -> int {
    switch (outcome) {
    case RunOutcome::Clean:
        return 0;
    case RunOutcome::ViolationsRemain:
        return 1;
    case RunOutcome::ToolError:
        return 2;
    }
    return 2;
}

auto compute_outcome(const engine::RunReport& report) -> RunOutcome {
    if (report.interrupted) {
        return RunOutcome::ToolError;
    }
    bool remain = false;
    for (const auto& file : report.files) {
        if (file.has_tool_error()) {
            return RunOutcome::ToolError;
        }
        remain = remain || file.has_error_violation();
    }
    return remain ? RunOutcome::ViolationsRemain : RunOutcome::Clean;
}

// ============================================================================
// Collection
// ============================================================================

auto Reporter::collect(const engine::RunReport& report) -> std::vector<Record> {
    std::vector<Record> records;

    for (const auto& file : report.files) {
        std::vector<Record> tool;
        for (const auto& d : file.diagnostics) {
            tool.push_back(Record{
                .path = file.path,
                .line = d.loc.line,
                .column = d.loc.column,
                .severity = std::string(engine::tool_severity_name(d.severity)),
                .rule_id = d.id,
                .message = d.message,
                .fixed = false,
            });
        }
        std::stable_sort(tool.begin(), tool.end(), record_less);

        // Remaining positions refer to the final text, fixed ones to the
        // revision each was found in, so fixed records keep pass order.
        std::vector<Record> remaining;
        for (const auto& v : file.violations) {
            remaining.push_back(violation_record(file.path, v, false));
        }
        std::stable_sort(remaining.begin(), remaining.end(), record_less);

        std::vector<Record> fixed;
        for (const auto& v : file.fixed) {
            fixed.push_back(violation_record(file.path, v, true));
        }

        for (auto* group : {&tool, &remaining, &fixed}) {
            records.insert(records.end(), std::make_move_iterator(group->begin()),
                           std::make_move_iterator(group->end()));
        }
    }

    if (report.interrupted) {
        records.push_back(Record{
            .path = "",
            .line = 0,
            .column = 0,
            .severity = std::string(engine::tool_severity_name(engine::ToolSeverity::Error)),
            .rule_id = engine::diag::INTERRUPTED,
            .message = "run interrupted, " + plural(report.skipped, "file") + " not checked",
            .fixed = false,
        });
    }
    return records;
}

auto Reporter::summarize(const engine::RunReport& report) -> Summary {
    Summary summary;
    summary.files = report.files.size();
    for (const auto& file : report.files) {
        for (const auto& v : file.violations) {
            switch (v.severity) {
            case rules::Severity::Error:
                summary.errors++;
                break;
            case rules::Severity::Warning:
                summary.warnings++;
                break;
            case rules::Severity::Info:
                summary.infos++;
                break;
            }
        }
        summary.fixed += file.fixed.size();
        for (const auto& d : file.diagnostics) {
            if (d.is_error()) {
                summary.tool_errors++;
            } else {
                summary.tool_warnings++;
            }
        }
    }
    if (report.interrupted) {
        summary.tool_errors++;
    }
    return summary;
}

// ============================================================================
// Rendering
// ============================================================================

auto Reporter::render(const engine::RunReport& report, std::ostream& out) const -> RunOutcome {
    auto records = collect(report);
    RunOutcome outcome = compute_outcome(report);

    if (options_.format == Format::Json) {
        render_json(records, out);
    } else {
        render_text(records, summarize(report), out);
    }
    out.flush();

    CONFORM_LOG_DEBUG("report", records.size() << " record(s), outcome "
                                                << run_outcome_name(outcome));
    return outcome;
}

void Reporter::render_text(const std::vector<Record>& records, const Summary& summary,
                           std::ostream& out) const {
    const bool color = options_.color;

    for (const auto& r : records) {
        if (r.path.empty()) {
            out << "conform: ";
        } else {
            if (color) {
                out << Colors::Bold;
            }
            out << r.path << ":" << r.line << ":" << r.column << ":";
            if (color) {
                out << Colors::Reset;
            }
            out << " ";
        }

        if (color) {
            out << severity_color(r.severity) << r.severity << Colors::Reset;
        } else {
            out << r.severity;
        }
        out << ": " << r.message << " ";

        if (color) {
            out << Colors::Dim << "[" << r.rule_id << "]" << Colors::Reset;
        } else {
            out << "[" << r.rule_id << "]";
        }
        if (r.fixed) {
            out << (color ? Colors::Green : "") << " (fixed)" << (color ? Colors::Reset : "");
        }
        out << "\n";
    }

    if (options_.quiet) {
        return;
    }

    out << "checked " << plural(summary.files, "file") << ": " << plural(summary.errors, "error")
        << ", " << plural(summary.warnings, "warning") << ", " << plural(summary.infos, "info")
        << ", " << summary.fixed << " fixed";
    if (summary.tool_errors > 0) {
        out << ", " << (color ? Colors::BrightRed : "") << plural(summary.tool_errors, "tool error")
            << (color ? Colors::Reset : "");
    }
    if (summary.tool_warnings > 0) {
        out << ", " << plural(summary.tool_warnings, "tool warning");
    }
    out << "\n";
}

void Reporter::render_json(const std::vector<Record>& records, std::ostream& out) const {
    json::JsonValue array(json::JsonArray{});
    for (const auto& r : records) {
        json::JsonValue entry(json::JsonObject{});
        entry.set("path", json::JsonValue(r.path));
        entry.set("line", json::JsonValue(r.line));
        entry.set("column", json::JsonValue(r.column));
        entry.set("severity", json::JsonValue(r.severity));
        entry.set("ruleId", json::JsonValue(r.rule_id));
        entry.set("message", json::JsonValue(r.message));
        entry.set("fixed", json::JsonValue(r.fixed));
        array.push(std::move(entry));
    }
    out << (options_.quiet ? array.to_string() : array.to_string_pretty()) << "\n";
}

} // namespace conform::report
