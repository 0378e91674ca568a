//! # Rules Command
//!
//! Lists every built-in rule with its resolved state under the current
//! configuration:
//!
//! ```text
//! ID                              CATEGORY   SEVERITY  FIX  STATE  TITLE
//! brace-same-line                 layout     error     yes  on     Opening braces stay ...
//! force-unwrap                    idiom      info      no   off    Avoid force unwrapping ...
//! ```

#include "commands.hpp"
#include "json/json.hpp"
#include "registry/registry.hpp"
#include "rules/builtin.hpp"

#include <iomanip>
#include <type_traits>
#include <variant>

namespace conform::cli {

namespace {

auto render_params(const rules::RuleInfo& info) -> json::JsonValue {
    json::JsonValue params(json::JsonObject{});
    for (const auto& spec : info.params) {
        json::JsonValue value = std::visit(
            [](const auto& v) -> json::JsonValue {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                    json::JsonValue list(json::JsonArray{});
                    for (const auto& item : v) {
                        list.push(json::JsonValue(item));
                    }
                    return list;
                } else {
                    return json::JsonValue(v);
                }
            },
            spec.default_value);
        params.set(spec.name, std::move(value));
    }
    return params;
}

} // namespace

int run_rules(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    bool json_output = false;
    std::optional<std::string> config_path;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--format=json" || (arg == "--format" && i + 1 < args.size() &&
                                       args[i + 1] == "json")) {
            json_output = true;
            i += arg == "--format" ? 1 : 0;
        } else if (arg == "--format=text" || (arg == "--format" && i + 1 < args.size() &&
                                              args[i + 1] == "text")) {
            i += arg == "--format" ? 1 : 0;
        } else if (arg == "--config" && i + 1 < args.size()) {
            config_path = args[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            config_path = arg.substr(9);
        } else {
            err << "conform: unknown argument '" << arg << "'\n";
            err << "Usage: conform rules [--format text|json] [--config <path>]\n";
            return 2;
        }
    }

    auto config = load_run_config(config_path, err);
    if (!config) {
        return 2;
    }
    auto loaded = registry::RuleRegistry::load(rules::builtin_rules(), *config);
    if (is_err(loaded)) {
        err << "conform: config error: " << unwrap_err(loaded).to_string() << "\n";
        return 2;
    }
    const auto& registry = unwrap(loaded);

    if (json_output) {
        json::JsonValue list(json::JsonArray{});
        for (const auto& rule : registry.all()) {
            const auto& info = rule->info;
            const auto* active = registry.find_active(info.id);
            json::JsonValue entry(json::JsonObject{});
            entry.set("id", json::JsonValue(info.id));
            entry.set("title", json::JsonValue(info.title));
            entry.set("category", json::JsonValue(rules::category_name(info.category)));
            entry.set("severity", json::JsonValue(rules::severity_name(
                                      active ? active->severity : info.severity)));
            entry.set("fixable", json::JsonValue(info.fixable));
            entry.set("enabled", json::JsonValue(active != nullptr));
            entry.set("params", render_params(info));
            list.push(std::move(entry));
        }
        out << list.to_string_pretty() << "\n";
        return 0;
    }

    out << std::left << std::setw(32) << "ID" << std::setw(11) << "CATEGORY" << std::setw(10)
        << "SEVERITY" << std::setw(5) << "FIX" << std::setw(7) << "STATE"
        << "TITLE\n";
    for (const auto& rule : registry.all()) {
        const auto& info = rule->info;
        const auto* active = registry.find_active(info.id);
        out << std::left << std::setw(32) << info.id << std::setw(11)
            << rules::category_name(info.category) << std::setw(10)
            << rules::severity_name(active ? active->severity : info.severity) << std::setw(5)
            << (info.fixable ? "yes" : "no") << std::setw(7) << (active ? "on" : "off")
            << info.title << "\n";
    }
    return 0;
}

} // namespace conform::cli
