//! # Check Command
//!
//! ```text
//! run_check()
//!   ├─ parse arguments
//!   ├─ load_run_config()           - ConfigError -> stderr, exit 2
//!   ├─ RuleRegistry::load()        - ConfigError -> stderr, exit 2
//!   ├─ discover_files()
//!   ├─ Runner::run()               - FileChecker per file, in parallel
//!   └─ Reporter::render()          - stdout, exit 0/1/2
//! ```

#include "commands.hpp"
#include "discovery.hpp"
#include "engine/file_checker.hpp"
#include "engine/runner.hpp"
#include "lexer/frontend.hpp"
#include "log/log.hpp"
#include "registry/registry.hpp"
#include "report/reporter.hpp"
#include "rules/builtin.hpp"

#include <charconv>
#include <cstdio>
#include <filesystem>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace conform::cli {

namespace {

struct CheckArgs {
    bool fix = false;
    bool quiet = false;
    bool ignore_suppressions = false;
    bool no_color = false;
    report::Format format = report::Format::Text;
    std::optional<std::string> config_path;
    std::optional<int64_t> jobs;
    std::vector<std::string> paths;
};

auto stdout_is_terminal() -> bool {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

/// Splits "--name=value" or takes the next argument for "--name value".
auto option_value(const std::vector<std::string>& args, size_t& i, std::string_view name)
    -> std::optional<std::string> {
    const std::string& arg = args[i];
    if (arg.size() > name.size() && arg.compare(0, name.size(), name) == 0 &&
        arg[name.size()] == '=') {
        return arg.substr(name.size() + 1);
    }
    if (arg == name && i + 1 < args.size()) {
        return args[++i];
    }
    return std::nullopt;
}

auto starts_with_option(const std::string& arg, std::string_view name) -> bool {
    return arg == name || (arg.size() > name.size() && arg.compare(0, name.size(), name) == 0 &&
                           arg[name.size()] == '=');
}

auto parse_check_args(const std::vector<std::string>& args) -> Result<CheckArgs, std::string> {
    CheckArgs parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--fix") {
            parsed.fix = true;
        } else if (arg == "--quiet" || arg == "-q") {
            parsed.quiet = true;
        } else if (arg == "--ignore-suppressions") {
            parsed.ignore_suppressions = true;
        } else if (arg == "--no-color") {
            parsed.no_color = true;
        } else if (starts_with_option(arg, "--format")) {
            auto value = option_value(args, i, "--format");
            if (!value) {
                return std::string("--format needs a value (text or json)");
            }
            auto format = report::parse_format(*value);
            if (!format) {
                return "unknown format '" + *value + "' (expected text or json)";
            }
            parsed.format = *format;
        } else if (starts_with_option(arg, "--config")) {
            auto value = option_value(args, i, "--config");
            if (!value || value->empty()) {
                return std::string("--config needs a path");
            }
            parsed.config_path = *value;
        } else if (starts_with_option(arg, "--jobs") || arg == "-j") {
            auto value = arg == "-j" ? option_value(args, i, "-j") : option_value(args, i, "--jobs");
            if (!value) {
                return std::string("--jobs needs a number");
            }
            int64_t jobs = 0;
            auto [ptr, ec] = std::from_chars(value->data(), value->data() + value->size(), jobs);
            if (ec != std::errc() || ptr != value->data() + value->size() || jobs < 0) {
                return "invalid job count '" + *value + "'";
            }
            parsed.jobs = jobs;
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            return "unknown option '" + arg + "'";
        } else {
            parsed.paths.push_back(arg);
        }
    }
    if (parsed.paths.empty()) {
        parsed.paths.push_back(".");
    }
    return parsed;
}

} // namespace

auto load_run_config(const std::optional<std::string>& path, std::ostream& err)
    -> std::optional<config::Config> {
    std::optional<std::filesystem::path> file;
    if (path) {
        file = *path;
    } else {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        if (!ec) {
            file = config::find_config(cwd);
        }
    }

    if (!file) {
        CONFORM_LOG_DEBUG("config", "no " << config::CONFIG_FILE_NAME << ", using defaults");
        return config::Config{};
    }

    auto loaded = config::load_config(*file);
    if (is_err(loaded)) {
        err << "conform: config error: " << unwrap_err(loaded).to_string() << "\n";
        return std::nullopt;
    }
    CONFORM_LOG_INFO("config", "using " << file->string());
    return std::move(unwrap(loaded));
}

int run_check(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed_args = parse_check_args(args);
    if (is_err(parsed_args)) {
        err << "conform: " << unwrap_err(parsed_args) << "\n";
        err << "Usage: conform check [--fix] [--format text|json] [--config <path>] "
               "[--jobs N] [--quiet] <paths...>\n";
        return 2;
    }
    const CheckArgs& opts = unwrap(parsed_args);

    auto config = load_run_config(opts.config_path, err);
    if (!config) {
        return 2;
    }

    auto registry = registry::RuleRegistry::load(rules::builtin_rules(), *config);
    if (is_err(registry)) {
        err << "conform: config error: " << unwrap_err(registry).to_string() << "\n";
        return 2;
    }

    lexer::SwiftFrontend frontend;
    engine::CheckerOptions checker_options;
    checker_options.fix = opts.fix;
    checker_options.fix_options.max_iterations = config->max_fix_iterations;
    checker_options.fix_options.check.apply_suppressions = !opts.ignore_suppressions;
    engine::FileChecker checker(unwrap(registry), frontend, checker_options);

    Discovery discovery = discover_files(opts.paths, config->exclude);

    int64_t jobs = opts.jobs.value_or(config->jobs);
    engine::Runner runner(checker, static_cast<size_t>(jobs));
    engine::RunReport report = runner.run(discovery.files, std::move(discovery.errors));

    report::Reporter reporter(report::ReporterOptions{
        .format = opts.format,
        .quiet = opts.quiet,
        .color = opts.format == report::Format::Text && !opts.no_color && &out == &std::cout &&
                 stdout_is_terminal(),
    });
    report::RunOutcome outcome = reporter.render(report, out);
    CONFORM_LOG_INFO("cli", "outcome " << report::run_outcome_name(outcome));
    return report::exit_code(outcome);
}

} // namespace conform::cli
