//! # CLI Commands
//!
//! | Command          | Handler       |
//! |------------------|---------------|
//! | `conform check`  | `run_check()` |
//! | `conform rules`  | `run_rules()` |
//!
//! Handlers take the arguments after the command name with logging flags
//! already removed, and write to the given streams so tests can capture
//! them. They return the process exit code.

#ifndef CONFORM_CLI_COMMANDS_HPP
#define CONFORM_CLI_COMMANDS_HPP

#include "config/config.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace conform::cli {

int run_check(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
int run_rules(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

/// Loads `--config <path>` if given, else `conform.toml` from the working
/// directory, else defaults. Prints the error and returns nullopt on failure.
auto load_run_config(const std::optional<std::string>& path, std::ostream& err)
    -> std::optional<config::Config>;

} // namespace conform::cli

#endif // CONFORM_CLI_COMMANDS_HPP
