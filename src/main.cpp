//! # conform Entry Point
//!
//! Installs the SIGINT handler and delegates to the CLI driver.
//!
//! ```bash
//! conform check Sources/              # report violations
//! conform check --fix Sources/        # rewrite files in place
//! conform check --format json .       # machine-readable output
//! conform rules                       # list rules
//! ```

#include "cli/driver.hpp"
#include "engine/runner.hpp"

#include <csignal>

namespace {

void handle_interrupt(int /*signal*/) {
    conform::engine::request_interrupt();
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, handle_interrupt);
    return conform::cli::conform_main(argc, argv);
}
