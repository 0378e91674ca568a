//! # CLI Command Dispatcher
//!
//! ```text
//! conform_main()
//!   ├─ parse_log_options()   → Logger::init()
//!   ├─ --help, -h            → print_usage()
//!   ├─ --version, -V         → print_version()
//!   ├─ check                 → run_check()
//!   └─ rules                 → run_rules()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags are accepted anywhere on the command line and removed
//! before the command sees its arguments:
//! - `--log-level=<level>`, `--log-filter=<spec>`, `--log-file=<path>`,
//!   `--log-format=text|json`
//! - `-v` / `-vv` / `-vvv` (info / debug / trace)
//!
//! ## Return Codes
//!
//! | Code | Meaning                                        |
//! |------|------------------------------------------------|
//! | 0    | Clean run, help or version                     |
//! | 1    | Unresolved error-severity violations           |
//! | 2    | Tool error, configuration error or bad usage   |

#include "commands.hpp"
#include "common.hpp"
#include "driver.hpp"
#include "log/log.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace conform::cli {

void print_usage(std::ostream& out) {
    out << "conform " << VERSION << " - style conformance checker\n"
        << "\n"
        << "Usage:\n"
        << "  conform check [options] [paths...]   Check files (default: .)\n"
        << "  conform rules [options]              List rules and their state\n"
        << "  conform --help | --version\n"
        << "\n"
        << "Check options:\n"
        << "  --fix                    Rewrite files to fix what can be fixed\n"
        << "  --format text|json       Output format (default: text)\n"
        << "  --config <path>          Configuration file (default: ./conform.toml)\n"
        << "  --jobs, -j <n>           Worker threads, 0 = one per core\n"
        << "  --quiet, -q              Omit the summary line\n"
        << "  --ignore-suppressions    Report violations silenced by comments\n"
        << "  --no-color               Plain text output\n"
        << "\n"
        << "Logging:\n"
        << "  --log-level=<level>      trace, debug, info, warn, error, off\n"
        << "  --log-filter=<spec>      e.g. engine=debug,*=warn\n"
        << "  --log-file=<path>        Also write logs to a file\n"
        << "  --log-format=text|json   Log line format\n"
        << "  -v, -vv, -vvv            Raise the log level\n"
        << "  CONFORM_LOG              Level or filter when no flag is given\n";
}

void print_version(std::ostream& out) {
    out << "conform " << VERSION << "\n";
}

int conform_main(int argc, char* argv[]) {
    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (!log::is_log_option(arg)) {
            args.push_back(std::move(arg));
        }
    }

    if (args.empty()) {
        print_usage(std::cout);
        return 0;
    }

    std::string command = args.front();
    args.erase(args.begin());

    if (command == "--help" || command == "-h" || command == "help") {
        print_usage(std::cout);
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version(std::cout);
        return 0;
    }

    CONFORM_LOG_DEBUG("cli", "command " << command << " with " << args.size() << " argument(s)");

    int code = 2;
    if (command == "check") {
        code = run_check(args, std::cout, std::cerr);
    } else if (command == "rules") {
        code = run_rules(args, std::cout, std::cerr);
    } else {
        std::cerr << "conform: unknown command '" << command << "'\n";
        print_usage(std::cerr);
    }

    log::Logger::instance().flush();
    return code;
}

} // namespace conform::cli
