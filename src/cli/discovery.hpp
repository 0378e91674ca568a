//! # File Discovery
//!
//! Expands command-line paths into the files to check.
//!
//! ## Discovery Rules
//!
//! - A directory is walked recursively for `*.swift` files
//! - Walked files whose path contains an `exclude` fragment are skipped
//! - A file named explicitly is always checked, whatever its extension
//! - A path that does not exist becomes an `io-error` result

#ifndef CONFORM_CLI_DISCOVERY_HPP
#define CONFORM_CLI_DISCOVERY_HPP

#include "engine/file_checker.hpp"

#include <string>
#include <vector>

namespace conform::cli {

constexpr const char* SOURCE_EXTENSION = ".swift";

struct Discovery {
    std::vector<std::string> files; ///< Sorted, without duplicates.
    std::vector<engine::FileResult> errors;
};

[[nodiscard]] auto discover_files(const std::vector<std::string>& paths,
                                  const std::vector<std::string>& exclude) -> Discovery;

} // namespace conform::cli

#endif // CONFORM_CLI_DISCOVERY_HPP
