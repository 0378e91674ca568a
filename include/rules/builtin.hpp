//! # Built-in Rules
//!
//! | Group       | Rules                                                        |
//! |-------------|--------------------------------------------------------------|
//! | spacing     | colon-spacing, comma-spacing, operator-spacing,              |
//! |             | space-before-brace                                           |
//! | layout      | brace-same-line, else-same-line, file-trailing-newline,      |
//! |             | line-length, no-tabs, trailing-whitespace,                   |
//! |             | vertical-whitespace                                          |
//! | naming      | identifier-name, type-name                                   |
//! | structure   | no-semicolons, redundant-internal, sorted-imports            |
//! | idiom       | empty-parens-trailing-closure, force-unwrap,                 |
//! |             | shorthand-optional-binding                                   |

#ifndef CONFORM_RULES_BUILTIN_HPP
#define CONFORM_RULES_BUILTIN_HPP

#include "rules/rule.hpp"

#include <vector>

namespace conform::rules {

[[nodiscard]] auto spacing_rules() -> std::vector<Rule>;
[[nodiscard]] auto layout_rules() -> std::vector<Rule>;
[[nodiscard]] auto naming_rules() -> std::vector<Rule>;
[[nodiscard]] auto structure_rules() -> std::vector<Rule>;
[[nodiscard]] auto idiom_rules() -> std::vector<Rule>;

/// Every built-in rule, in no particular order.
[[nodiscard]] auto builtin_rules() -> std::vector<Rule>;

} // namespace conform::rules

#endif // CONFORM_RULES_BUILTIN_HPP
