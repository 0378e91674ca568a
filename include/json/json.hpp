//! # conform JSON Library
//!
//! Main public header: JSON values, parsing and serialization. Used by the
//! diagnostic reporter for `--format json` and by tests that read that
//! output back.
//!
//! ```cpp
//! #include "json/json.hpp"
//! using namespace conform::json;
//!
//! auto result = parse_json(R"([{"ruleId": "colon-spacing", "line": 3}])");
//! if (is_ok(result)) {
//!     auto& records = unwrap(result);
//!     std::cout << records[0].get("ruleId")->as_string() << "\n";
//! }
//! ```

#pragma once

#include "json/json_error.hpp"
#include "json/json_parser.hpp"
#include "json/json_value.hpp"
