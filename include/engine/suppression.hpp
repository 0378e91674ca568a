//! # Inline Suppressions
//!
//! Line comments that silence rules for one line:
//!
//! ```swift
//! // conform:disable-next-line force-unwrap, line-length
//! let value = cache[key]!
//! let x=5 // conform:disable-line operator-spacing
//! ```
//!
//! `all` silences every rule. A violation is suppressed when the line it
//! starts on is covered.

#ifndef CONFORM_ENGINE_SUPPRESSION_HPP
#define CONFORM_ENGINE_SUPPRESSION_HPP

#include "model/source_model.hpp"

#include <map>
#include <set>
#include <string>
#include <string_view>

namespace conform::engine {

class Suppressions {
public:
    [[nodiscard]] static auto scan(const model::SourceModel& model) -> Suppressions;

    [[nodiscard]] auto is_suppressed(std::string_view rule_id, uint32_t line) const -> bool;

    [[nodiscard]] auto empty() const -> bool {
        return lines_.empty();
    }

private:
    std::map<uint32_t, std::set<std::string, std::less<>>> lines_;
};

} // namespace conform::engine

#endif // CONFORM_ENGINE_SUPPRESSION_HPP
