//! # Frontend
//!
//! The collaborator that turns file text into a token stream. The engine
//! only ever talks to the abstract `Frontend`; `SwiftFrontend` is the
//! implementation shipped with the tool.
//!
//! A frontend either produces a complete, full-fidelity token stream or a
//! single `ParseFailure`. Files that fail to parse are never rule-checked.

#ifndef CONFORM_LEXER_FRONTEND_HPP
#define CONFORM_LEXER_FRONTEND_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace conform::lexer {

/// The first syntax error found in a file.
struct ParseFailure {
    std::string message;
    SourceLocation loc;
};

class Frontend {
public:
    virtual ~Frontend() = default;

    /// Tokenizes `source`. Token lexemes view into `source`.
    [[nodiscard]] virtual auto parse(const Source& source) const
        -> Result<std::vector<Token>, ParseFailure> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

/// Lexer plus bracket balancing for Swift-style sources.
///
/// Reports the first lexer error, then the first unbalanced or mismatched
/// `()`, `[]` or `{}`.
class SwiftFrontend : public Frontend {
public:
    [[nodiscard]] auto parse(const Source& source) const
        -> Result<std::vector<Token>, ParseFailure> override;

    [[nodiscard]] auto name() const -> std::string_view override {
        return "swift";
    }
};

} // namespace conform::lexer

#endif // CONFORM_LEXER_FRONTEND_HPP
