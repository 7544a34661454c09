#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <string>

#include "core/command.hpp"
#include "core/token.hpp"

namespace vshell {

struct ParseError {
    std::string message;
    Token offending_token;
    std::size_t position{0};

    // "line 1, column 9: missing redirection target"
    [[nodiscard]] std::string describe() const;
};

class Parser {
  public:
    // Exactly one pipeline, optionally followed by `&`. Anything left over is
    // an error.
    [[nodiscard]] std::expected<ParsedCommand, ParseError> parse(std::span<const Token> tokens) const;

    // Pipelines joined by `;`, `&&`, `||` or newlines.
    [[nodiscard]] std::expected<CommandList, ParseError> parse_list(std::span<const Token> tokens) const;
};

} // namespace vshell
