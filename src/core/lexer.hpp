#pragma once

#include <string_view>
#include <vector>

#include "core/token.hpp"

namespace vshell {

class Lexer {
  public:
    // Never fails: unterminated quotes and stray operators degrade to
    // best-effort tokens. The result always ends with EndOfInput.
    [[nodiscard]] std::vector<Token> tokenize(std::string_view input) const;
};

[[nodiscard]] bool is_valid_identifier(std::string_view name) noexcept;

} // namespace vshell
