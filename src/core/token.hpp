#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace vshell {

enum class TokenKind {
    Word,
    QuotedString,
    Pipe,
    RedirectOut,
    RedirectAppend,
    RedirectIn,
    RedirectErr,
    RedirectErrAppend,
    Background,
    Semicolon,
    And,
    Or,
    SubshellOpen,
    SubshellClose,
    Variable,
    Assignment,
    Newline,
    EndOfInput,
};

enum class Quoting {
    None,
    Single,
    Double,
};

// `byte_length` spans the raw input the token was read from, quotes included,
// so adjacent tokens can be glued back into one shell word.
struct Token {
    TokenKind kind;
    std::string text;
    std::size_t byte_offset{0};
    std::size_t byte_length{0};
    std::size_t line{1};
    std::size_t column{1};
    Quoting quoting{Quoting::None};

    [[nodiscard]] std::size_t byte_end() const noexcept { return byte_offset + byte_length; }
    [[nodiscard]] bool operator==(const Token &other) const = default;
};

[[nodiscard]] std::string_view to_string(TokenKind kind) noexcept;

} // namespace vshell
