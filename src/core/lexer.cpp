#include "core/lexer.hpp"

#include <cctype>
#include <string>
#include <utility>

namespace vshell {

namespace {

[[nodiscard]] bool is_blank(char c) noexcept { return c == ' ' || c == '\t' || c == '\r'; }

[[nodiscard]] bool is_identifier_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] bool is_word_delimiter(char c) noexcept {
    switch (c) {
    case ' ':
    case '\t':
    case '\r':
    case '\n':
    case '|':
    case '>':
    case '<':
    case '&':
    case ';':
    case '(':
    case ')':
    case '"':
    case '\'':
    case '$':
    case '`':
    case '\\':
        return true;
    default:
        return false;
    }
}

class Cursor {
  public:
    explicit Cursor(std::string_view input) : input_(input) {}

    [[nodiscard]] bool at_end() const noexcept { return position_ >= input_.size(); }
    [[nodiscard]] char current() const noexcept { return at_end() ? '\0' : input_[position_]; }

    [[nodiscard]] char peek(std::size_t distance = 1) const noexcept {
        const std::size_t index = position_ + distance;
        return index < input_.size() ? input_[index] : '\0';
    }

    void advance() noexcept {
        if (at_end()) {
            return;
        }

        if (input_[position_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++position_;
    }

    [[nodiscard]] std::size_t position() const noexcept { return position_; }
    [[nodiscard]] std::size_t line() const noexcept { return line_; }
    [[nodiscard]] std::size_t column() const noexcept { return column_; }

  private:
    std::string_view input_;
    std::size_t position_{0};
    std::size_t line_{1};
    std::size_t column_{1};
};

class TokenReader {
  public:
    explicit TokenReader(std::string_view input) : cursor_(input) {}

    std::vector<Token> read_all() {
        std::vector<Token> tokens;

        while (true) {
            skip_blanks();
            if (cursor_.at_end()) {
                break;
            }

            begin_token();

            if (cursor_.current() == '#') {
                skip_comment();
                continue;
            }

            tokens.push_back(next_token());
        }

        begin_token();
        tokens.push_back(finish(TokenKind::EndOfInput, ""));
        return tokens;
    }

  private:
    Cursor cursor_;
    std::size_t start_offset_{0};
    std::size_t start_line_{1};
    std::size_t start_column_{1};

    void begin_token() noexcept {
        start_offset_ = cursor_.position();
        start_line_ = cursor_.line();
        start_column_ = cursor_.column();
    }

    [[nodiscard]] Token finish(TokenKind kind, std::string text, Quoting quoting = Quoting::None) const {
        return Token{
            .kind = kind,
            .text = std::move(text),
            .byte_offset = start_offset_,
            .byte_length = cursor_.position() - start_offset_,
            .line = start_line_,
            .column = start_column_,
            .quoting = quoting,
        };
    }

    Token operator_token(TokenKind kind, std::string_view text) {
        for (std::size_t i = 0; i < text.size(); ++i) {
            cursor_.advance();
        }
        return finish(kind, std::string(text));
    }

    // `>&N` and `2>&N` duplicate a descriptor: the `&` joins the operator and
    // the digits that follow become its target.
    Token redirect_token(TokenKind kind, std::string_view text) {
        for (std::size_t i = 0; i < text.size(); ++i) {
            cursor_.advance();
        }

        std::string lexeme(text);
        if (cursor_.current() == '&' && std::isdigit(static_cast<unsigned char>(cursor_.peek())) != 0) {
            cursor_.advance();
            lexeme.push_back('&');
        }
        return finish(kind, std::move(lexeme));
    }

    void skip_blanks() noexcept {
        while (!cursor_.at_end() && is_blank(cursor_.current())) {
            cursor_.advance();
        }
    }

    void skip_comment() noexcept {
        while (!cursor_.at_end() && cursor_.current() != '\n') {
            cursor_.advance();
        }
    }

    Token next_token() {
        const char current = cursor_.current();
        const char next = cursor_.peek();

        switch (current) {
        case '\n':
            return operator_token(TokenKind::Newline, "\n");
        case '"':
        case '\'':
            return read_quoted();
        case '|':
            return next == '|' ? operator_token(TokenKind::Or, "||") : operator_token(TokenKind::Pipe, "|");
        case '&':
            return next == '&' ? operator_token(TokenKind::And, "&&") : operator_token(TokenKind::Background, "&");
        case '>':
            return next == '>' ? operator_token(TokenKind::RedirectAppend, ">>")
                               : redirect_token(TokenKind::RedirectOut, ">");
        case '<':
            return operator_token(TokenKind::RedirectIn, "<");
        case ';':
            return operator_token(TokenKind::Semicolon, ";");
        case '(':
            return operator_token(TokenKind::SubshellOpen, "(");
        case ')':
            return operator_token(TokenKind::SubshellClose, ")");
        case '$':
            return read_variable();
        case '`':
            return read_backquoted();
        case '\\':
            return read_escaped();
        default:
            break;
        }

        if ((current == '1' || current == '2') && next == '>') {
            const bool append = cursor_.peek(2) == '>';
            if (current == '2') {
                return append ? operator_token(TokenKind::RedirectErrAppend, "2>>")
                              : redirect_token(TokenKind::RedirectErr, "2>");
            }
            return append ? operator_token(TokenKind::RedirectAppend, "1>>")
                          : redirect_token(TokenKind::RedirectOut, "1>");
        }

        return read_word();
    }

    // Only the matching quote may be escaped; every other backslash is kept.
    std::string read_quoted_body(char quote) {
        std::string value;
        cursor_.advance();

        while (!cursor_.at_end() && cursor_.current() != quote) {
            if (cursor_.current() == '\\' && cursor_.peek() == quote) {
                cursor_.advance();
            }
            value.push_back(cursor_.current());
            cursor_.advance();
        }

        if (cursor_.current() == quote) {
            cursor_.advance();
        }

        return value;
    }

    Token read_quoted() {
        const char quote = cursor_.current();
        std::string value = read_quoted_body(quote);
        return finish(TokenKind::QuotedString, std::move(value), quote == '\'' ? Quoting::Single : Quoting::Double);
    }

    Token read_escaped() {
        cursor_.advance();
        std::string value;
        if (!cursor_.at_end()) {
            value.push_back(cursor_.current());
            cursor_.advance();
        }
        return finish(TokenKind::QuotedString, std::move(value), Quoting::Single);
    }

    Token read_variable() {
        std::string value{"$"};
        cursor_.advance();

        if (cursor_.current() == '{') {
            while (!cursor_.at_end() && cursor_.current() != '}') {
                value.push_back(cursor_.current());
                cursor_.advance();
            }
            if (cursor_.current() == '}') {
                value.push_back('}');
                cursor_.advance();
            }
            return finish(TokenKind::Variable, std::move(value));
        }

        if (cursor_.current() == '(') {
            int depth = 0;
            while (!cursor_.at_end()) {
                const char c = cursor_.current();
                value.push_back(c);
                cursor_.advance();
                if (c == '(') {
                    ++depth;
                } else if (c == ')' && --depth == 0) {
                    break;
                }
            }
            return finish(TokenKind::Variable, std::move(value));
        }

        if (cursor_.current() == '?') {
            value.push_back('?');
            cursor_.advance();
            return finish(TokenKind::Variable, std::move(value));
        }

        while (!cursor_.at_end() && is_identifier_char(cursor_.current())) {
            value.push_back(cursor_.current());
            cursor_.advance();
        }

        if (value.size() == 1) {
            return finish(TokenKind::Word, std::move(value));
        }

        return finish(TokenKind::Variable, std::move(value));
    }

    Token read_backquoted() {
        std::string value{"`"};
        cursor_.advance();

        while (!cursor_.at_end() && cursor_.current() != '`') {
            value.push_back(cursor_.current());
            cursor_.advance();
        }

        if (cursor_.current() == '`') {
            value.push_back('`');
            cursor_.advance();
        }

        return finish(TokenKind::Variable, std::move(value));
    }

    Token read_word() {
        std::string value;

        while (!cursor_.at_end() && !is_word_delimiter(cursor_.current())) {
            if (cursor_.current() == '=' && is_valid_identifier(value)) {
                cursor_.advance();
                return read_assignment(std::move(value));
            }

            value.push_back(cursor_.current());
            cursor_.advance();
        }

        return finish(TokenKind::Word, std::move(value));
    }

    // NAME=value: the value runs to the next blank or operator. Quoted
    // sections are unwrapped; a value that is one single-quoted section is
    // marked so the expander leaves it alone.
    Token read_assignment(std::string name) {
        std::string text = std::move(name);
        text.push_back('=');

        std::size_t sections = 0;
        bool single_quoted_only = true;

        while (!cursor_.at_end()) {
            const char c = cursor_.current();
            if (is_blank(c) || c == '\n' || c == '|' || c == '>' || c == '<' || c == '&' || c == ';' || c == '(' ||
                c == ')') {
                break;
            }

            ++sections;
            if (c == '"' || c == '\'') {
                single_quoted_only = single_quoted_only && c == '\'';
                text += read_quoted_body(c);
                continue;
            }

            single_quoted_only = false;
            if (c == '\\' && cursor_.peek() != '\0') {
                cursor_.advance();
            }
            text.push_back(cursor_.current());
            cursor_.advance();
        }

        const Quoting quoting = sections == 1 && single_quoted_only ? Quoting::Single : Quoting::None;
        return finish(TokenKind::Assignment, std::move(text), quoting);
    }
};

} // namespace

bool is_valid_identifier(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }

    const auto first = static_cast<unsigned char>(name.front());
    if (std::isalpha(first) == 0 && name.front() != '_') {
        return false;
    }

    for (const char c : name) {
        if (!is_identifier_char(c)) {
            return false;
        }
    }

    return true;
}

std::string_view to_string(TokenKind kind) noexcept {
    switch (kind) {
    case TokenKind::Word:
        return "word";
    case TokenKind::QuotedString:
        return "string";
    case TokenKind::Pipe:
        return "|";
    case TokenKind::RedirectOut:
        return ">";
    case TokenKind::RedirectAppend:
        return ">>";
    case TokenKind::RedirectIn:
        return "<";
    case TokenKind::RedirectErr:
        return "2>";
    case TokenKind::RedirectErrAppend:
        return "2>>";
    case TokenKind::Background:
        return "&";
    case TokenKind::Semicolon:
        return ";";
    case TokenKind::And:
        return "&&";
    case TokenKind::Or:
        return "||";
    case TokenKind::SubshellOpen:
        return "(";
    case TokenKind::SubshellClose:
        return ")";
    case TokenKind::Variable:
        return "variable";
    case TokenKind::Assignment:
        return "assignment";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::EndOfInput:
        return "end of input";
    }

    return "unknown";
}

std::vector<Token> Lexer::tokenize(std::string_view input) const { return TokenReader(input).read_all(); }

} // namespace vshell
