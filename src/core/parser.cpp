#include "core/parser.hpp"

#include <algorithm>
#include <charconv>
#include <format>
#include <optional>
#include <utility>
#include <vector>

namespace vshell {

namespace {

[[nodiscard]] std::optional<RedirectionKind> redirection_from_token(TokenKind kind) {
    switch (kind) {
    case TokenKind::RedirectOut:
        return RedirectionKind::Output;
    case TokenKind::RedirectAppend:
        return RedirectionKind::Append;
    case TokenKind::RedirectIn:
        return RedirectionKind::Input;
    case TokenKind::RedirectErr:
        return RedirectionKind::Error;
    case TokenKind::RedirectErrAppend:
        return RedirectionKind::ErrorAppend;
    default:
        return std::nullopt;
    }
}

[[nodiscard]] int source_descriptor_for(RedirectionKind kind) {
    switch (kind) {
    case RedirectionKind::Input:
        return 0;
    case RedirectionKind::Output:
    case RedirectionKind::Append:
        return 1;
    case RedirectionKind::Error:
    case RedirectionKind::ErrorAppend:
        return 2;
    }

    return 1;
}

[[nodiscard]] std::optional<int> parse_descriptor(std::string_view text) {
    int value = 0;
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);

    if (text.empty() || ec != std::errc{} || ptr != last || value < 0) {
        return std::nullopt;
    }

    return value;
}

[[nodiscard]] bool ends_segment(TokenKind kind) {
    switch (kind) {
    case TokenKind::Pipe:
    case TokenKind::Background:
    case TokenKind::Semicolon:
    case TokenKind::And:
    case TokenKind::Or:
    case TokenKind::Newline:
    case TokenKind::EndOfInput:
        return true;
    default:
        return false;
    }
}

[[nodiscard]] bool is_word_like(TokenKind kind) { return kind == TokenKind::Word || kind == TokenKind::QuotedString; }

[[nodiscard]] Assignment split_assignment(const Token &token, bool follows_command_name) {
    const auto equal = token.text.find('=');
    return Assignment{
        .name = token.text.substr(0, equal),
        .value = equal == std::string::npos ? std::string{} : token.text.substr(equal + 1),
        .quoting = token.quoting,
        .follows_command_name = follows_command_name,
    };
}

class PipelineReader {
  public:
    explicit PipelineReader(std::span<const Token> tokens) : tokens_(tokens) {}

    std::expected<ParsedCommand, ParseError> read() {
        ParsedCommand command;

        while (current().kind == TokenKind::Assignment) {
            command.leading_environment.push_back(split_assignment(current(), false));
            advance();
        }

        if (current().kind != TokenKind::EndOfInput) {
            auto segment = read_segment();
            if (!segment.has_value()) {
                return std::unexpected(std::move(segment.error()));
            }
            command.segments.push_back(std::move(*segment));

            while (current().kind == TokenKind::Pipe) {
                advance();
                auto next = read_segment();
                if (!next.has_value()) {
                    return std::unexpected(std::move(next.error()));
                }
                command.segments.push_back(std::move(*next));
            }

            if (current().kind == TokenKind::Background) {
                command.run_in_background = true;
                advance();
            }
        }

        if (current().kind != TokenKind::EndOfInput) {
            return std::unexpected(error_here(std::format("syntax error near unexpected token `{}'", current().text)));
        }

        return command;
    }

  private:
    std::span<const Token> tokens_;
    std::size_t index_{0};

    [[nodiscard]] const Token &current() const { return tokens_[std::min(index_, tokens_.size() - 1)]; }

    void advance() {
        if (index_ + 1 < tokens_.size()) {
            ++index_;
        }
    }

    [[nodiscard]] bool next_is_adjacent() const {
        if (index_ + 1 >= tokens_.size()) {
            return false;
        }
        return tokens_[index_ + 1].byte_offset == current().byte_end() && current().kind != TokenKind::EndOfInput;
    }

    [[nodiscard]] ParseError error_here(std::string message) const {
        return ParseError{.message = std::move(message), .offending_token = current(), .position = current().byte_offset};
    }

    // Consumes a run of adjacent word, string and variable tokens.
    Word read_word(bool allow_substitution) {
        Word word;

        while (true) {
            const Token &token = current();
            word.parts.push_back(WordPart{
                .text = token.text,
                .quoting = token.quoting,
                .substitution = token.kind == TokenKind::Variable,
            });

            if (!next_is_adjacent()) {
                advance();
                break;
            }

            const TokenKind next_kind = tokens_[index_ + 1].kind;
            const bool joinable = is_word_like(next_kind) || (allow_substitution && next_kind == TokenKind::Variable);
            advance();
            if (!joinable) {
                break;
            }
        }

        return word;
    }

    std::expected<PipelineSegment, ParseError> read_segment() {
        PipelineSegment segment;

        while (current().kind == TokenKind::Assignment) {
            segment.local_environment.push_back(split_assignment(current(), false));
            advance();
        }

        if (!is_word_like(current().kind)) {
            return std::unexpected(error_here("expected command name"));
        }

        segment.command_name = read_word(false).text();

        while (!ends_segment(current().kind)) {
            const Token &token = current();

            if (const auto redirection = redirection_from_token(token.kind); redirection.has_value()) {
                advance();
                if (!is_word_like(current().kind)) {
                    return std::unexpected(error_here(std::format("missing target for `{}'", token.text)));
                }

                const std::string target = read_word(false).text();
                Redirection parsed{.kind = *redirection, .target = target, .source_descriptor = source_descriptor_for(*redirection)};
                if (const auto descriptor = parse_descriptor(target); descriptor.has_value()) {
                    parsed.target = *descriptor;
                }
                segment.redirections.push_back(std::move(parsed));
                continue;
            }

            if (token.kind == TokenKind::Assignment) {
                Assignment operand = split_assignment(token, true);
                operand.argument_index = segment.arguments.size();
                segment.local_environment.push_back(std::move(operand));
                advance();
                continue;
            }

            if (is_word_like(token.kind) || token.kind == TokenKind::Variable) {
                segment.arguments.push_back(read_word(true));
                continue;
            }

            break;
        }

        return segment;
    }
};

[[nodiscard]] bool separates_list(TokenKind kind) {
    return kind == TokenKind::Semicolon || kind == TokenKind::And || kind == TokenKind::Or ||
           kind == TokenKind::Newline;
}

[[nodiscard]] ListConnector connector_for(TokenKind kind) {
    switch (kind) {
    case TokenKind::And:
        return ListConnector::IfSuccess;
    case TokenKind::Or:
        return ListConnector::IfFailure;
    default:
        return ListConnector::Always;
    }
}

} // namespace

std::string ParseError::describe() const {
    return std::format("line {}, column {}: {}", offending_token.line, offending_token.column, message);
}

std::expected<ParsedCommand, ParseError> Parser::parse(std::span<const Token> tokens) const {
    if (tokens.empty()) {
        return ParsedCommand{};
    }

    return PipelineReader(tokens).read();
}

std::expected<CommandList, ParseError> Parser::parse_list(std::span<const Token> tokens) const {
    CommandList list;
    std::vector<Token> pending;
    ListConnector connector = ListConnector::Always;
    const Token *pending_operator = nullptr;

    auto flush = [&](const Token &terminator) -> std::expected<void, ParseError> {
        if (pending.empty()) {
            if (pending_operator != nullptr) {
                const Token &offending = terminator.kind == TokenKind::EndOfInput ? *pending_operator : terminator;
                return std::unexpected(ParseError{
                    .message = std::format("syntax error near unexpected token `{}'", offending.text),
                    .offending_token = offending,
                    .position = offending.byte_offset,
                });
            }
            return {};
        }

        Token end = terminator;
        end.kind = TokenKind::EndOfInput;
        end.text.clear();
        end.byte_length = 0;
        pending.push_back(std::move(end));

        auto parsed = parse(pending);
        pending.clear();
        if (!parsed.has_value()) {
            return std::unexpected(std::move(parsed.error()));
        }

        list.entries.push_back(CommandListEntry{.connector = connector, .command = std::move(*parsed)});
        connector = ListConnector::Always;
        pending_operator = nullptr;
        return {};
    };

    for (const auto &token : tokens) {
        if (token.kind == TokenKind::EndOfInput) {
            if (auto flushed = flush(token); !flushed.has_value()) {
                return std::unexpected(std::move(flushed.error()));
            }
            break;
        }

        if (token.kind == TokenKind::Background) {
            pending.push_back(token);
            if (auto flushed = flush(token); !flushed.has_value()) {
                return std::unexpected(std::move(flushed.error()));
            }
            continue;
        }

        if (!separates_list(token.kind)) {
            pending.push_back(token);
            continue;
        }

        if (token.kind == TokenKind::Newline && pending.empty()) {
            continue;
        }

        const bool conditional = token.kind == TokenKind::And || token.kind == TokenKind::Or;
        if (conditional && pending.empty()) {
            return std::unexpected(ParseError{
                .message = std::format("syntax error near unexpected token `{}'", token.text),
                .offending_token = token,
                .position = token.byte_offset,
            });
        }

        if (auto flushed = flush(token); !flushed.has_value()) {
            return std::unexpected(std::move(flushed.error()));
        }

        if (conditional) {
            connector = connector_for(token.kind);
            pending_operator = &token;
        }
    }

    return list;
}

} // namespace vshell
