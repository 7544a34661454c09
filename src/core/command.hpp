#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "core/token.hpp"

namespace vshell {

enum class RedirectionKind {
    Input,
    Output,
    Append,
    Error,
    ErrorAppend,
};

// A target holding an int is a descriptor duplication request (`2> 1`).
struct Redirection {
    RedirectionKind kind;
    std::variant<std::string, int> target;
    int source_descriptor{1};

    [[nodiscard]] bool targets_descriptor() const noexcept { return std::holds_alternative<int>(target); }
    [[nodiscard]] bool operator==(const Redirection &other) const = default;
};

struct WordPart {
    std::string text;
    Quoting quoting{Quoting::None};
    // Raw variable / command substitution token, expanded at execution time.
    bool substitution{false};

    [[nodiscard]] bool operator==(const WordPart &other) const = default;
};

// One shell word: adjacent tokens with no blank between them, e.g. `"$HOME"/x`.
struct Word {
    std::vector<WordPart> parts;

    [[nodiscard]] std::string text() const {
        std::string joined;
        for (const auto &part : parts) {
            joined += part.text;
        }
        return joined;
    }

    [[nodiscard]] bool operator==(const Word &other) const = default;
};

using EnvironmentMap = std::map<std::string, std::string>;

struct Assignment {
    std::string name;
    std::string value;
    Quoting quoting{Quoting::None};
    // `export X=1`: written after the command name, so it is an operand of
    // the handler rather than part of its environment.
    bool follows_command_name{false};
    // Operand position among the segment's arguments when it follows the name.
    std::size_t argument_index{0};

    [[nodiscard]] bool operator==(const Assignment &other) const = default;
};

struct PipelineSegment {
    std::string command_name;
    std::vector<Word> arguments;
    std::vector<Redirection> redirections;
    std::vector<Assignment> local_environment;

    [[nodiscard]] std::vector<std::string> argument_texts() const {
        std::vector<std::string> texts;
        texts.reserve(arguments.size());
        for (const auto &argument : arguments) {
            texts.push_back(argument.text());
        }
        return texts;
    }
};

struct ParsedCommand {
    std::vector<PipelineSegment> segments;
    bool run_in_background{false};
    std::vector<Assignment> leading_environment;

    [[nodiscard]] bool empty() const noexcept { return segments.empty() && leading_environment.empty(); }
};

enum class ListConnector {
    Always,
    IfSuccess,
    IfFailure,
};

// `connector` decides whether the entry runs, given the previous exit code.
struct CommandListEntry {
    ListConnector connector{ListConnector::Always};
    ParsedCommand command;
};

struct CommandList {
    std::vector<CommandListEntry> entries;

    [[nodiscard]] bool empty() const noexcept { return entries.empty(); }
};

} // namespace vshell
