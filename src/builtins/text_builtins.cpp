#include <algorithm>
#include <cctype>
#include <expected>
#include <format>
#include <optional>
#include <ostream>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "builtins/builtin_support.hpp"
#include "vfs/vfs.hpp"

namespace vshell::builtins {

namespace {

struct Source {
    std::string label;
    std::string data;
};

// Operands as named inputs; no operands (or `-`) means stdin. Unreadable
// files are reported and skipped.
[[nodiscard]] std::vector<Source> read_sources(CommandContext &context, const std::vector<std::string> &operands, int &status) {
    std::vector<Source> sources;

    if (operands.empty()) {
        sources.push_back(Source{.label = "-", .data = context.input});
        return sources;
    }

    for (const auto &operand : operands) {
        if (operand == "-") {
            sources.push_back(Source{.label = "-", .data = context.input});
            continue;
        }

        auto data = context.vfs.read_file(context.resolve_path(operand));
        if (!data) {
            FsError error = data.error();
            error.path = operand;
            status = fail(context, error);
            continue;
        }
        sources.push_back(Source{.label = operand, .data = std::move(*data)});
    }

    return sources;
}

[[nodiscard]] std::string interpret_escapes(std::string_view text, bool &stop) {
    std::string result;

    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            result.push_back(text[i]);
            continue;
        }

        switch (text[++i]) {
        case 'n':
            result.push_back('\n');
            break;
        case 't':
            result.push_back('\t');
            break;
        case 'r':
            result.push_back('\r');
            break;
        case 'a':
            result.push_back('\a');
            break;
        case 'b':
            result.push_back('\b');
            break;
        case 'v':
            result.push_back('\v');
            break;
        case '\\':
            result.push_back('\\');
            break;
        case 'c':
            stop = true;
            return result;
        default:
            result.push_back('\\');
            result.push_back(text[i]);
        }
    }

    return result;
}

int builtin_echo(CommandContext &context) {
    bool newline = true;
    bool escapes = false;

    std::size_t first = 0;
    for (; first < context.args.size(); ++first) {
        const std::string &arg = context.args[first];
        if (arg.size() < 2 || arg.front() != '-' ||
            !std::ranges::all_of(arg.substr(1), [](char c) { return c == 'n' || c == 'e' || c == 'E'; })) {
            break;
        }
        for (const char c : arg.substr(1)) {
            if (c == 'n') {
                newline = false;
            } else {
                escapes = c == 'e';
            }
        }
    }

    std::string line;
    for (std::size_t i = first; i < context.args.size(); ++i) {
        if (i > first) {
            line += ' ';
        }
        line += context.args[i];
    }

    if (escapes) {
        bool stop = false;
        line = interpret_escapes(line, stop);
        if (stop) {
            newline = false;
        }
    }

    context.out << line;
    if (newline) {
        context.out << '\n';
    }
    return 0;
}

int builtin_cat(CommandContext &context) {
    auto options = parse_options(context.args, "nE");
    if (!options) {
        return usage_error(context, options.error());
    }

    int status = 0;
    const auto sources = read_sources(context, options->operands, status);
    const bool number = options->has('n');
    const bool mark_ends = options->has('E');

    if (!number && !mark_ends) {
        for (const auto &source : sources) {
            context.out << source.data;
        }
        return status;
    }

    std::size_t line_number = 0;
    for (const auto &source : sources) {
        const auto lines = split_lines(source.data);
        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (number) {
                context.out << std::format("{:>6}\t", ++line_number);
            }
            context.out << lines[i];
            const bool terminated = i + 1 < lines.size() || source.data.ends_with('\n');
            if (terminated) {
                context.out << (mark_ends ? "$\n" : "\n");
            }
        }
    }

    return status;
}

constexpr std::size_t kMaxPatternLength = 1000;
// The regex engine recurses once per character of the subject.
constexpr std::size_t kMaxRegexLineLength = 2048;

[[nodiscard]] bool is_literal_pattern(std::string_view pattern) noexcept {
    return pattern.find_first_of(".*+?^${}()|[]\\") == std::string_view::npos;
}

// Stacked quantifiers, quantified groups holding a quantifier, and five or
// more unclosed groups.
[[nodiscard]] bool has_unsafe_construct(std::string_view pattern) {
    std::vector<std::size_t> open_groups;
    std::size_t unclosed = 0;

    for (std::size_t i = 0; i < pattern.size(); ++i) {
        const char c = pattern[i];
        if (c == '\\') {
            ++i;
            continue;
        }

        const bool next_is_same = i + 1 < pattern.size() && pattern[i + 1] == c;
        if ((c == '*' || c == '+' || c == '?') && next_is_same) {
            return true;
        }

        if (c == '(') {
            open_groups.push_back(i);
            if (++unclosed >= 5) {
                return true;
            }
        } else if (c == ')') {
            unclosed = 0;
            if (open_groups.empty()) {
                continue;
            }
            const std::size_t start = open_groups.back();
            open_groups.pop_back();

            const std::string_view inner = pattern.substr(start + 1, i - start - 1);
            const bool quantified = i + 1 < pattern.size() && (pattern[i + 1] == '*' || pattern[i + 1] == '+');
            if (quantified && inner.find_first_of("*+") != std::string_view::npos) {
                return true;
            }
        }
    }
    return false;
}

struct LineMatcher {
    std::optional<std::regex> expression;
    std::string literal;
    bool ignore_case{false};

    [[nodiscard]] bool matches(const std::string &line) const {
        if (expression) {
            return std::regex_search(line, *expression);
        }
        if (!ignore_case) {
            return line.find(literal) != std::string::npos;
        }
        const auto same = [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        };
        return literal.empty() || !std::ranges::search(line, literal, same).empty();
    }
};

// Patterns without regex syntax, and unsafe ones, match as plain text.
[[nodiscard]] std::expected<LineMatcher, std::string> make_matcher(const std::string &pattern, bool ignore_case) {
    if (pattern.size() > kMaxPatternLength) {
        return std::unexpected(std::format("pattern too long (max {} characters)", kMaxPatternLength));
    }

    if (is_literal_pattern(pattern) || has_unsafe_construct(pattern)) {
        return LineMatcher{.expression = std::nullopt, .literal = pattern, .ignore_case = ignore_case};
    }

    try {
        auto flags = std::regex::ECMAScript;
        if (ignore_case) {
            flags |= std::regex::icase;
        }
        return LineMatcher{.expression = std::regex(pattern, flags), .literal = {}, .ignore_case = ignore_case};
    } catch (const std::regex_error &e) {
        return std::unexpected(std::format("invalid pattern '{}': {}", pattern, e.what()));
    }
}

int builtin_grep(CommandContext &context) {
    auto options = parse_options(context.args, "ivnc");
    if (!options) {
        return usage_error(context, options.error());
    }
    if (options->operands.empty()) {
        return usage_error(context, "usage: grep [-ivnc] PATTERN [FILE...]");
    }

    const std::string pattern = options->operands.front();
    const std::vector<std::string> files(options->operands.begin() + 1, options->operands.end());

    const auto matcher = make_matcher(pattern, options->has('i'));
    if (!matcher) {
        return usage_error(context, matcher.error());
    }

    int status = 0;
    const auto sources = read_sources(context, files, status);
    const bool prefix = sources.size() > 1;
    bool matched_any = false;

    for (const auto &source : sources) {
        std::size_t count = 0;
        bool aborted = false;
        const auto lines = split_lines(source.data);

        for (std::size_t i = 0; i < lines.size(); ++i) {
            if (matcher->expression && lines[i].size() > kMaxRegexLineLength) {
                status = fail(context,
                              std::format("{}: line {} is longer than {} bytes, use a plain text pattern", source.label, i + 1,
                                          kMaxRegexLineLength),
                              2);
                aborted = true;
                break;
            }

            const bool found = matcher->matches(lines[i]) != options->has('v');
            if (!found) {
                continue;
            }

            ++count;
            if (options->has('c')) {
                continue;
            }
            if (prefix) {
                context.out << source.label << ':';
            }
            if (options->has('n')) {
                context.out << i + 1 << ':';
            }
            context.out << lines[i] << '\n';
        }

        if (options->has('c') && !aborted) {
            if (prefix) {
                context.out << source.label << ':';
            }
            context.out << count << '\n';
        }
        matched_any = matched_any || count > 0;
    }

    if (status != 0) {
        return 2;
    }
    return matched_any ? 0 : 1;
}

struct Counts {
    std::size_t lines{0};
    std::size_t words{0};
    std::size_t bytes{0};
};

[[nodiscard]] Counts count_text(std::string_view text) {
    Counts counts{.lines = 0, .words = 0, .bytes = text.size()};
    bool in_word = false;

    for (const char c : text) {
        if (c == '\n') {
            ++counts.lines;
        }
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            in_word = false;
        } else if (!in_word) {
            in_word = true;
            ++counts.words;
        }
    }

    return counts;
}

int builtin_wc(CommandContext &context) {
    auto options = parse_options(context.args, "lwc");
    if (!options) {
        return usage_error(context, options.error());
    }

    const bool all = options->flags.empty();
    const bool lines = all || options->has('l');
    const bool words = all || options->has('w');
    const bool bytes = all || options->has('c');

    auto print = [&](const Counts &counts, std::string_view label) {
        std::vector<std::string> fields;
        if (lines) {
            fields.push_back(std::format("{:>7}", counts.lines));
        }
        if (words) {
            fields.push_back(std::format("{:>7}", counts.words));
        }
        if (bytes) {
            fields.push_back(std::format("{:>7}", counts.bytes));
        }
        if (!label.empty() && label != "-") {
            fields.emplace_back(label);
        }

        for (std::size_t i = 0; i < fields.size(); ++i) {
            context.out << (i > 0 ? " " : "") << fields[i];
        }
        context.out << '\n';
    };

    int status = 0;
    const auto sources = read_sources(context, options->operands, status);
    Counts total;

    for (const auto &source : sources) {
        const Counts counts = count_text(source.data);
        total.lines += counts.lines;
        total.words += counts.words;
        total.bytes += counts.bytes;
        print(counts, source.label);
    }

    if (sources.size() > 1) {
        print(total, "total");
    }
    return status;
}

int print_edge(CommandContext &context, bool from_end) {
    auto options = parse_options(context.args, "", "n");
    if (!options) {
        return usage_error(context, options.error());
    }

    long count = 10;
    if (auto it = options->values.find('n'); it != options->values.end()) {
        auto parsed = parse_count(it->second);
        if (!parsed) {
            return usage_error(context, std::format("invalid number of lines: '{}'", it->second));
        }
        count = *parsed;
    }

    int status = 0;
    const auto sources = read_sources(context, options->operands, status);
    const bool headers = sources.size() > 1;

    for (std::size_t s = 0; s < sources.size(); ++s) {
        if (headers) {
            context.out << std::format("{}==> {} <==\n", s > 0 ? "\n" : "", sources[s].label);
        }

        const auto lines = split_lines(sources[s].data);
        const auto take = std::min<std::size_t>(static_cast<std::size_t>(count), lines.size());
        const std::size_t begin = from_end ? lines.size() - take : 0;
        for (std::size_t i = begin; i < begin + take; ++i) {
            context.out << lines[i] << '\n';
        }
    }

    return status;
}

int builtin_head(CommandContext &context) { return print_edge(context, false); }

int builtin_tail(CommandContext &context) { return print_edge(context, true); }

} // namespace

void register_text_builtins(CommandRegistry &registry) {
    add_builtin(registry, "echo", "Write arguments to standard output", "echo [-neE] [STRING...]", builtin_echo);
    add_builtin(registry, "cat", "Concatenate files to standard output", "cat [-nE] [FILE...]", builtin_cat);
    add_builtin(registry, "grep", "Print lines matching a pattern", "grep [-ivnc] PATTERN [FILE...]", builtin_grep);
    add_builtin(registry, "wc", "Count lines, words and bytes", "wc [-lwc] [FILE...]", builtin_wc);
    add_builtin(registry, "head", "Print the first lines of input", "head [-n COUNT] [FILE...]", builtin_head);
    add_builtin(registry, "tail", "Print the last lines of input", "tail [-n COUNT] [FILE...]", builtin_tail);
}

} // namespace vshell::builtins
