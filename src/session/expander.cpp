#include "session/expander.hpp"

#include <cctype>
#include <iterator>

#include "vfs/glob.hpp"
#include "vfs/path.hpp"
#include "vfs/vfs.hpp"

namespace vshell {

namespace {

[[nodiscard]] bool is_name_start(char c) noexcept { return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_'; }

[[nodiscard]] bool is_name_char(char c) noexcept { return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_'; }

// Index of the `)` closing the `(` at `open`, honoring nesting.
[[nodiscard]] std::size_t find_closing_paren(std::string_view text, std::size_t open) noexcept {
    int depth = 0;
    for (std::size_t i = open; i < text.size(); ++i) {
        if (text[i] == '(') {
            ++depth;
        } else if (text[i] == ')' && --depth == 0) {
            return i;
        }
    }
    return std::string_view::npos;
}

[[nodiscard]] std::vector<std::string> split_fields(std::string_view text) {
    std::vector<std::string> fields;
    std::size_t i = 0;

    while (i < text.size()) {
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
            ++i;
        }
        const std::size_t start = i;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) == 0) {
            ++i;
        }
        if (i > start) {
            fields.emplace_back(text.substr(start, i - start));
        }
    }

    return fields;
}

} // namespace

std::string Expander::variable(std::string_view name) const {
    auto it = scope_.environment.find(std::string(name));
    return it == scope_.environment.end() ? std::string{} : it->second;
}

std::string Expander::run_substitution(std::string_view body) const {
    if (!scope_.substitute) {
        return {};
    }

    std::string output = scope_.substitute(body);
    while (!output.empty() && output.back() == '\n') {
        output.pop_back();
    }
    return output;
}

std::string Expander::expand_tilde(std::string_view text) const {
    if (text == "~") {
        return scope_.home;
    }
    if (text.starts_with("~/")) {
        return scope_.home + std::string(text.substr(1));
    }
    return std::string(text);
}

std::string Expander::expand_text(std::string_view text) const {
    std::string result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];

        if (c == '\\' && i + 1 < text.size() && (text[i + 1] == '$' || text[i + 1] == '`' || text[i + 1] == '\\')) {
            result.push_back(text[i + 1]);
            i += 2;
            continue;
        }

        if (c == '`') {
            const std::size_t close = text.find('`', i + 1);
            if (close == std::string_view::npos) {
                result.append(text.substr(i));
                break;
            }
            result += run_substitution(text.substr(i + 1, close - i - 1));
            i = close + 1;
            continue;
        }

        if (c != '$' || i + 1 == text.size()) {
            result.push_back(c);
            ++i;
            continue;
        }

        const char next = text[i + 1];
        if (next == '{') {
            const std::size_t close = text.find('}', i + 2);
            if (close == std::string_view::npos) {
                result.append(text.substr(i));
                break;
            }

            const std::string_view inner = text.substr(i + 2, close - i - 2);
            const std::size_t fallback = inner.find(":-");
            if (fallback == std::string_view::npos) {
                result += variable(inner);
            } else {
                std::string value = variable(inner.substr(0, fallback));
                result += value.empty() ? expand_text(inner.substr(fallback + 2)) : value;
            }
            i = close + 1;
        } else if (next == '(') {
            const std::size_t close = find_closing_paren(text, i + 1);
            if (close == std::string_view::npos) {
                result.append(text.substr(i));
                break;
            }
            result += run_substitution(text.substr(i + 2, close - i - 2));
            i = close + 1;
        } else if (next == '?') {
            result += std::to_string(scope_.last_exit_code);
            i += 2;
        } else if (is_name_start(next)) {
            std::size_t end = i + 1;
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }
            result += variable(text.substr(i + 1, end - i - 1));
            i = end;
        } else {
            result.push_back(c);
            ++i;
        }
    }

    return result;
}

std::vector<std::string> Expander::expand_glob(const std::string &pattern) const {
    if (scope_.vfs == nullptr) {
        return {};
    }

    auto matches = scope_.vfs->glob(paths::resolve_from(scope_.cwd, pattern), "/");
    if (pattern.starts_with('/')) {
        return matches;
    }

    for (auto &match : matches) {
        if (match != scope_.cwd && paths::is_within(match, scope_.cwd)) {
            match = paths::relative_to(match, scope_.cwd).substr(1);
        }
    }
    return matches;
}

std::vector<std::string> Expander::expand_word(const Word &word) const {
    if (word.parts.size() == 1 && word.parts.front().substitution && word.parts.front().quoting == Quoting::None) {
        return split_fields(expand_text(word.parts.front().text));
    }

    std::string text;
    bool globbable = false;

    for (std::size_t i = 0; i < word.parts.size(); ++i) {
        const WordPart &part = word.parts[i];

        switch (part.quoting) {
        case Quoting::Single:
            text += part.text;
            break;
        case Quoting::Double:
            text += expand_text(part.text);
            break;
        case Quoting::None:
            if (part.substitution) {
                text += expand_text(part.text);
                break;
            }
            text += i == 0 ? expand_tilde(part.text) : part.text;
            globbable = globbable || has_wildcard(part.text);
            break;
        }
    }

    if (globbable) {
        auto matches = expand_glob(text);
        if (!matches.empty()) {
            return matches;
        }
    }

    return {text};
}

std::vector<std::string> Expander::expand_words(const std::vector<Word> &words) const {
    std::vector<std::string> fields;
    for (const auto &word : words) {
        auto expanded = expand_word(word);
        fields.insert(fields.end(), std::make_move_iterator(expanded.begin()), std::make_move_iterator(expanded.end()));
    }
    return fields;
}

std::string Expander::expand_assignment(const Assignment &assignment) const {
    if (assignment.quoting == Quoting::Single) {
        return assignment.value;
    }
    return expand_text(expand_tilde(assignment.value));
}

} // namespace vshell
