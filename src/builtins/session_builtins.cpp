#include <algorithm>
#include <charconv>
#include <chrono>
#include <expected>
#include <format>
#include <map>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "builtins/builtin_support.hpp"
#include "core/exit_code.hpp"
#include "core/lexer.hpp"
#include "session/console_session.hpp"
#include "vfs/path.hpp"
#include "vfs/vfs.hpp"

namespace vshell::builtins {

namespace {

// "NAME=value" -> {NAME, value}; no '=' leaves the value empty.
[[nodiscard]] std::pair<std::string, std::optional<std::string>> split_assignment(std::string_view text) {
    const std::size_t equals = text.find('=');
    if (equals == std::string_view::npos) {
        return {std::string(text), std::nullopt};
    }
    return {std::string(text.substr(0, equals)), std::string(text.substr(equals + 1))};
}

[[nodiscard]] std::string quote(std::string_view value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    return quoted + "'";
}

int builtin_env(CommandContext &context) {
    std::vector<std::pair<std::string, std::string>> variables(context.environment.begin(), context.environment.end());
    std::ranges::sort(variables);

    for (const auto &[name, value] : variables) {
        context.out << name << '=' << value << '\n';
    }
    return 0;
}

int builtin_export(CommandContext &context) {
    if (context.args.empty() || context.args.front() == "-p") {
        auto variables = context.session.environment();
        std::vector<std::pair<std::string, std::string>> sorted(variables.begin(), variables.end());
        std::ranges::sort(sorted);
        for (const auto &[name, value] : sorted) {
            context.out << std::format("export {}={}\n", name, quote(value));
        }
        return 0;
    }

    int status = 0;
    for (const auto &arg : context.args) {
        auto [name, value] = split_assignment(arg);
        if (!is_valid_identifier(name)) {
            status = fail(context, std::format("'{}': not a valid identifier", arg));
            continue;
        }

        if (value) {
            context.session.set_environment(name, *value);
        } else if (auto local = context.environment.find(name); local != context.environment.end()) {
            context.session.set_environment(name, local->second);
        } else if (!context.session.get_environment(name)) {
            context.session.set_environment(name, "");
        }
    }
    return status;
}

int builtin_unset(CommandContext &context) {
    int status = 0;
    for (const auto &name : context.args) {
        if (!is_valid_identifier(name)) {
            status = fail(context, std::format("'{}': not a valid identifier", name));
            continue;
        }
        context.session.unset_environment(name);
    }
    return status;
}

void print_alias(CommandContext &context, std::string_view name, const AliasDefinition &definition) {
    context.out << std::format("alias {}={}\n", name, quote(definition.text()));
}

int builtin_alias(CommandContext &context) {
    CommandRegistry &registry = context.session.registry();

    if (context.args.empty()) {
        for (const auto &[name, definition] : registry.aliases()) {
            print_alias(context, name, definition);
        }
        return 0;
    }

    int status = 0;
    for (const auto &arg : context.args) {
        auto [name, value] = split_assignment(arg);

        if (!value) {
            auto definition = registry.find_alias(name);
            if (!definition) {
                status = fail(context, std::format("{}: not found", name));
                continue;
            }
            print_alias(context, name, *definition);
            continue;
        }

        // The value is a command line of its own: first word is the target.
        std::vector<std::string> words;
        for (const auto &token : Lexer{}.tokenize(*value)) {
            if (token.kind == TokenKind::Word || token.kind == TokenKind::QuotedString) {
                words.push_back(token.text);
            }
        }

        if (words.empty()) {
            status = fail(context, std::format("{}: empty alias", name));
            continue;
        }

        const std::string target = words.front();
        words.erase(words.begin());
        if (auto defined = registry.alias(name, target, std::move(words)); !defined) {
            status = fail(context, defined.error().message());
        }
    }
    return status;
}

int builtin_unalias(CommandContext &context) {
    if (context.args.empty()) {
        return usage_error(context, "usage: unalias [-a] NAME...");
    }

    CommandRegistry &registry = context.session.registry();
    if (context.args.front() == "-a") {
        for (const auto &[name, _] : registry.aliases()) {
            (void)registry.unalias(name);
        }
        return 0;
    }

    int status = 0;
    for (const auto &name : context.args) {
        if (auto removed = registry.unalias(name); !removed) {
            status = fail(context, std::format("{}: not found", name));
        }
    }
    return status;
}

int builtin_history(CommandContext &context) {
    ConsoleSession &session = context.session;

    if (!context.args.empty() && context.args[0] == "-c") {
        session.clear_history();
        return 0;
    }

    if (!context.args.empty() && (context.args[0] == "-r" || context.args[0] == "-w")) {
        if (context.args.size() < 2) {
            return fail(context, std::format("{} requires a file argument", context.args[0]));
        }
        const std::string path = context.resolve_path(context.args[1]);

        if (context.args[0] == "-w") {
            std::string data;
            for (const auto &line : session.history().entries()) {
                data += line;
                data += '\n';
            }
            if (auto written = context.vfs.write_file(path, data); !written) {
                return fail(context, written.error());
            }
            return 0;
        }

        auto data = context.vfs.read_file(path);
        if (!data) {
            return fail(context, data.error());
        }
        for (const auto &line : split_lines(*data)) {
            if (!line.empty()) {
                session.add_to_history(line);
            }
        }
        return 0;
    }

    std::size_t limit = session.history().size();
    if (!context.args.empty()) {
        const auto &token = context.args[0];
        std::size_t parsed = 0;
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), parsed);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            return fail(context, "invalid numeric argument");
        }
        limit = parsed;
    }

    session.history().print(context.out, limit);
    return 0;
}

int builtin_help(CommandContext &context) {
    CommandRegistry &registry = context.session.registry();

    if (!context.args.empty()) {
        int status = 0;
        for (const auto &name : context.args) {
            auto handler = registry.get(name);
            if (!handler) {
                status = fail(context, std::format("no help topics match '{}'", name));
                continue;
            }
            context.out << std::format("{}: {}\n    {}\n", handler->name(), handler->usage(), handler->description());
        }
        return status;
    }

    const auto handlers = registry.list();
    std::size_t width = 0;
    for (const auto &handler : handlers) {
        width = std::max(width, handler->name().size());
    }

    context.out << "Available commands:\n";
    for (const auto &handler : handlers) {
        context.out << std::format("  {:<{}}  {}\n", handler->name(), width, handler->description());
    }
    return 0;
}

int builtin_which(CommandContext &context) {
    auto options = parse_options(context.args, "a");
    if (!options) {
        return usage_error(context, options.error());
    }
    if (options->operands.empty()) {
        return fail(context, "missing command name");
    }

    const std::string path_list = context.env("PATH");
    bool all_found = true;

    for (const auto &name : options->operands) {
        std::vector<std::string> found;

        if (context.session.registry().contains(name)) {
            found.push_back(std::format("{}: shell built-in command", name));
        }

        if (found.empty() || options->has('a')) {
            std::size_t start = 0;
            while (start <= path_list.size()) {
                const std::size_t colon = std::min(path_list.find(':', start), path_list.size());
                const std::string directory = path_list.substr(start, colon - start);
                start = colon + 1;
                if (directory.empty()) {
                    continue;
                }

                const std::string candidate = paths::join(directory, name);
                auto node = context.vfs.stat(candidate);
                if (node && node->is_file() && (node->permission_bits & 0111) != 0) {
                    found.push_back(candidate);
                    if (!options->has('a')) {
                        break;
                    }
                }
            }
        }

        if (found.empty()) {
            all_found = false;
            fail(context, std::format("{}: not found", name));
            continue;
        }
        for (const auto &line : found) {
            context.out << line << '\n';
        }
    }

    return all_found ? 0 : 1;
}

int builtin_type(CommandContext &context) {
    if (context.args.empty()) {
        return fail(context, "missing argument");
    }

    CommandRegistry &registry = context.session.registry();
    int status = 0;

    for (const auto &name : context.args) {
        if (auto definition = registry.find_alias(name); definition) {
            context.out << std::format("{} is aliased to `{}'\n", name, definition->text());
            continue;
        }

        auto handler = registry.get_command(name);
        if (!handler) {
            context.out << name << ": not found\n";
            status = 1;
            continue;
        }

        if (handler->kind() == CommandKind::Builtin) {
            context.out << name << " is a shell builtin\n";
        } else {
            context.out << std::format("{} is a {} command\n", name, to_string(handler->kind()));
        }
    }

    return status;
}

int builtin_date(CommandContext &context) {
    auto options = parse_options(context.args, "uIR");
    if (!options) {
        return usage_error(context, options.error());
    }

    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());

    std::string format = "%a %b %e %H:%M:%S UTC %Y";
    if (options->has('I')) {
        format = "%Y-%m-%dT%H:%M:%S+00:00";
    } else if (options->has('R')) {
        format = "%a, %d %b %Y %H:%M:%S +0000";
    }

    for (const auto &operand : options->operands) {
        if (!operand.starts_with('+')) {
            return usage_error(context, std::format("invalid date '{}'", operand));
        }
        format = operand.substr(1);
    }

    if (format.find_first_of("{}") != std::string::npos) {
        return usage_error(context, std::format("invalid format '{}'", format));
    }

    try {
        context.out << std::vformat("{:" + format + "}", std::make_format_args(now)) << '\n';
    } catch (const std::format_error &e) {
        return usage_error(context, std::format("invalid format '{}': {}", format, e.what()));
    }
    return 0;
}

[[nodiscard]] std::expected<long long, std::string> parse_integer(std::string_view text) {
    long long value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::unexpected(std::format("{}: integer expression expected", text));
    }
    return value;
}

[[nodiscard]] std::expected<bool, std::string> evaluate_unary(CommandContext &context, std::string_view op,
                                                              const std::string &operand) {
    if (op == "-z") {
        return operand.empty();
    }
    if (op == "-n") {
        return !operand.empty();
    }

    const std::string path = context.resolve_path(operand);
    if (op == "-L" || op == "-h") {
        auto node = context.vfs.lstat(path);
        return node.has_value() && node->is_symlink();
    }

    auto node = context.vfs.stat(path);
    if (op == "-e") {
        return node.has_value();
    }
    if (op == "-f") {
        return node.has_value() && node->is_file();
    }
    if (op == "-d") {
        return node.has_value() && node->is_directory();
    }
    if (op == "-s") {
        return node.has_value() && node->size_bytes > 0;
    }
    if (op == "-r") {
        return node.has_value() && (node->permission_bits & 0444) != 0;
    }
    if (op == "-w") {
        return node.has_value() && (node->permission_bits & 0222) != 0;
    }
    if (op == "-x") {
        return node.has_value() && (node->permission_bits & 0111) != 0;
    }
    return std::unexpected(std::format("{}: unary operator expected", op));
}

[[nodiscard]] std::expected<bool, std::string> evaluate_binary(CommandContext &context, const std::string &left,
                                                               std::string_view op, const std::string &right) {
    if (op == "=" || op == "==") {
        return left == right;
    }
    if (op == "!=") {
        return left != right;
    }

    if (op == "-nt" || op == "-ot") {
        auto first = context.vfs.stat(context.resolve_path(left));
        auto second = context.vfs.stat(context.resolve_path(right));
        if (!first || !second) {
            return false;
        }
        return op == "-nt" ? first->modified_at > second->modified_at : first->modified_at < second->modified_at;
    }

    static const std::map<std::string_view, bool (*)(long long, long long)> comparisons{
        {"-eq", [](long long a, long long b) { return a == b; }}, {"-ne", [](long long a, long long b) { return a != b; }},
        {"-lt", [](long long a, long long b) { return a < b; }},  {"-le", [](long long a, long long b) { return a <= b; }},
        {"-gt", [](long long a, long long b) { return a > b; }},  {"-ge", [](long long a, long long b) { return a >= b; }},
    };

    auto comparison = comparisons.find(op);
    if (comparison == comparisons.end()) {
        return std::unexpected(std::format("{}: binary operator expected", op));
    }

    auto a = parse_integer(left);
    if (!a) {
        return std::unexpected(a.error());
    }
    auto b = parse_integer(right);
    if (!b) {
        return std::unexpected(b.error());
    }
    return comparison->second(*a, *b);
}

// Up to three words, optionally preceded by `!`.
[[nodiscard]] std::expected<bool, std::string> evaluate_test(CommandContext &context, std::span<const std::string> args) {
    if (!args.empty() && args.front() == "!" && args.size() > 1) {
        auto inner = evaluate_test(context, args.subspan(1));
        if (!inner) {
            return inner;
        }
        return !*inner;
    }

    switch (args.size()) {
    case 0:
        return false;
    case 1:
        return !args[0].empty();
    case 2:
        return evaluate_unary(context, args[0], args[1]);
    case 3:
        return evaluate_binary(context, args[0], args[1], args[2]);
    default:
        return std::unexpected(std::string("too many arguments"));
    }
}

int builtin_test(CommandContext &context) {
    std::span<const std::string> args(context.args);

    if (context.command == "[") {
        if (args.empty() || args.back() != "]") {
            return usage_error(context, "missing ']'");
        }
        args = args.first(args.size() - 1);
    }

    auto result = evaluate_test(context, args);
    if (!result) {
        return usage_error(context, result.error());
    }
    return *result ? exit_code::kSuccess : exit_code::kFailure;
}

int builtin_clear(CommandContext &context) {
    context.out << "\x1b[2J\x1b[H";
    return 0;
}

int builtin_true(CommandContext &) { return exit_code::kSuccess; }

int builtin_false(CommandContext &) { return exit_code::kFailure; }

int builtin_exit(CommandContext &context) {
    if (context.args.size() > 1) {
        return fail(context, "too many arguments");
    }

    int status = context.session.last_exit_code();
    if (!context.args.empty()) {
        const auto &token = context.args.front();
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), status);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            fail(context, std::format("{}: numeric argument required", token));
            context.session.request_exit(exit_code::kInvalidExit);
            return exit_code::kInvalidExit;
        }
        status &= 0xff;
    }

    context.session.request_exit(status);
    return status;
}

} // namespace

void register_session_builtins(CommandRegistry &registry) {
    add_builtin(registry, "env", "Print the environment", "env", builtin_env);
    add_builtin(registry, "export", "Set session environment variables", "export [NAME[=VALUE]...]", builtin_export);
    add_builtin(registry, "unset", "Remove session environment variables", "unset NAME...", builtin_unset);
    add_builtin(registry, "alias", "Define or list aliases", "alias [NAME[='COMMAND ARGS']...]", builtin_alias);
    add_builtin(registry, "unalias", "Remove aliases", "unalias [-a] NAME...", builtin_unalias);
    add_builtin(registry, "history", "Show or edit command history", "history [-c] [-r FILE] [-w FILE] [N]", builtin_history);
    add_builtin(registry, "help", "List commands or show their usage", "help [COMMAND...]", builtin_help);
    add_builtin(registry, "which", "Locate a command", "which [-a] COMMAND...", builtin_which);
    add_builtin(registry, "type", "Describe how a name would be interpreted", "type NAME...", builtin_type);
    add_builtin(registry, "date", "Print the current date and time", "date [-u] [-I | -R] [+FORMAT]", builtin_date);
    add_builtin(registry, "clear", "Clear the terminal screen", "clear", builtin_clear);
    add_builtin(registry, "test", "Evaluate a conditional expression", "test EXPRESSION", builtin_test);
    add_builtin(registry, "[", "Evaluate a conditional expression", "[ EXPRESSION ]", builtin_test);
    add_builtin(registry, "true", "Do nothing, successfully", "true", builtin_true);
    add_builtin(registry, "false", "Do nothing, unsuccessfully", "false", builtin_false);
    add_builtin(registry, "exit", "Leave the shell", "exit [N]", builtin_exit);
}

} // namespace vshell::builtins
