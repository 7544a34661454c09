#include "builtins/builtin_support.hpp"

#include <charconv>
#include <format>
#include <ostream>
#include <stdexcept>
#include <utility>

namespace vshell::builtins {

std::expected<ParsedOptions, std::string> parse_options(std::span<const std::string> args, std::string_view flags,
                                                        std::string_view valued) {
    ParsedOptions parsed;
    bool options_done = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];

        if (options_done || arg.size() < 2 || arg.front() != '-') {
            parsed.operands.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (valued.contains('n') && parse_count(std::string_view(arg).substr(1)).has_value()) {
            parsed.values['n'] = arg.substr(1);
            continue;
        }

        for (std::size_t j = 1; j < arg.size(); ++j) {
            const char option = arg[j];

            if (valued.contains(option)) {
                if (j + 1 < arg.size()) {
                    parsed.values[option] = arg.substr(j + 1);
                } else if (i + 1 < args.size()) {
                    parsed.values[option] = args[++i];
                } else {
                    return std::unexpected(std::format("option requires an argument -- '{}'", option));
                }
                break;
            }

            if (!flags.contains(option)) {
                return std::unexpected(std::format("invalid option -- '{}'", option));
            }
            parsed.flags.insert(option);
        }
    }

    return parsed;
}

int fail(CommandContext &context, std::string_view message, int status) {
    context.err << context.command << ": " << message << '\n';
    return status;
}

int fail(CommandContext &context, const FsError &error, int status) { return fail(context, error.message(), status); }

int usage_error(CommandContext &context, std::string_view message) { return fail(context, message, 2); }

std::optional<std::uint32_t> parse_octal_mode(std::string_view text) noexcept {
    std::uint32_t mode = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), mode, 8);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || mode > 07777) {
        return std::nullopt;
    }
    return mode;
}

std::optional<long> parse_count(std::string_view text) noexcept {
    long count = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), count);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || count < 0) {
        return std::nullopt;
    }
    return count;
}

std::string human_size(std::uint64_t bytes) {
    constexpr std::string_view units = "KMGT";

    if (bytes < 1024) {
        return std::to_string(bytes);
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    value /= 1024.0;
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    return value < 10.0 ? std::format("{:.1f}{}", value, units[unit]) : std::format("{:.0f}{}", value, units[unit]);
}

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    std::size_t start = 0;

    while (start < text.size()) {
        const std::size_t newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, newline - start));
        start = newline + 1;
    }

    return lines;
}

void add_builtin(CommandRegistry &registry, std::string name, std::string description, std::string usage,
                 FunctionCommand::Body body) {
    auto registered = registry.register_command(
        make_command(std::move(name), CommandKind::Builtin, std::move(description), std::move(usage), std::move(body)));
    if (!registered) {
        throw std::logic_error(registered.error().message());
    }
}

} // namespace vshell::builtins
