#include "app/config.hpp"

#include <charconv>
#include <cstdlib>
#include <format>
#include <utility>

#include "vfs/path.hpp"

namespace vshell {

namespace {

[[nodiscard]] std::expected<std::size_t, std::string> parse_size(std::string_view source, std::string_view text) {
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return std::unexpected(std::format("{}: invalid history size '{}'", source, text));
    }
    return value;
}

[[nodiscard]] std::expected<LogLevel, std::string> parse_level(std::string_view source, std::string_view text) {
    auto level = log_level_from_string(text);
    if (!level) {
        return std::unexpected(std::format("{}: unknown log level '{}'", source, text));
    }
    return *level;
}

std::expected<void, std::string> apply_environment(ShellConfig &config, const EnvironmentReader &environment) {
    if (auto host_home = environment("HOME"); host_home && !host_home->empty()) {
        config.state_file = std::filesystem::path(*host_home) / ".vshell_state";
    }

    if (auto user = environment("VSHELL_USER"); user && !user->empty()) {
        config.user = *user;
        config.group = *user;
        config.home = "/home/" + *user;
    }
    if (auto home = environment("VSHELL_HOME"); home && !home->empty()) {
        config.home = paths::resolve(*home);
    }
    if (auto size = environment("VSHELL_HISTORY_SIZE"); size) {
        auto parsed = parse_size("VSHELL_HISTORY_SIZE", *size);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.history_capacity = *parsed;
    }
    if (auto file = environment("VSHELL_STATE_FILE"); file && !file->empty()) {
        config.state_file = *file;
    }
    if (auto level = environment("VSHELL_LOG_LEVEL"); level) {
        auto parsed = parse_level("VSHELL_LOG_LEVEL", *level);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        config.log_level = *parsed;
    }
    if (auto prompt = environment("VSHELL_PROMPT"); prompt) {
        config.prompt = *prompt;
    }
    return {};
}

} // namespace

EnvironmentReader process_environment() {
    return [](std::string_view name) -> std::optional<std::string> {
        const char *value = std::getenv(std::string(name).c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::expected<ShellConfig, std::string> load_config(std::span<const std::string> args, const EnvironmentReader &environment) {
    ShellConfig config;

    if (auto applied = apply_environment(config, environment); !applied) {
        return std::unexpected(applied.error());
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string &arg = args[i];

        auto value = [&]() -> std::expected<std::string, std::string> {
            if (i + 1 >= args.size()) {
                return std::unexpected(std::format("{} requires an argument", arg));
            }
            return args[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.show_usage = true;
        } else if (arg == "--no-persist") {
            config.persist = false;
        } else if (arg == "-c" || arg == "--state-file" || arg == "--log-level" || arg == "--history-size") {
            auto text = value();
            if (!text) {
                return std::unexpected(text.error());
            }

            if (arg == "-c") {
                config.command = std::move(*text);
            } else if (arg == "--state-file") {
                config.state_file = *text;
            } else if (arg == "--log-level") {
                auto level = parse_level(arg, *text);
                if (!level) {
                    return std::unexpected(level.error());
                }
                config.log_level = *level;
            } else {
                auto size = parse_size(arg, *text);
                if (!size) {
                    return std::unexpected(size.error());
                }
                config.history_capacity = *size;
            }
        } else {
            return std::unexpected(std::format("unknown option '{}'", arg));
        }
    }

    return config;
}

std::string usage_text(std::string_view program) {
    return std::format("usage: {} [-c COMMAND] [--state-file PATH] [--log-level LEVEL] [--history-size N] [--no-persist]\n",
                       program);
}

} // namespace vshell
