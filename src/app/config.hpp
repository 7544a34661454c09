#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "core/logger.hpp"
#include "vfs/storage_provider.hpp"

namespace vshell {

struct ShellConfig {
    std::string user{"user"};
    std::string group{"user"};
    std::string home{"/home/user"};
    // Empty means the home directory.
    std::string cwd;
    std::size_t history_capacity{1000};
    std::string prompt{"$ "};
    bool persist{true};
    std::filesystem::path state_file{".vshell_state"};
    LogLevel log_level{LogLevel::Warn};
    ProviderKind root_provider{ProviderKind::Memory};
    // Set by `-c`: run this line and exit instead of starting the REPL.
    std::optional<std::string> command;
    bool show_usage{false};

    [[nodiscard]] const std::string &initial_directory() const noexcept { return cwd.empty() ? home : cwd; }
};

using EnvironmentReader = std::function<std::optional<std::string>(std::string_view)>;

// Reads the host process environment.
[[nodiscard]] EnvironmentReader process_environment();

// Defaults, then VSHELL_* environment variables, then command-line flags;
// later sources win. `args` excludes the program name.
[[nodiscard]] std::expected<ShellConfig, std::string> load_config(std::span<const std::string> args,
                                                                  const EnvironmentReader &environment);

[[nodiscard]] std::string usage_text(std::string_view program);

} // namespace vshell
