#pragma once

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "commands/command_handler.hpp"
#include "commands/command_registry.hpp"
#include "vfs/fs_error.hpp"

namespace vshell::builtins {

struct ParsedOptions {
    std::set<char> flags;
    std::map<char, std::string> values;
    std::vector<std::string> operands;

    [[nodiscard]] bool has(char flag) const { return flags.contains(flag); }
};

// Short options only: `-la`, `-n 5`, `-n5`, `--` ends options and a lone `-`
// is an operand. `valued` lists options that take an argument; when it holds
// 'n', `-20` is read as `-n 20`.
[[nodiscard]] std::expected<ParsedOptions, std::string> parse_options(std::span<const std::string> args, std::string_view flags,
                                                                      std::string_view valued = {});

// Writes "<command>: <message>" to stderr and returns `status`.
int fail(CommandContext &context, std::string_view message, int status = 1);
int fail(CommandContext &context, const FsError &error, int status = 1);
// Option errors, with exit code 2.
int usage_error(CommandContext &context, std::string_view message);

[[nodiscard]] std::optional<std::uint32_t> parse_octal_mode(std::string_view text) noexcept;
[[nodiscard]] std::optional<long> parse_count(std::string_view text) noexcept;

// 1.5K, 12M
[[nodiscard]] std::string human_size(std::uint64_t bytes);

[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

// Throws std::logic_error when the name is already taken.
void add_builtin(CommandRegistry &registry, std::string name, std::string description, std::string usage,
                 FunctionCommand::Body body);

void register_filesystem_builtins(CommandRegistry &registry);
void register_text_builtins(CommandRegistry &registry);
void register_session_builtins(CommandRegistry &registry);

} // namespace vshell::builtins
