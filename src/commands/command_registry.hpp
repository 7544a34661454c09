#pragma once

#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "commands/command_handler.hpp"

namespace vshell {

enum class RegistryErrorCode {
    AlreadyRegistered,
    NotFound,
    AliasConflict,
    UnknownTarget,
    InvalidName,
};

struct RegistryError {
    RegistryErrorCode code;
    std::string name;

    [[nodiscard]] std::string message() const;
};

struct AliasDefinition {
    std::string target;
    std::vector<std::string> args;

    // "ls -l"
    [[nodiscard]] std::string text() const;
};

class CommandRegistry {
  public:
    CommandRegistry() = default;
    CommandRegistry(const CommandRegistry &) = delete;
    CommandRegistry &operator=(const CommandRegistry &) = delete;

    // Drops an alias with the same name.
    std::expected<void, RegistryError> register_command(std::shared_ptr<CommandHandler> handler);
    std::expected<void, RegistryError> unregister(std::string_view name);

    // Aliases are consulted before commands.
    [[nodiscard]] std::shared_ptr<CommandHandler> get(std::string_view name) const;
    [[nodiscard]] std::shared_ptr<CommandHandler> get_command(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    // Redefining an existing alias replaces it.
    std::expected<void, RegistryError> alias(std::string_view alias_name, std::string_view target_name,
                                             std::vector<std::string> args = {});
    std::expected<void, RegistryError> unalias(std::string_view alias_name);
    [[nodiscard]] std::optional<AliasDefinition> find_alias(std::string_view alias_name) const;
    [[nodiscard]] std::map<std::string, AliasDefinition> aliases() const;

    // Sorted by name.
    [[nodiscard]] std::vector<std::shared_ptr<CommandHandler>> list() const;
    [[nodiscard]] std::vector<std::string> get_completions(std::string_view prefix) const;

    void add_hooks(std::shared_ptr<CommandHooks> hooks);
    [[nodiscard]] std::vector<std::shared_ptr<CommandHooks>> hooks() const;

  private:
    struct AliasEntry {
        AliasDefinition definition;
        std::shared_ptr<CommandHandler> handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<CommandHandler>> commands_;
    std::map<std::string, AliasEntry, std::less<>> aliases_;
    std::vector<std::shared_ptr<CommandHooks>> hooks_;
};

} // namespace vshell
