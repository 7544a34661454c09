#include "commands/command_registry.hpp"

#include <algorithm>
#include <format>
#include <utility>

#include "core/exit_code.hpp"

namespace vshell {

namespace {

// Runs the target command with the alias's own arguments in front.
class AliasCommand final : public CommandHandler {
  public:
    AliasCommand(const CommandRegistry &registry, std::string name, AliasDefinition definition)
        : registry_(registry), name_(std::move(name)), definition_(std::move(definition)),
          description_(std::format("alias for `{}'", definition_.text())) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] CommandKind kind() const noexcept override { return CommandKind::Alias; }
    [[nodiscard]] std::string_view description() const noexcept override { return description_; }
    [[nodiscard]] std::string_view usage() const noexcept override { return name_; }

    int execute(CommandContext &context) override {
        auto target = registry_.get_command(definition_.target);
        if (!target) {
            context.err << std::format("{}: {}: command not found\n", name_, definition_.target);
            return exit_code::kNotFound;
        }

        context.args.insert(context.args.begin(), definition_.args.begin(), definition_.args.end());
        context.command = definition_.target;
        return target->execute(context);
    }

  private:
    const CommandRegistry &registry_;
    std::string name_;
    AliasDefinition definition_;
    std::string description_;
};

} // namespace

std::string RegistryError::message() const {
    switch (code) {
    case RegistryErrorCode::AlreadyRegistered:
        return std::format("{}: command already registered", name);
    case RegistryErrorCode::NotFound:
        return std::format("{}: not found", name);
    case RegistryErrorCode::AliasConflict:
        return std::format("{}: name is already a command", name);
    case RegistryErrorCode::UnknownTarget:
        return std::format("{}: unknown command", name);
    case RegistryErrorCode::InvalidName:
        return std::format("`{}': invalid name", name);
    }
    return name;
}

std::string AliasDefinition::text() const {
    std::string result = target;
    for (const auto &arg : args) {
        result += ' ';
        result += arg;
    }
    return result;
}

std::expected<void, RegistryError> CommandRegistry::register_command(std::shared_ptr<CommandHandler> handler) {
    if (!handler || handler->name().empty()) {
        return std::unexpected(RegistryError{.code = RegistryErrorCode::InvalidName, .name = {}});
    }

    std::lock_guard lock(mutex_);
    std::string name(handler->name());
    if (commands_.contains(name)) {
        return std::unexpected(RegistryError{.code = RegistryErrorCode::AlreadyRegistered, .name = std::move(name)});
    }

    // A command registered later wins over an alias of the same name.
    if (auto shadowing = aliases_.find(name); shadowing != aliases_.end()) {
        aliases_.erase(shadowing);
    }

    commands_.emplace(std::move(name), std::move(handler));
    return {};
}

std::expected<void, RegistryError> CommandRegistry::unregister(std::string_view name) {
    std::lock_guard lock(mutex_);
    if (commands_.erase(std::string(name)) == 0) {
        return std::unexpected(RegistryError{.code = RegistryErrorCode::NotFound, .name = std::string(name)});
    }
    return {};
}

std::shared_ptr<CommandHandler> CommandRegistry::get(std::string_view name) const {
    std::lock_guard lock(mutex_);
    if (auto alias = aliases_.find(name); alias != aliases_.end()) {
        return alias->second.handler;
    }

    auto it = commands_.find(std::string(name));
    return it == commands_.end() ? nullptr : it->second;
}

std::shared_ptr<CommandHandler> CommandRegistry::get_command(std::string_view name) const {
    std::lock_guard lock(mutex_);
    auto it = commands_.find(std::string(name));
    return it == commands_.end() ? nullptr : it->second;
}

bool CommandRegistry::contains(std::string_view name) const { return get(name) != nullptr; }

std::expected<void, RegistryError> CommandRegistry::alias(std::string_view alias_name, std::string_view target_name,
                                                          std::vector<std::string> args) {
    if (alias_name.empty() || alias_name.find_first_of(" \t/=") != std::string_view::npos) {
        return std::unexpected(RegistryError{.code = RegistryErrorCode::InvalidName, .name = std::string(alias_name)});
    }

    std::lock_guard lock(mutex_);
    if (commands_.contains(std::string(alias_name))) {
        return std::unexpected(RegistryError{.code = RegistryErrorCode::AliasConflict, .name = std::string(alias_name)});
    }

    AliasDefinition definition{.target = std::string(target_name), .args = std::move(args)};

    // An alias of an alias is flattened onto the underlying command.
    if (auto chained = aliases_.find(target_name); chained != aliases_.end()) {
        const AliasDefinition &inner = chained->second.definition;
        definition.args.insert(definition.args.begin(), inner.args.begin(), inner.args.end());
        definition.target = inner.target;
    }

    if (!commands_.contains(definition.target)) {
        return std::unexpected(RegistryError{.code = RegistryErrorCode::UnknownTarget, .name = std::string(target_name)});
    }

    auto handler = std::make_shared<AliasCommand>(*this, std::string(alias_name), definition);
    aliases_.insert_or_assign(std::string(alias_name), AliasEntry{.definition = std::move(definition), .handler = std::move(handler)});
    return {};
}

std::expected<void, RegistryError> CommandRegistry::unalias(std::string_view alias_name) {
    std::lock_guard lock(mutex_);
    auto it = aliases_.find(alias_name);
    if (it == aliases_.end()) {
        return std::unexpected(RegistryError{.code = RegistryErrorCode::NotFound, .name = std::string(alias_name)});
    }
    aliases_.erase(it);
    return {};
}

std::optional<AliasDefinition> CommandRegistry::find_alias(std::string_view alias_name) const {
    std::lock_guard lock(mutex_);
    auto it = aliases_.find(alias_name);
    if (it == aliases_.end()) {
        return std::nullopt;
    }
    return it->second.definition;
}

std::map<std::string, AliasDefinition> CommandRegistry::aliases() const {
    std::lock_guard lock(mutex_);
    std::map<std::string, AliasDefinition> result;
    for (const auto &[name, entry] : aliases_) {
        result.emplace(name, entry.definition);
    }
    return result;
}

std::vector<std::shared_ptr<CommandHandler>> CommandRegistry::list() const {
    std::lock_guard lock(mutex_);

    std::vector<std::shared_ptr<CommandHandler>> handlers;
    handlers.reserve(commands_.size());
    for (const auto &[_, handler] : commands_) {
        handlers.push_back(handler);
    }

    std::ranges::sort(handlers, {}, [](const auto &handler) { return handler->name(); });
    return handlers;
}

std::vector<std::string> CommandRegistry::get_completions(std::string_view prefix) const {
    std::lock_guard lock(mutex_);

    std::vector<std::string> matches;
    for (const auto &[name, _] : commands_) {
        if (name.starts_with(prefix)) {
            matches.push_back(name);
        }
    }
    for (const auto &[name, _] : aliases_) {
        if (name.starts_with(prefix)) {
            matches.push_back(name);
        }
    }

    std::ranges::sort(matches);
    const auto [first, last] = std::ranges::unique(matches);
    matches.erase(first, last);
    return matches;
}

void CommandRegistry::add_hooks(std::shared_ptr<CommandHooks> hooks) {
    if (!hooks) {
        return;
    }
    std::lock_guard lock(mutex_);
    hooks_.push_back(std::move(hooks));
}

std::vector<std::shared_ptr<CommandHooks>> CommandRegistry::hooks() const {
    std::lock_guard lock(mutex_);
    return hooks_;
}

} // namespace vshell
