#include "commands/command_handler.hpp"

#include "vfs/path.hpp"

namespace vshell {

std::string_view to_string(CommandKind kind) noexcept {
    switch (kind) {
    case CommandKind::Builtin:
        return "builtin";
    case CommandKind::External:
        return "external";
    case CommandKind::Alias:
        return "alias";
    case CommandKind::Function:
        return "function";
    }
    return "builtin";
}

std::string CommandContext::resolve_path(std::string_view path) const { return paths::resolve_from(cwd, path); }

std::string CommandContext::env(std::string_view name, std::string_view fallback) const {
    auto it = environment.find(std::string(name));
    return it == environment.end() ? std::string(fallback) : it->second;
}

std::shared_ptr<CommandHandler> make_command(std::string name, CommandKind kind, std::string description, std::string usage,
                                             FunctionCommand::Body body) {
    return std::make_shared<FunctionCommand>(std::move(name), kind, std::move(description), std::move(usage), std::move(body));
}

} // namespace vshell
