#include "commands/logging_hooks.hpp"

namespace vshell {

void LoggingHooks::before(const CommandContext &context) {
    logger_.debug("command", "start {} ({} args) in {}", context.command, context.args.size(), context.cwd);
}

void LoggingHooks::after(const CommandContext &context, int exit_code) {
    logger_.debug("command", "end {} -> {}", context.command, exit_code);
}

void LoggingHooks::on_error(const CommandContext &context, std::string_view reason) {
    logger_.error("command", "{} failed: {}", context.command, reason);
}

} // namespace vshell
