#pragma once

namespace vshell {

class CommandRegistry;

// Registers every built-in command. Fails loudly on a name clash.
void register_builtins(CommandRegistry &registry);

} // namespace vshell
