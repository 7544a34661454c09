#include "builtins/builtins.hpp"

#include "builtins/builtin_support.hpp"

namespace vshell {

void register_builtins(CommandRegistry &registry) {
    builtins::register_filesystem_builtins(registry);
    builtins::register_text_builtins(registry);
    builtins::register_session_builtins(registry);
}

} // namespace vshell
