#pragma once

#include <set>
#include <string>

namespace vshell {

class CommandRegistry;
class ConsoleSession;

// Readline completion: command names in command position, VFS paths
// relative to the session's working directory elsewhere.
class CompletionEngine {
  public:
    CompletionEngine(const CommandRegistry &registry, ConsoleSession &session);

    void install();

  private:
    const CommandRegistry &registry_;
    ConsoleSession &session_;

    static CompletionEngine *instance_;
    static bool command_position_;

    static char **completion_callback(const char *text, int start, int end);
    static char *generator_callback(const char *text, int state);

    [[nodiscard]] std::set<std::string> collect_matches(const std::string &prefix, bool command_position) const;
    [[nodiscard]] std::set<std::string> collect_paths(const std::string &prefix) const;
};

} // namespace vshell
