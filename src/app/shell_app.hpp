#pragma once

#include <iosfwd>
#include <string>

#include "app/config.hpp"
#include "session/kernel.hpp"

namespace vshell {

class ConsoleSession;
struct ExecutionResult;

// Records a Ctrl-C; safe to call from a signal handler.
void raise_interrupt() noexcept;

// Hands a recorded Ctrl-C to the session and writes its marker to `out`.
// Returns false when none was pending.
bool deliver_interrupt(ConsoleSession &session, std::ostream &out);

class ShellApp {
  public:
    explicit ShellApp(ShellConfig config);

    // Runs `-c` once or the interactive loop; returns the process exit status.
    int run();

  private:
    Kernel kernel_;

    int run_command(ConsoleSession &session, const std::string &line);
    int run_interactive(ConsoleSession &session);
    [[nodiscard]] std::string prompt(const ConsoleSession &session) const;
    void shutdown();

    static void print(const ExecutionResult &result);
};

} // namespace vshell
