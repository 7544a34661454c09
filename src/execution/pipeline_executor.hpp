#pragma once

#include <chrono>
#include <stop_token>
#include <string>

#include "core/command.hpp"

namespace vshell {

class CommandRegistry;
class ConsoleSession;
class Expander;
class StateStore;
class VirtualFileSystem;

struct ExecutionResult {
    int exit_code{0};
    std::string out;
    std::string err;
    std::chrono::nanoseconds elapsed{0};

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

// What every segment of one pipeline shares.
struct PipelineScope {
    ConsoleSession &session;
    StateStore &state;
    // Session environment with the pipeline's leading assignments applied.
    const EnvironmentMap &environment;
    std::string cwd;
    std::stop_token stop;
};

// Runs the segments of a parsed pipeline in order, feeding each segment's
// stdout to the next one's stdin.
class PipelineExecutor {
  public:
    PipelineExecutor(CommandRegistry &registry, VirtualFileSystem &vfs);

    ExecutionResult run(const ParsedCommand &command, const Expander &expander, const PipelineScope &scope);

  private:
    CommandRegistry &registry_;
    VirtualFileSystem &vfs_;

    ExecutionResult run_segment(const PipelineSegment &segment, const Expander &expander, const PipelineScope &scope,
                                std::string input);
};

} // namespace vshell
