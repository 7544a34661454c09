#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include "core/command.hpp"
#include "core/event_hub.hpp"
#include "core/lexer.hpp"
#include "core/parser.hpp"
#include "execution/pipeline_executor.hpp"
#include "session/history_buffer.hpp"
#include "vfs/fs_error.hpp"

namespace vshell {

class CommandRegistry;
class Logger;
class StateArena;
class StateStore;
class VirtualFileSystem;

enum class SessionState {
    Idle,
    Running,
    Destroyed,
};

enum class SessionEventKind {
    Ready,
    CommandStarted,
    CommandFinished,
    CommandFailed,
    DirectoryChanged,
    EnvironmentChanged,
    HistoryUpdated,
    HistoryCleared,
    Destroying,
    Destroyed,
};

struct SessionEvent {
    SessionEventKind kind;
    // Input line, new directory or variable name, depending on the kind.
    std::string detail;
    int exit_code{0};
};

struct SessionOptions {
    std::string id;
    std::string home{"/"};
    std::string cwd{"/"};
    std::string user{"user"};
    EnvironmentMap environment;
    std::size_t history_capacity{HistoryBuffer::kDefaultCapacity};
    // Restore history, cwd and environment from the state arena on creation
    // and write them back on destroy.
    bool persist{false};
};

// One interactive shell context bound to a filesystem and a registry.
// `execute` calls are serialized: callers on other threads wait their turn,
// a nested call from a running handler is rejected.
class ConsoleSession {
  public:
    using EventHandler = std::function<void(const SessionEvent &)>;

    ConsoleSession(VirtualFileSystem &vfs, CommandRegistry &registry, StateArena &arena, Logger &logger,
                   SessionOptions options);
    ~ConsoleSession();

    ConsoleSession(const ConsoleSession &) = delete;
    ConsoleSession &operator=(const ConsoleSession &) = delete;

    ExecutionResult execute(std::string_view input);

    // Ctrl-C: drops buffered input and asks the running command to stop.
    ExecutionResult interrupt();
    void buffer_input(std::string_view text);
    [[nodiscard]] std::string buffered_input() const;
    ExecutionResult submit();

    FsResult<void> change_directory(std::string_view path);
    [[nodiscard]] std::string cwd() const;
    [[nodiscard]] const std::string &home() const noexcept { return options_.home; }
    [[nodiscard]] const std::string &id() const noexcept { return options_.id; }
    [[nodiscard]] const std::string &user() const noexcept { return options_.user; }

    void set_environment(std::string_view name, std::string_view value);
    void unset_environment(std::string_view name);
    [[nodiscard]] std::optional<std::string> get_environment(std::string_view name) const;
    [[nodiscard]] EnvironmentMap environment() const;

    [[nodiscard]] const HistoryBuffer &history() const noexcept { return history_; }
    void add_to_history(std::string_view line);
    void clear_history();

    void request_exit(int status);
    [[nodiscard]] bool exit_requested() const noexcept { return exit_requested_; }
    [[nodiscard]] int exit_status() const noexcept { return exit_status_; }
    [[nodiscard]] int last_exit_code() const noexcept { return last_exit_code_; }
    [[nodiscard]] SessionState state() const noexcept { return state_; }

    [[nodiscard]] VirtualFileSystem &vfs() noexcept { return vfs_; }
    [[nodiscard]] CommandRegistry &registry() noexcept { return registry_; }
    [[nodiscard]] StateStore &state_store() noexcept { return store_; }
    [[nodiscard]] Logger &logger() noexcept { return logger_; }

    Unsubscribe subscribe(SessionEventKind kind, EventHandler handler);

    [[nodiscard]] bool persistent() const noexcept { return options_.persist; }
    // Writes history, cwd and environment into the session's state store.
    void persist();

    // Flushes persistent state and detaches the session. Later calls to
    // `execute` fail.
    void destroy();

  private:
    VirtualFileSystem &vfs_;
    CommandRegistry &registry_;
    StateStore &store_;
    Logger &logger_;
    SessionOptions options_;

    Lexer lexer_;
    Parser parser_;
    PipelineExecutor executor_;
    HistoryBuffer history_;
    EventHub<SessionEventKind, SessionEvent> events_;

    mutable std::recursive_mutex state_mutex_;
    std::string cwd_;
    EnvironmentMap environment_;

    std::mutex execute_mutex_;
    std::atomic<std::thread::id> running_thread_{};
    mutable std::mutex control_mutex_;
    std::stop_source stop_source_;
    std::string input_buffer_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> exit_requested_{false};
    std::atomic<int> exit_status_{0};
    std::atomic<int> last_exit_code_{0};

    void restore();
    void emit(SessionEventKind kind, std::string detail = {}, int exit_code = 0) const;

    ExecutionResult run_line(std::string_view input);
    ExecutionResult run_command(const ParsedCommand &command, std::stop_token stop);
};

} // namespace vshell
