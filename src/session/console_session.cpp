#include "session/console_session.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <format>
#include <utility>

#include "commands/command_registry.hpp"
#include "core/exit_code.hpp"
#include "core/logger.hpp"
#include "session/expander.hpp"
#include "session/state_store.hpp"
#include "vfs/path.hpp"
#include "vfs/vfs.hpp"

namespace vshell {

namespace {

constexpr std::string_view kHistoryKey = "history";
constexpr std::string_view kCwdKey = "cwd";
constexpr std::string_view kEnvKey = "env";

// Command substitution nested deeper than this is refused.
constexpr int kMaxSubstitutionDepth = 32;

[[nodiscard]] bool is_blank(std::string_view input) noexcept {
    return std::ranges::all_of(input, [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; });
}

[[nodiscard]] ExecutionResult failure(int exit_code, std::string message) {
    return ExecutionResult{.exit_code = exit_code, .out = {}, .err = std::move(message), .elapsed = {}};
}

thread_local int substitution_depth = 0;

// Marks the session as running on this thread for the duration of a call.
class RunningScope {
  public:
    RunningScope(std::atomic<std::thread::id> &owner, std::atomic<SessionState> &state) : owner_(owner), state_(state) {
        owner_ = std::this_thread::get_id();
        state_ = SessionState::Running;
    }

    ~RunningScope() {
        if (state_ != SessionState::Destroyed) {
            state_ = SessionState::Idle;
        }
        owner_ = std::thread::id{};
    }

    RunningScope(const RunningScope &) = delete;
    RunningScope &operator=(const RunningScope &) = delete;

  private:
    std::atomic<std::thread::id> &owner_;
    std::atomic<SessionState> &state_;
};

} // namespace

ConsoleSession::ConsoleSession(VirtualFileSystem &vfs, CommandRegistry &registry, StateArena &arena, Logger &logger,
                               SessionOptions options)
    : vfs_(vfs), registry_(registry), store_(arena.store(options.id)), logger_(logger), options_(std::move(options)),
      executor_(registry, vfs), history_(options_.history_capacity), cwd_(paths::resolve(options_.cwd)),
      environment_(options_.environment) {
    environment_.try_emplace("HOME", options_.home);
    environment_.try_emplace("USER", options_.user);
    environment_.try_emplace("SHELL", "/usr/bin/vshell");
    environment_.try_emplace("PATH", "/usr/bin:/bin");

    if (options_.persist) {
        restore();
    }

    environment_["PWD"] = cwd_;

    logger_.info("session", "{} ready in {}", options_.id, cwd_);
    emit(SessionEventKind::Ready, options_.id);
}

ConsoleSession::~ConsoleSession() {
    if (state_ != SessionState::Destroyed) {
        destroy();
    }
}

void ConsoleSession::restore() {
    if (auto saved = store_.get_list(kHistoryKey); saved.has_value()) {
        for (const auto &line : *saved) {
            history_.push(line);
        }
    }

    if (auto saved = store_.get_pairs(kEnvKey); saved.has_value()) {
        for (auto &[name, value] : *saved) {
            environment_[name] = value;
        }
    }

    if (auto saved = store_.get_string(kCwdKey); saved.has_value()) {
        auto node = vfs_.stat(*saved);
        if (node.has_value() && node->is_directory()) {
            cwd_ = paths::resolve(*saved);
        } else {
            logger_.warn("session", "{}: saved directory {} is gone", options_.id, *saved);
        }
    }
}

void ConsoleSession::persist() {
    std::lock_guard lock(state_mutex_);

    store_.set(kHistoryKey, history_.entries());
    store_.set(kCwdKey, cwd_);

    PairList pairs;
    pairs.reserve(environment_.size());
    for (const auto &[name, value] : environment_) {
        pairs.emplace_back(name, value);
    }
    store_.set(kEnvKey, std::move(pairs));
}

void ConsoleSession::destroy() {
    if (state_ == SessionState::Destroyed) {
        return;
    }

    emit(SessionEventKind::Destroying, options_.id);
    {
        std::lock_guard lock(control_mutex_);
        stop_source_.request_stop();
    }

    if (options_.persist) {
        persist();
    }

    state_ = SessionState::Destroyed;
    logger_.info("session", "{} destroyed", options_.id);
    emit(SessionEventKind::Destroyed, options_.id);
}

void ConsoleSession::emit(SessionEventKind kind, std::string detail, int exit_code) const {
    events_.emit(kind, SessionEvent{.kind = kind, .detail = std::move(detail), .exit_code = exit_code});
}

Unsubscribe ConsoleSession::subscribe(SessionEventKind kind, EventHandler handler) {
    return events_.subscribe(kind, std::move(handler));
}

ExecutionResult ConsoleSession::execute(std::string_view input) {
    if (is_blank(input)) {
        return {};
    }

    if (running_thread_ == std::this_thread::get_id()) {
        return failure(exit_code::kFailure, "vshell: session is busy\n");
    }

    std::lock_guard guard(execute_mutex_);
    if (state_ == SessionState::Destroyed) {
        return failure(exit_code::kFailure, "vshell: session has been destroyed\n");
    }

    if (exit_requested_) {
        return failure(exit_code::kFailure, "vshell: session has exited\n");
    }

    RunningScope running(running_thread_, state_);

    std::stop_token stop;
    {
        std::lock_guard lock(control_mutex_);
        stop_source_ = std::stop_source{};
        stop = stop_source_.get_token();
    }

    add_to_history(input);
    emit(SessionEventKind::CommandStarted, std::string(input));

    ExecutionResult result = run_line(input);

    if (!result.ok()) {
        emit(SessionEventKind::CommandFailed, std::string(input), result.exit_code);
    }
    emit(SessionEventKind::CommandFinished, std::string(input), result.exit_code);
    return result;
}

ExecutionResult ConsoleSession::run_line(std::string_view input) {
    const auto started = std::chrono::steady_clock::now();

    std::stop_token stop;
    {
        std::lock_guard lock(control_mutex_);
        stop = stop_source_.get_token();
    }

    ExecutionResult result;

    try {
        const auto tokens = lexer_.tokenize(input);
        auto list = parser_.parse_list(tokens);

        if (!list) {
            result.exit_code = exit_code::kFailure;
            result.err = std::format("vshell: {}\n", list.error().describe());
            last_exit_code_ = result.exit_code;
            logger_.debug("session", "parse error: {}", list.error().describe());
        } else {
            for (const auto &entry : list->entries) {
                if (exit_requested_ || stop.stop_requested()) {
                    break;
                }

                const bool succeeded = last_exit_code_ == exit_code::kSuccess;
                if ((entry.connector == ListConnector::IfSuccess && !succeeded) ||
                    (entry.connector == ListConnector::IfFailure && succeeded)) {
                    continue;
                }

                ExecutionResult step = run_command(entry.command, stop);
                result.out += step.out;
                result.err += step.err;
                result.exit_code = step.exit_code;
                last_exit_code_ = step.exit_code;
            }
        }
    } catch (const std::exception &e) {
        result.exit_code = exit_code::kFailure;
        result.err += std::format("vshell: {}\n", e.what());
        last_exit_code_ = result.exit_code;
        logger_.error("session", "{}: {}", options_.id, e.what());
    }

    result.elapsed = std::chrono::steady_clock::now() - started;
    return result;
}

ExecutionResult ConsoleSession::run_command(const ParsedCommand &command, std::stop_token stop) {
    const EnvironmentMap session_environment = environment();
    std::string substitution_errors;

    Expander expander(ExpansionScope{
        .environment = session_environment,
        .home = options_.home,
        .cwd = cwd(),
        .last_exit_code = last_exit_code_,
        .vfs = &vfs_,
        .substitute = [this, &substitution_errors](std::string_view body) {
            if (substitution_depth >= kMaxSubstitutionDepth) {
                substitution_errors += "vshell: command substitution nested too deeply\n";
                return std::string{};
            }

            // `exit` inside a substitution only ends the substitution.
            const bool exiting = exit_requested_;
            const int saved_status = exit_status_;

            ++substitution_depth;
            ExecutionResult nested = run_line(body);
            --substitution_depth;

            exit_requested_ = exiting;
            exit_status_ = saved_status;

            substitution_errors += nested.err;
            return nested.out;
        },
    });

    if (command.segments.empty()) {
        for (const auto &assignment : command.leading_environment) {
            set_environment(assignment.name, expander.expand_assignment(assignment));
        }
        return ExecutionResult{.exit_code = exit_code::kSuccess, .out = {}, .err = std::move(substitution_errors), .elapsed = {}};
    }

    EnvironmentMap effective = session_environment;
    for (const auto &assignment : command.leading_environment) {
        effective[assignment.name] = expander.expand_assignment(assignment);
    }

    if (command.run_in_background) {
        logger_.debug("session", "{}: background job runs in the foreground", options_.id);
    }

    PipelineScope scope{
        .session = *this,
        .state = store_,
        .environment = effective,
        .cwd = cwd(),
        .stop = stop,
    };

    ExecutionResult result = executor_.run(command, expander, scope);
    result.err.insert(0, substitution_errors);
    return result;
}

ExecutionResult ConsoleSession::interrupt() {
    {
        std::lock_guard lock(control_mutex_);
        input_buffer_.clear();
        stop_source_.request_stop();
    }

    last_exit_code_ = exit_code::kInterrupted;
    logger_.debug("session", "{} interrupted", options_.id);
    return ExecutionResult{.exit_code = exit_code::kInterrupted, .out = "^C\n", .err = {}, .elapsed = {}};
}

void ConsoleSession::buffer_input(std::string_view text) {
    std::lock_guard lock(control_mutex_);
    input_buffer_ += text;
}

std::string ConsoleSession::buffered_input() const {
    std::lock_guard lock(control_mutex_);
    return input_buffer_;
}

ExecutionResult ConsoleSession::submit() {
    std::string line;
    {
        std::lock_guard lock(control_mutex_);
        line.swap(input_buffer_);
    }
    return execute(line);
}

FsResult<void> ConsoleSession::change_directory(std::string_view path) {
    std::string target;
    {
        std::lock_guard lock(state_mutex_);
        target = paths::resolve_from(cwd_, path);
    }

    auto node = vfs_.stat(target);
    if (!node) {
        return std::unexpected(node.error());
    }
    if (!node->is_directory()) {
        return fs_fail(FsErrorCode::NotADirectory, target);
    }

    {
        std::lock_guard lock(state_mutex_);
        environment_["OLDPWD"] = cwd_;
        cwd_ = target;
        environment_["PWD"] = cwd_;
    }

    emit(SessionEventKind::DirectoryChanged, target);
    return {};
}

std::string ConsoleSession::cwd() const {
    std::lock_guard lock(state_mutex_);
    return cwd_;
}

void ConsoleSession::set_environment(std::string_view name, std::string_view value) {
    {
        std::lock_guard lock(state_mutex_);
        environment_[std::string(name)] = std::string(value);
    }
    emit(SessionEventKind::EnvironmentChanged, std::string(name));
}

void ConsoleSession::unset_environment(std::string_view name) {
    {
        std::lock_guard lock(state_mutex_);
        if (environment_.erase(std::string(name)) == 0) {
            return;
        }
    }
    emit(SessionEventKind::EnvironmentChanged, std::string(name));
}

std::optional<std::string> ConsoleSession::get_environment(std::string_view name) const {
    std::lock_guard lock(state_mutex_);
    auto it = environment_.find(std::string(name));
    if (it == environment_.end()) {
        return std::nullopt;
    }
    return it->second;
}

EnvironmentMap ConsoleSession::environment() const {
    std::lock_guard lock(state_mutex_);
    return environment_;
}

void ConsoleSession::add_to_history(std::string_view line) {
    {
        std::lock_guard lock(state_mutex_);
        history_.push(line);
    }
    emit(SessionEventKind::HistoryUpdated, std::string(line));
}

void ConsoleSession::clear_history() {
    {
        std::lock_guard lock(state_mutex_);
        history_.clear();
    }
    emit(SessionEventKind::HistoryCleared);
}

void ConsoleSession::request_exit(int status) {
    exit_status_ = status;
    exit_requested_ = true;
}

} // namespace vshell
