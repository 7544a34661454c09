#pragma once

#include <exception>
#include <functional>
#include <iosfwd>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/command.hpp"

namespace vshell {

class ConsoleSession;
class StateStore;
class VirtualFileSystem;

enum class CommandKind {
    Builtin,
    External,
    Alias,
    Function,
};

[[nodiscard]] std::string_view to_string(CommandKind kind) noexcept;

// Everything a handler may touch while it runs. Paths given by the user are
// relative to `cwd` and must be resolved with `resolve_path`.
struct CommandContext {
    std::string command;
    std::vector<std::string> args;
    EnvironmentMap environment;
    std::string cwd;
    std::string input;
    VirtualFileSystem &vfs;
    ConsoleSession &session;
    StateStore &state;
    std::ostream &out;
    std::ostream &err;
    std::stop_token stop;

    [[nodiscard]] std::string resolve_path(std::string_view path) const;
    [[nodiscard]] std::string env(std::string_view name, std::string_view fallback = {}) const;
};

class CommandHandler {
  public:
    virtual ~CommandHandler() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual CommandKind kind() const noexcept = 0;
    [[nodiscard]] virtual std::string_view description() const noexcept = 0;
    [[nodiscard]] virtual std::string_view usage() const noexcept = 0;

    virtual int execute(CommandContext &context) = 0;
};

// Handler backed by a callable; every built-in command is one of these.
class FunctionCommand final : public CommandHandler {
  public:
    using Body = std::function<int(CommandContext &)>;

    FunctionCommand(std::string name, CommandKind kind, std::string description, std::string usage, Body body)
        : name_(std::move(name)), kind_(kind), description_(std::move(description)), usage_(std::move(usage)),
          body_(std::move(body)) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }
    [[nodiscard]] CommandKind kind() const noexcept override { return kind_; }
    [[nodiscard]] std::string_view description() const noexcept override { return description_; }
    [[nodiscard]] std::string_view usage() const noexcept override { return usage_; }

    int execute(CommandContext &context) override { return body_(context); }

  private:
    std::string name_;
    CommandKind kind_;
    std::string description_;
    std::string usage_;
    Body body_;
};

// Lifecycle observer run around every handler invocation.
class CommandHooks {
  public:
    virtual ~CommandHooks() = default;

    virtual void before(const CommandContext &context) = 0;
    virtual void after(const CommandContext &context, int exit_code) = 0;
    virtual void on_error(const CommandContext &context, std::string_view reason) = 0;
};

// Thrown by handlers whose work exceeded its time budget.
class HandlerTimeout : public std::exception {
  public:
    explicit HandlerTimeout(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

  private:
    std::string what_;
};

[[nodiscard]] std::shared_ptr<CommandHandler> make_command(std::string name, CommandKind kind, std::string description,
                                                           std::string usage, FunctionCommand::Body body);

} // namespace vshell
