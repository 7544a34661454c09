#include <cassert>
#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

#include "commands/command_handler.hpp"
#include "core/exit_code.hpp"
#include "session/kernel.hpp"

using vshell::CommandContext;
using vshell::CommandKind;
using vshell::ConsoleSession;
using vshell::Kernel;
using vshell::SessionEvent;
using vshell::SessionEventKind;
using vshell::SessionState;
using vshell::ShellConfig;

namespace {

ShellConfig test_config() {
    ShellConfig config;
    config.persist = false;
    return config;
}

// The log stream has to outlive the kernel that writes to it.
struct Shell {
    std::ostringstream log;
    Kernel kernel;
    ConsoleSession &session;

    explicit Shell(ShellConfig config = test_config()) : kernel(std::move(config), log), session(open(kernel)) {}

    static ConsoleSession &open(Kernel &kernel) {
        auto booted = kernel.boot();
        assert(booted.has_value());
        return kernel.create_session();
    }
};

void test_blank_input_does_nothing() {
    Shell shell;
    shell.kernel.vfs().clear_cache();

    auto result = shell.session.execute("");
    assert(result.exit_code == 0);
    assert(result.out.empty());
    assert(result.err.empty());

    auto blank = shell.session.execute("   \t");
    assert(blank.ok());

    assert(shell.session.history().empty());
    const auto stats = shell.kernel.vfs().cache_stats();
    assert(stats.path_entries == 0);
    assert(stats.inode_entries == 0);
}

void test_unknown_command() {
    Shell shell;
    auto result = shell.session.execute("nope");
    assert(result.exit_code == vshell::exit_code::kNotFound);
    assert(result.err.find("not found") != std::string::npos);
    assert(shell.session.last_exit_code() == 127);
    assert(shell.session.history().size() == 1);
}

void test_pipeline_chaining() {
    Shell shell;

    auto result = shell.session.execute("echo hi | cat");
    assert(result.ok());
    assert(result.out == "hi\n");
    assert(result.err.empty());

    auto counted = shell.session.execute("echo one two three | cat | wc -w");
    assert(counted.out == "      3\n");

    // Streams and status come from the last segment only.
    auto masked = shell.session.execute("nope | echo ok");
    assert(masked.ok());
    assert(masked.out == "ok\n");
    assert(masked.err.empty());

    auto failing = shell.session.execute("echo x | nope");
    assert(failing.exit_code == vshell::exit_code::kNotFound);
    assert(failing.out.empty());
    assert(failing.err == "nope: command not found\n");
}

void test_alias_to_removed_command() {
    Shell shell;
    assert(shell.session.execute("alias ll='ls -l'").ok());
    assert(shell.kernel.registry().unregister("ls").has_value());

    auto result = shell.session.execute("ll");
    assert(result.exit_code == vshell::exit_code::kNotFound);
    assert(result.err == "ll: ls: command not found\n");
}

void test_parse_errors_fail_with_a_message() {
    Shell shell;
    auto result = shell.session.execute("echo a |");
    assert(result.exit_code == 1);
    assert(result.err.starts_with("vshell: "));
    assert(result.out.empty());
}

void test_command_lists() {
    Shell shell;

    assert(shell.session.execute("echo a; echo b").out == "a\nb\n");
    assert(shell.session.execute("false && echo no").out.empty());
    assert(shell.session.execute("false || echo yes").out == "yes\n");
    assert(shell.session.execute("true && echo yes || echo no").out == "yes\n");

    auto last = shell.session.execute("echo x; false");
    assert(last.out == "x\n");
    assert(last.exit_code == 1);
}

void test_redirections_through_the_session() {
    Shell shell;

    assert(shell.session.execute("echo hello > /tmp/out.txt").out.empty());
    assert(shell.session.execute("echo again >> /tmp/out.txt").ok());
    assert(shell.kernel.vfs().read_file("/tmp/out.txt").value() == "hello\nagain\n");

    assert(shell.session.execute("cat < /tmp/out.txt").out == "hello\nagain\n");

    auto failed = shell.session.execute("cat /tmp/missing 2> /tmp/err.txt");
    assert(failed.exit_code == 1);
    assert(failed.err.empty());
    assert(shell.kernel.vfs().read_file("/tmp/err.txt").value() == "cat: /tmp/missing: No such file or directory\n");

    // A redirected middle segment leaves the next one with empty input.
    auto middle = shell.session.execute("echo data > /tmp/mid.txt | wc -c");
    assert(middle.out == "      0\n");
    assert(shell.kernel.vfs().read_file("/tmp/mid.txt").value() == "data\n");

    auto merged = shell.session.execute("ls /missing > /tmp/both.txt 2>&1");
    assert(merged.exit_code == 2);
    assert(merged.out.empty());
    assert(merged.err.empty());
    assert(shell.session.execute("cat /tmp/both.txt").out == "ls: cannot access '/missing': No such file or directory\n");

    auto to_stderr = shell.session.execute("echo hi >&2");
    assert(to_stderr.out.empty());
    assert(to_stderr.err == "hi\n");
}

void test_environment_and_expansion() {
    Shell shell;

    assert(shell.session.execute("X=42").ok());
    assert(shell.session.get_environment("X") == "42");
    assert(shell.session.execute("echo $X ${MISSING:-none}").out == "42 none\n");

    // Leading assignments only reach the pipeline.
    assert(shell.session.execute("ONCE=1 env | grep ONCE").out == "ONCE=1\n");
    assert(!shell.session.get_environment("ONCE").has_value());

    assert(shell.session.execute("echo $(echo inner)").out == "inner\n");
    assert(shell.session.execute("echo ~").out == "/home/user\n");
    assert(shell.session.execute("echo '$X'").out == "$X\n");

    shell.session.execute("false");
    assert(shell.session.execute("echo $?").out == "1\n");
}

void test_change_directory() {
    Shell shell;
    assert(shell.session.cwd() == "/home/user");

    std::vector<std::string> directories;
    auto unsubscribe = shell.session.subscribe(SessionEventKind::DirectoryChanged,
                                               [&directories](const SessionEvent &event) { directories.push_back(event.detail); });

    assert(shell.session.change_directory("/tmp").has_value());
    assert(shell.session.cwd() == "/tmp");
    assert(shell.session.get_environment("PWD") == "/tmp");
    assert(shell.session.get_environment("OLDPWD") == "/home/user");

    assert(shell.session.change_directory("/nowhere").error().code == vshell::FsErrorCode::NotFound);
    assert(shell.session.change_directory("/home/user/README.txt").error().code == vshell::FsErrorCode::NotADirectory);
    assert(shell.session.cwd() == "/tmp");

    assert(directories == std::vector<std::string>({"/tmp"}));
    unsubscribe();
}

void test_command_events() {
    Shell shell;

    std::vector<std::string> seen;
    auto on_start = shell.session.subscribe(SessionEventKind::CommandStarted,
                                            [&seen](const SessionEvent &event) { seen.push_back("start " + event.detail); });
    auto on_fail = shell.session.subscribe(SessionEventKind::CommandFailed, [&seen](const SessionEvent &event) {
        seen.push_back("fail " + std::to_string(event.exit_code));
    });
    auto on_finish = shell.session.subscribe(SessionEventKind::CommandFinished,
                                             [&seen](const SessionEvent &event) { seen.push_back("end " + event.detail); });
    auto on_env = shell.session.subscribe(SessionEventKind::EnvironmentChanged,
                                          [&seen](const SessionEvent &event) { seen.push_back("env " + event.detail); });

    shell.session.execute("true");
    shell.session.execute("nope");
    shell.session.set_environment("A", "1");

    assert(seen == std::vector<std::string>({"start true", "end true", "start nope", "fail 127", "end nope", "env A"}));

    on_start();
    on_fail();
    on_finish();
    on_env();
}

void test_nested_execute_is_rejected() {
    Shell shell;
    auto added = shell.kernel.registry().register_command(
        vshell::make_command("reenter", CommandKind::Function, "runs a nested command", "reenter", [](CommandContext &context) {
            auto nested = context.session.execute("echo nested");
            context.out << nested.err;
            return nested.exit_code;
        }));
    assert(added.has_value());

    auto result = shell.session.execute("reenter");
    assert(result.exit_code == 1);
    assert(result.out == "vshell: session is busy\n");
    assert(shell.session.state() == SessionState::Idle);
}

void test_interrupt() {
    Shell shell;
    shell.session.buffer_input("echo partial");
    assert(shell.session.buffered_input() == "echo partial");

    auto result = shell.session.interrupt();
    assert(result.exit_code == vshell::exit_code::kInterrupted);
    assert(result.out == "^C\n");
    assert(shell.session.buffered_input().empty());
    assert(shell.session.last_exit_code() == 130);

    // The running command sees the stop request through its token.
    auto added = shell.kernel.registry().register_command(
        vshell::make_command("selfstop", CommandKind::Function, "interrupts itself", "selfstop", [](CommandContext &context) {
            context.session.interrupt();
            return context.stop.stop_requested() ? 130 : 0;
        }));
    assert(added.has_value());
    assert(shell.session.execute("selfstop").exit_code == 130);

    // Each new command starts with a fresh token.
    assert(shell.session.execute("echo fine").out == "fine\n");
}

void test_submit_runs_buffered_input() {
    Shell shell;
    shell.session.buffer_input("echo ");
    shell.session.buffer_input("typed");
    auto result = shell.session.submit();
    assert(result.out == "typed\n");
    assert(shell.session.buffered_input().empty());
}

void test_handler_faults_become_failures() {
    Shell shell;
    auto added = shell.kernel.registry().register_command(
        vshell::make_command("slow", CommandKind::Function, "always times out", "slow", [](CommandContext &) -> int {
            throw vshell::HandlerTimeout("timed out after 5s");
        }));
    assert(added.has_value());

    auto result = shell.session.execute("slow");
    assert(result.exit_code == 1);
    assert(result.err == "slow: timed out after 5s\n");
}

void test_exit_requests() {
    Shell shell;

    auto result = shell.session.execute("exit 3");
    assert(result.exit_code == 3);
    assert(shell.session.exit_requested());
    assert(shell.session.exit_status() == 3);

    auto after = shell.session.execute("echo after");
    assert(after.exit_code == 1);
    assert(after.out.empty());
    assert(after.err == "vshell: session has exited\n");
    assert(shell.session.history().entries() == std::vector<std::string>({"exit 3"}));

    Shell nested;
    auto substituted = nested.session.execute("echo $(exit 3); echo after");
    assert(substituted.ok());
    assert(substituted.out == "\nafter\n");
    assert(!nested.session.exit_requested());
    assert(nested.session.execute("echo still here").out == "still here\n");

    Shell other;
    auto invalid = other.session.execute("exit abc");
    assert(invalid.exit_code == vshell::exit_code::kInvalidExit);
    assert(other.session.exit_status() == 128);
    assert(invalid.err.find("numeric argument required") != std::string::npos);
}

void test_destroyed_session_refuses_work() {
    Shell shell;
    std::vector<SessionEventKind> seen;
    auto on_destroying = shell.session.subscribe(SessionEventKind::Destroying,
                                                 [&seen](const SessionEvent &event) { seen.push_back(event.kind); });
    auto on_destroyed = shell.session.subscribe(SessionEventKind::Destroyed,
                                                [&seen](const SessionEvent &event) { seen.push_back(event.kind); });

    shell.session.destroy();
    assert(shell.session.state() == SessionState::Destroyed);
    assert(seen == std::vector<SessionEventKind>({SessionEventKind::Destroying, SessionEventKind::Destroyed}));

    auto result = shell.session.execute("echo late");
    assert(result.exit_code == 1);
    assert(result.err.find("destroyed") != std::string::npos);

    on_destroying();
    on_destroyed();
}

void test_state_survives_a_restart() {
    const auto file = std::filesystem::temp_directory_path() / ("vshell_session_" + std::to_string(::getpid()));

    ShellConfig config;
    config.persist = true;
    config.state_file = file;

    {
        Shell first(config);
        first.session.execute("cd /tmp");
        first.session.execute("export GREETING=hello");
        assert(first.kernel.save_state().has_value());
    }

    std::ostringstream log;
    Kernel second(config, log);
    assert(second.load_state().has_value());
    assert(second.boot().has_value());
    auto &restored = second.create_session();
    assert(restored.id() == "console-1");

    assert(restored.cwd() == "/tmp");
    assert(restored.get_environment("GREETING") == "hello");
    assert(restored.history().entries() == std::vector<std::string>({"cd /tmp", "export GREETING=hello"}));

    std::filesystem::remove(file);
}

} // namespace

int main() {
    test_blank_input_does_nothing();
    test_unknown_command();
    test_pipeline_chaining();
    test_alias_to_removed_command();
    test_parse_errors_fail_with_a_message();
    test_command_lists();
    test_redirections_through_the_session();
    test_environment_and_expansion();
    test_change_directory();
    test_command_events();
    test_nested_execute_is_rejected();
    test_interrupt();
    test_submit_runs_buffered_input();
    test_handler_faults_become_failures();
    test_exit_requests();
    test_destroyed_session_refuses_work();
    test_state_survives_a_restart();

    return 0;
}
