#include "app/shell_app.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

#include <readline/history.h>
#include <readline/readline.h>

#include "core/exit_code.hpp"
#include "line_editing/completion.hpp"
#include "session/console_session.hpp"
#include "vfs/path.hpp"

namespace vshell {

namespace {

volatile std::sig_atomic_t pending_interrupt = 0;
ConsoleSession *interactive_session = nullptr;

void on_interrupt(int /*signal*/) { raise_interrupt(); }

// Runs outside the signal handler, from readline's input loop.
int handle_interrupt() {
    if (interactive_session == nullptr || !deliver_interrupt(*interactive_session, std::cout)) {
        return 0;
    }

    rl_replace_line("", 0);
    rl_on_new_line();
    rl_redisplay();
    return 0;
}

void install_interrupt_handler() {
    struct sigaction action {};
    action.sa_handler = on_interrupt;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);

    rl_catch_signals = 0;
    rl_signal_event_hook = handle_interrupt;
}

} // namespace

void raise_interrupt() noexcept { pending_interrupt = 1; }

bool deliver_interrupt(ConsoleSession &session, std::ostream &out) {
    if (pending_interrupt == 0) {
        return false;
    }
    pending_interrupt = 0;

    out << session.interrupt().out;
    return true;
}

ShellApp::ShellApp(ShellConfig config) : kernel_(std::move(config)) {}

int ShellApp::run() {
    std::cout << std::unitbuf;
    std::cerr << std::unitbuf;

    const ShellConfig &config = kernel_.config();
    if (config.persist) {
        // A broken state file is logged and the shell starts fresh.
        (void)kernel_.load_state();
    }

    if (auto booted = kernel_.boot(); !booted) {
        std::cerr << "vshell: " << booted.error().message() << std::endl;
        return exit_code::kFailure;
    }

    ConsoleSession &session = kernel_.create_session();

    const int status = config.command ? run_command(session, *config.command) : run_interactive(session);
    shutdown();
    return status;
}

int ShellApp::run_command(ConsoleSession &session, const std::string &line) {
    const ExecutionResult result = session.execute(line);
    print(result);
    return session.exit_requested() ? session.exit_status() : result.exit_code;
}

int ShellApp::run_interactive(ConsoleSession &session) {
    CompletionEngine completion(kernel_.registry(), session);
    completion.install();

    using_history();
    for (const auto &line : session.history().entries()) {
        add_history(line.c_str());
    }

    interactive_session = &session;
    install_interrupt_handler();

    while (!session.exit_requested()) {
        char *line = readline(prompt(session).c_str());
        if (line == nullptr) {
            std::cout << std::endl;
            break;
        }

        std::string input(line);
        std::free(line);

        if (input.find_first_not_of(" \t") != std::string::npos) {
            add_history(input.c_str());
        }

        print(session.execute(input));
        // A Ctrl-C during the command is reported once it returns.
        deliver_interrupt(session, std::cout);
    }

    interactive_session = nullptr;
    return session.exit_requested() ? session.exit_status() : session.last_exit_code();
}

std::string ShellApp::prompt(const ConsoleSession &session) const {
    std::string location = session.cwd();
    const std::string &home = session.home();
    if (home != "/" && paths::is_within(location, home)) {
        location = "~" + location.substr(home.size());
    }
    return location + " " + kernel_.config().prompt;
}

void ShellApp::shutdown() {
    if (!kernel_.config().persist) {
        return;
    }
    if (auto saved = kernel_.save_state(); !saved) {
        std::cerr << "vshell: " << saved.error() << std::endl;
    }
}

void ShellApp::print(const ExecutionResult &result) {
    std::cout << result.out;
    std::cerr << result.err;
}

} // namespace vshell
