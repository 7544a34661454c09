#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "session/kernel.hpp"

using vshell::Kernel;
using vshell::LogLevel;
using vshell::SessionState;
using vshell::ShellConfig;

namespace {

ShellConfig test_config() {
    ShellConfig config;
    config.persist = false;
    return config;
}

void test_boot_creates_layout() {
    std::ostringstream log;
    Kernel kernel(test_config(), log);
    assert(kernel.boot().has_value());

    auto &vfs = kernel.vfs();
    for (const char *directory : {"/home/user", "/usr/bin", "/etc", "/tmp", "/var"}) {
        auto node = vfs.stat(directory);
        assert(node.has_value());
        assert(node->is_directory());
    }

    assert(vfs.stat("/tmp")->permission_bits == 01777);
    assert(vfs.stat("/home/user")->owner == "user");
    assert(vfs.read_file("/home/user/README.txt")->starts_with("Welcome to vshell."));
}

void test_boot_keeps_existing_entries() {
    std::ostringstream log;
    Kernel kernel(test_config(), log);
    assert(kernel.boot().has_value());
    assert(kernel.vfs().write_file("/home/user/README.txt", "mine\n").has_value());

    assert(kernel.boot().has_value());
    assert(*kernel.vfs().read_file("/home/user/README.txt") == "mine\n");
}

void test_boot_uses_configured_user() {
    ShellConfig config = test_config();
    config.user = "alice";
    config.group = "staff";
    config.home = "/home/alice";

    std::ostringstream log;
    Kernel kernel(config, log);
    assert(kernel.boot().has_value());

    auto home = kernel.vfs().stat("/home/alice");
    assert(home.has_value());
    assert(home->owner == "alice");
    assert(home->group == "staff");
}

void test_session_lifecycle() {
    std::ostringstream log;
    Kernel kernel(test_config(), log);
    assert(kernel.boot().has_value());

    auto &first = kernel.create_session();
    auto &second = kernel.create_session();
    assert(first.id() == "console-1");
    assert(second.id() == "console-2");
    assert(first.cwd() == "/home/user");
    assert((kernel.session_ids() == std::vector<std::string>{"console-1", "console-2"}));

    assert(kernel.find_session("console-2") == &second);
    assert(kernel.find_session("console-9") == nullptr);

    assert(kernel.destroy_session("console-1"));
    assert(!kernel.destroy_session("console-1"));
    assert(kernel.find_session("console-1") == nullptr);
    assert((kernel.session_ids() == std::vector<std::string>{"console-2"}));

    // Ids are never reused.
    assert(kernel.create_session().id() == "console-3");
}

void test_sessions_share_the_filesystem() {
    std::ostringstream log;
    Kernel kernel(test_config(), log);
    assert(kernel.boot().has_value());

    auto &writer = kernel.create_session();
    auto &reader = kernel.create_session();
    assert(writer.execute("echo shared > /tmp/note").exit_code == 0);
    assert(reader.execute("cat /tmp/note").out == "shared\n");
}

void test_save_state_reports_unwritable_file() {
    ShellConfig config = test_config();
    config.state_file = "/nonexistent-vshell-dir/state";

    std::ostringstream log;
    Kernel kernel(config, log);
    auto saved = kernel.save_state();
    assert(!saved.has_value());
    assert(saved.error().starts_with("cannot open"));
    assert(log.str().find("[error] kernel: cannot save state") != std::string::npos);
}

void test_logger_threshold() {
    std::ostringstream sink;
    vshell::Logger logger(sink, LogLevel::Info);
    logger.debug("test", "hidden {}", 1);
    logger.info("test", "shown {}", 2);
    logger.set_level(LogLevel::Off);
    logger.error("test", "silenced");
    assert(sink.str() == "[info] test: shown 2\n");

    assert(vshell::log_level_from_string("warning") == LogLevel::Warn);
    assert(!vshell::log_level_from_string("loud").has_value());
}

} // namespace

int main() {
    test_boot_creates_layout();
    test_boot_keeps_existing_entries();
    test_boot_uses_configured_user();
    test_session_lifecycle();
    test_sessions_share_the_filesystem();
    test_save_state_reports_unwritable_file();
    test_logger_threshold();
    return 0;
}
