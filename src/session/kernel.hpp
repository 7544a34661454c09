#pragma once

#include <cstddef>
#include <expected>
#include <iosfwd>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "app/config.hpp"
#include "commands/command_registry.hpp"
#include "core/logger.hpp"
#include "session/console_session.hpp"
#include "session/state_store.hpp"
#include "vfs/vfs.hpp"

namespace vshell {

// Owns everything sessions share: the filesystem, the command registry, the
// state arena and the logger. Sessions are destroyed before the rest.
class Kernel {
  public:
    explicit Kernel(ShellConfig config);
    Kernel(ShellConfig config, std::ostream &log_sink);

    Kernel(const Kernel &) = delete;
    Kernel &operator=(const Kernel &) = delete;

    // Creates the standard directory layout and the welcome file; existing
    // entries are left alone.
    FsResult<void> boot();

    // Ids are "console-1", "console-2", ...
    ConsoleSession &create_session();
    ConsoleSession &create_session(SessionOptions options);
    [[nodiscard]] ConsoleSession *find_session(std::string_view id);
    bool destroy_session(std::string_view id);
    [[nodiscard]] std::vector<std::string> session_ids() const;

    std::expected<void, std::string> load_state();
    // Flushes live persistent sessions into the arena, then writes the file.
    std::expected<void, std::string> save_state();

    [[nodiscard]] const ShellConfig &config() const noexcept { return config_; }
    [[nodiscard]] Logger &logger() noexcept { return logger_; }
    [[nodiscard]] VirtualFileSystem &vfs() noexcept { return vfs_; }
    [[nodiscard]] CommandRegistry &registry() noexcept { return registry_; }
    [[nodiscard]] StateArena &arena() noexcept { return arena_; }

  private:
    ShellConfig config_;
    Logger logger_;
    VirtualFileSystem vfs_;
    CommandRegistry registry_;
    StateArena arena_;
    std::size_t next_session_{1};
    std::map<std::string, std::unique_ptr<ConsoleSession>, std::less<>> sessions_;

    void install_commands();
};

} // namespace vshell
