#include "session/kernel.hpp"

#include <format>
#include <iostream>
#include <utility>

#include "builtins/builtins.hpp"
#include "commands/logging_hooks.hpp"
#include "vfs/path.hpp"

namespace vshell {

namespace {

constexpr std::string_view kWelcome = "Welcome to vshell.\n"
                                      "\n"
                                      "Everything here lives in memory. Type `help` for the list of commands.\n";

[[nodiscard]] ProviderOptions root_options(const ShellConfig &config) {
    return ProviderOptions{.capacity_bytes = 0, .owner = config.user, .group = config.group};
}

} // namespace

Kernel::Kernel(ShellConfig config) : Kernel(std::move(config), std::clog) {}

Kernel::Kernel(ShellConfig config, std::ostream &log_sink)
    : config_(std::move(config)), logger_(log_sink, config_.log_level),
      vfs_(make_provider(config_.root_provider, root_options(config_))) {
    install_commands();
}

void Kernel::install_commands() {
    register_builtins(registry_);
    registry_.add_hooks(std::make_shared<LoggingHooks>(logger_));
}

FsResult<void> Kernel::boot() {
    const std::string home = paths::resolve(config_.home);
    const std::vector<std::string> directories{"/home", home, "/usr", "/usr/bin", "/etc", "/tmp", "/var"};

    for (const auto &directory : directories) {
        if (vfs_.exists(directory)) {
            continue;
        }
        if (auto created = vfs_.create_dir(directory, CreateDirOptions{.recursive = true, .mode = 0755}); !created) {
            logger_.error("kernel", "cannot create {}: {}", directory, created.error().reason());
            return created;
        }
    }

    if (auto chowned = vfs_.chown(home, config_.user, config_.group); !chowned) {
        return chowned;
    }
    if (auto chmoded = vfs_.chmod("/tmp", 01777); !chmoded) {
        return chmoded;
    }

    const std::string readme = paths::join(home, "README.txt");
    if (!vfs_.exists(readme)) {
        if (auto written = vfs_.write_file(readme, kWelcome); !written) {
            return written;
        }
    }

    logger_.info("kernel", "booted with home {}", home);
    return {};
}

ConsoleSession &Kernel::create_session() {
    return create_session(SessionOptions{
        .id = {},
        .home = config_.home,
        .cwd = config_.initial_directory(),
        .user = config_.user,
        .environment = {},
        .history_capacity = config_.history_capacity,
        .persist = config_.persist,
    });
}

ConsoleSession &Kernel::create_session(SessionOptions options) {
    if (options.id.empty()) {
        do {
            options.id = std::format("console-{}", next_session_++);
        } while (sessions_.contains(options.id));
    }

    const std::string id = options.id;
    auto session = std::make_unique<ConsoleSession>(vfs_, registry_, arena_, logger_, std::move(options));
    auto it = sessions_.insert_or_assign(id, std::move(session)).first;
    return *it->second;
}

ConsoleSession *Kernel::find_session(std::string_view id) {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

bool Kernel::destroy_session(std::string_view id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return false;
    }
    it->second->destroy();
    sessions_.erase(it);
    return true;
}

std::vector<std::string> Kernel::session_ids() const {
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto &[id, _] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

std::expected<void, std::string> Kernel::load_state() {
    auto loaded = arena_.load(config_.state_file);
    if (!loaded) {
        logger_.warn("kernel", "cannot load state: {}", loaded.error());
    }
    return loaded;
}

std::expected<void, std::string> Kernel::save_state() {
    for (auto &[id, session] : sessions_) {
        if (session->persistent() && session->state() != SessionState::Destroyed) {
            session->persist();
        }
    }

    auto saved = arena_.save(config_.state_file);
    if (!saved) {
        logger_.error("kernel", "cannot save state: {}", saved.error());
    }
    return saved;
}

} // namespace vshell
