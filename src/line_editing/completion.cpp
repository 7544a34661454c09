#include "line_editing/completion.hpp"

#include <cstdlib>
#include <cstring>
#include <set>
#include <string>
#include <utility>

#include <readline/readline.h>

#include "commands/command_registry.hpp"
#include "session/console_session.hpp"
#include "vfs/path.hpp"
#include "vfs/vfs.hpp"

namespace vshell {

CompletionEngine *CompletionEngine::instance_ = nullptr;
bool CompletionEngine::command_position_ = true;

CompletionEngine::CompletionEngine(const CommandRegistry &registry, ConsoleSession &session)
    : registry_(registry), session_(session) {}

void CompletionEngine::install() {
    instance_ = this;
    rl_attempted_completion_function = &CompletionEngine::completion_callback;
}

char **CompletionEngine::completion_callback(const char *text, int start, int /*end*/) {
    rl_attempted_completion_over = 1;

    if (instance_ == nullptr) {
        return nullptr;
    }

    // Command position: nothing but blanks before the word.
    command_position_ = true;
    for (int i = 0; i < start && rl_line_buffer != nullptr; ++i) {
        if (rl_line_buffer[i] != ' ' && rl_line_buffer[i] != '\t') {
            command_position_ = false;
            break;
        }
    }

    return rl_completion_matches(text, &CompletionEngine::generator_callback);
}

char *CompletionEngine::generator_callback(const char *text, int state) {
    static std::set<std::string> matches;
    static std::set<std::string>::iterator iterator;

    if (instance_ == nullptr) {
        return nullptr;
    }

    if (state == 0) {
        matches = instance_->collect_matches(text, command_position_);
        iterator = matches.begin();
    }

    if (iterator == matches.end()) {
        return nullptr;
    }

    return ::strdup((iterator++)->c_str());
}

std::set<std::string> CompletionEngine::collect_matches(const std::string &prefix, bool command_position) const {
    if (!command_position || prefix.find('/') != std::string::npos) {
        return collect_paths(prefix);
    }

    const auto names = registry_.get_completions(prefix);
    return std::set<std::string>(names.begin(), names.end());
}

std::set<std::string> CompletionEngine::collect_paths(const std::string &prefix) const {
    std::set<std::string> matches;

    const std::size_t slash = prefix.rfind('/');
    const std::string typed_directory = slash == std::string::npos ? std::string() : prefix.substr(0, slash + 1);
    const std::string stem = slash == std::string::npos ? prefix : prefix.substr(slash + 1);

    std::string directory = typed_directory.empty() ? "." : typed_directory;
    if (directory.starts_with('~')) {
        directory = session_.home() + directory.substr(1);
    }

    VirtualFileSystem &vfs = session_.vfs();
    const std::string absolute = paths::resolve_from(session_.cwd(), directory);

    auto listing = vfs.read_dir(absolute);
    if (!listing) {
        return matches;
    }

    for (const auto &entry : *listing) {
        if (!entry.name.starts_with(stem) || (entry.name.starts_with('.') && !stem.starts_with('.'))) {
            continue;
        }

        std::string candidate = typed_directory + entry.name;
        auto node = vfs.stat(paths::join(absolute, entry.name));
        if (node && node->is_directory()) {
            candidate += '/';
        }
        matches.insert(std::move(candidate));
    }

    if (matches.size() == 1 && matches.begin()->ends_with('/')) {
        rl_completion_append_character = '\0';
    }

    return matches;
}

} // namespace vshell
