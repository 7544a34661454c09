#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/command.hpp"

namespace vshell {

class VirtualFileSystem;

struct ExpansionScope {
    const EnvironmentMap &environment;
    std::string home;
    std::string cwd;
    int last_exit_code{0};
    // Glob expansion is skipped without a filesystem.
    VirtualFileSystem *vfs{nullptr};
    // Runs `$(...)` bodies and returns their stdout.
    std::function<std::string(std::string_view)> substitute;
};

// Word expansion in shell order: tilde, variables, command substitution,
// then globbing. Single-quoted text is never expanded; double-quoted text
// gets variables and substitution only.
class Expander {
  public:
    explicit Expander(ExpansionScope scope) : scope_(std::move(scope)) {}

    // A word may expand to zero fields (unquoted empty variable) or many
    // (glob matches, unquoted substitution output).
    [[nodiscard]] std::vector<std::string> expand_word(const Word &word) const;
    [[nodiscard]] std::vector<std::string> expand_words(const std::vector<Word> &words) const;
    [[nodiscard]] std::string expand_assignment(const Assignment &assignment) const;

    // `$X`, `${X}`, `${X:-default}`, `$?`, `$(...)` and backquotes inside text.
    [[nodiscard]] std::string expand_text(std::string_view text) const;
    [[nodiscard]] std::string expand_tilde(std::string_view text) const;

  private:
    ExpansionScope scope_;

    [[nodiscard]] std::string variable(std::string_view name) const;
    [[nodiscard]] std::string run_substitution(std::string_view body) const;
    [[nodiscard]] std::vector<std::string> expand_glob(const std::string &pattern) const;
};

} // namespace vshell
