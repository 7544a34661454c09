#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "core/command.hpp"
#include "vfs/fs_error.hpp"

namespace vshell {

class VirtualFileSystem;

// Where one segment's stdin comes from and where its stdout/stderr end up.
// Target files are created (or truncated) when the set is opened, before the
// command runs; captured output is delivered afterwards by `route`.
class RedirectionSet {
  public:
    static FsResult<RedirectionSet> open(VirtualFileSystem &vfs, std::string_view cwd,
                                         std::span<const Redirection> redirections);

    // Contents of the last `<` file, if any.
    [[nodiscard]] const std::optional<std::string> &input() const noexcept { return input_; }
    [[nodiscard]] bool redirects_stdout() const noexcept { return stdout_.kind != Destination::Kind::Stdout; }

    FsResult<void> route(std::string_view out, std::string_view err, std::string &captured_out, std::string &captured_err);

  private:
    struct Destination {
        enum class Kind { Stdout, Stderr, File } kind;
        std::string path;
    };

    explicit RedirectionSet(VirtualFileSystem &vfs) : vfs_(&vfs) {}

    FsResult<void> deliver(const Destination &destination, std::string_view data, std::string &captured_out,
                           std::string &captured_err);

    VirtualFileSystem *vfs_;
    std::optional<std::string> input_;
    Destination stdout_{.kind = Destination::Kind::Stdout, .path = {}};
    Destination stderr_{.kind = Destination::Kind::Stderr, .path = {}};
};

} // namespace vshell
