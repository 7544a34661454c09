#include "execution/redirection.hpp"

#include "vfs/path.hpp"
#include "vfs/vfs.hpp"

namespace vshell {

FsResult<RedirectionSet> RedirectionSet::open(VirtualFileSystem &vfs, std::string_view cwd,
                                              std::span<const Redirection> redirections) {
    RedirectionSet set(vfs);

    for (const auto &redirection : redirections) {
        if (redirection.targets_descriptor()) {
            const int descriptor = std::get<int>(redirection.target);
            if (redirection.kind == RedirectionKind::Input) {
                continue;
            }

            const bool from_stderr = redirection.kind == RedirectionKind::Error || redirection.kind == RedirectionKind::ErrorAppend;
            Destination &source = from_stderr ? set.stderr_ : set.stdout_;
            if (descriptor == 1) {
                source = set.stdout_;
            } else if (descriptor == 2) {
                source = set.stderr_;
            } else {
                return fs_fail(FsErrorCode::InvalidPath, std::to_string(descriptor));
            }
            continue;
        }

        const std::string path = paths::resolve_from(cwd, std::get<std::string>(redirection.target));

        switch (redirection.kind) {
        case RedirectionKind::Input: {
            auto data = vfs.read_file(path);
            if (!data) {
                return std::unexpected(data.error());
            }
            set.input_ = std::move(*data);
            break;
        }
        case RedirectionKind::Output:
        case RedirectionKind::Error:
            if (auto created = vfs.write_file(path, {}); !created) {
                return std::unexpected(created.error());
            }
            (redirection.kind == RedirectionKind::Output ? set.stdout_ : set.stderr_) =
                Destination{.kind = Destination::Kind::File, .path = path};
            break;
        case RedirectionKind::Append:
        case RedirectionKind::ErrorAppend:
            if (auto touched = vfs.append_file(path, {}); !touched) {
                return std::unexpected(touched.error());
            }
            (redirection.kind == RedirectionKind::Append ? set.stdout_ : set.stderr_) =
                Destination{.kind = Destination::Kind::File, .path = path};
            break;
        }
    }

    return set;
}

FsResult<void> RedirectionSet::deliver(const Destination &destination, std::string_view data, std::string &captured_out,
                                       std::string &captured_err) {
    switch (destination.kind) {
    case Destination::Kind::Stdout:
        captured_out += data;
        return {};
    case Destination::Kind::Stderr:
        captured_err += data;
        return {};
    case Destination::Kind::File:
        if (data.empty()) {
            return {};
        }
        return vfs_->append_file(destination.path, data);
    }
    return {};
}

FsResult<void> RedirectionSet::route(std::string_view out, std::string_view err, std::string &captured_out,
                                     std::string &captured_err) {
    if (auto delivered = deliver(stdout_, out, captured_out, captured_err); !delivered) {
        return delivered;
    }
    return deliver(stderr_, err, captured_out, captured_err);
}

} // namespace vshell
