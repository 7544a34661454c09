#include <algorithm>
#include <chrono>
#include <format>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "builtins/builtin_support.hpp"
#include "session/console_session.hpp"
#include "vfs/glob.hpp"
#include "vfs/path.hpp"
#include "vfs/vfs.hpp"

namespace vshell::builtins {

namespace {

// FsError paths are absolute; users expect the operand they typed.
[[nodiscard]] FsError as_typed(FsError error, std::string_view operand) {
    error.path = std::string(operand);
    return error;
}

[[nodiscard]] std::string format_time(Timestamp time) {
    return std::format("{:%b %d %H:%M}", std::chrono::floor<std::chrono::seconds>(time));
}

int builtin_cd(CommandContext &context) {
    if (context.args.size() > 1) {
        return fail(context, "too many arguments");
    }

    std::string target = context.args.empty() ? context.env("HOME", "/") : context.args.front();
    const bool previous = target == "-";
    if (previous) {
        auto old = context.session.get_environment("OLDPWD");
        if (!old) {
            return fail(context, "OLDPWD not set");
        }
        target = *old;
    }

    if (auto changed = context.session.change_directory(target); !changed) {
        return fail(context, as_typed(changed.error(), target));
    }

    if (previous) {
        context.out << context.session.cwd() << '\n';
    }
    return 0;
}

int builtin_pwd(CommandContext &context) {
    context.out << context.session.cwd() << '\n';
    return 0;
}

struct Listed {
    std::string name;
    INode node;
};

void print_listing(CommandContext &context, std::vector<Listed> entries, const ParsedOptions &options,
                   std::string_view directory) {
    if (options.has('t')) {
        std::ranges::stable_sort(entries, [](const Listed &a, const Listed &b) { return a.node.modified_at > b.node.modified_at; });
    } else {
        std::ranges::sort(entries, {}, &Listed::name);
    }
    if (options.has('r')) {
        std::ranges::reverse(entries);
    }

    if (!options.has('l')) {
        for (const auto &entry : entries) {
            context.out << entry.name << '\n';
        }
        return;
    }

    std::uint64_t blocks = 0;
    for (const auto &entry : entries) {
        blocks += (entry.node.size_bytes + 1023) / 1024;
    }
    if (!directory.empty()) {
        context.out << "total " << blocks << '\n';
    }

    for (const auto &entry : entries) {
        const INode &node = entry.node;
        const std::string size = options.has('h') ? human_size(node.size_bytes) : std::to_string(node.size_bytes);

        context.out << std::format("{}{} {:>2} {} {} {:>6} {} {}", type_char(node.kind), format_permissions(node.permission_bits),
                                   node.link_count, node.owner, node.group, size, format_time(node.modified_at), entry.name);
        if (node.is_symlink() && node.symlink_target) {
            context.out << " -> " << *node.symlink_target;
        }
        context.out << '\n';
    }
}

int builtin_ls(CommandContext &context) {
    auto options = parse_options(context.args, "alhrt1");
    if (!options) {
        return usage_error(context, options.error());
    }

    std::vector<std::string> operands = options->operands;
    if (operands.empty()) {
        operands.emplace_back(".");
    }

    int status = 0;
    std::vector<Listed> files;
    std::vector<std::string> directories;

    for (const auto &operand : operands) {
        const std::string absolute = context.resolve_path(operand);
        auto node = context.vfs.lstat(absolute);
        if (!node) {
            status = fail(context, std::format("cannot access '{}': {}", operand, node.error().reason()), 2);
            continue;
        }

        // A long listing shows the link itself rather than what it points to.
        if (node->is_symlink() && !options->has('l')) {
            if (auto target = context.vfs.stat(absolute); target) {
                node = std::move(target);
            }
        }

        if (node->is_directory()) {
            directories.push_back(operand);
        } else {
            files.push_back(Listed{.name = operand, .node = *node});
        }
    }

    if (!files.empty()) {
        print_listing(context, files, *options, {});
    }

    const bool headers = operands.size() > 1;
    for (std::size_t i = 0; i < directories.size(); ++i) {
        const std::string &operand = directories[i];
        const std::string absolute = context.resolve_path(operand);

        auto listing = context.vfs.read_dir(absolute);
        if (!listing) {
            status = fail(context, std::format("cannot open directory '{}': {}", operand, listing.error().reason()), 2);
            continue;
        }

        if (headers) {
            context.out << (i > 0 || !files.empty() ? "\n" : "") << operand << ":\n";
        }

        std::vector<Listed> entries;
        if (options->has('a')) {
            for (std::string_view dot : {".", ".."}) {
                if (auto node = context.vfs.stat(paths::join(absolute, dot)); node) {
                    entries.push_back(Listed{.name = std::string(dot), .node = *node});
                }
            }
        }

        for (const auto &entry : *listing) {
            if (entry.name.starts_with('.') && !options->has('a')) {
                continue;
            }
            auto node = context.vfs.lstat(paths::join(absolute, entry.name));
            if (node) {
                entries.push_back(Listed{.name = entry.name, .node = *node});
            }
        }

        print_listing(context, std::move(entries), *options, absolute);
    }

    return status;
}

int builtin_mkdir(CommandContext &context) {
    auto options = parse_options(context.args, "p", "m");
    if (!options) {
        return usage_error(context, options.error());
    }
    if (options->operands.empty()) {
        return usage_error(context, "missing operand");
    }

    CreateDirOptions create{.recursive = options->has('p'), .mode = 0755};
    if (auto it = options->values.find('m'); it != options->values.end()) {
        auto mode = parse_octal_mode(it->second);
        if (!mode) {
            return usage_error(context, std::format("invalid mode '{}'", it->second));
        }
        create.mode = *mode;
    }

    int status = 0;
    for (const auto &operand : options->operands) {
        const std::string path = context.resolve_path(operand);
        auto created = context.vfs.create_dir(path, create);
        if (created) {
            continue;
        }

        if (create.recursive && created.error().code == FsErrorCode::FileExists) {
            auto node = context.vfs.stat(path);
            if (node && node->is_directory()) {
                continue;
            }
        }
        status = fail(context, std::format("cannot create directory '{}': {}", operand, created.error().reason()));
    }

    return status;
}

int builtin_rmdir(CommandContext &context) {
    if (context.args.empty()) {
        return usage_error(context, "missing operand");
    }

    int status = 0;
    for (const auto &operand : context.args) {
        if (auto removed = context.vfs.delete_dir(context.resolve_path(operand)); !removed) {
            status = fail(context, std::format("failed to remove '{}': {}", operand, removed.error().reason()));
        }
    }
    return status;
}

int builtin_rm(CommandContext &context) {
    auto options = parse_options(context.args, "rRf");
    if (!options) {
        return usage_error(context, options.error());
    }

    const bool recursive = options->has('r') || options->has('R');
    const bool force = options->has('f');
    if (options->operands.empty() && !force) {
        return usage_error(context, "missing operand");
    }

    int status = 0;
    for (const auto &operand : options->operands) {
        const std::string path = context.resolve_path(operand);

        auto node = context.vfs.lstat(path);
        if (!node) {
            if (!(force && node.error().code == FsErrorCode::NotFound)) {
                status = fail(context, std::format("cannot remove '{}': {}", operand, node.error().reason()));
            }
            continue;
        }

        FsResult<void> removed;
        if (node->is_directory()) {
            if (!recursive) {
                status = fail(context, std::format("cannot remove '{}': Is a directory", operand));
                continue;
            }
            removed = context.vfs.delete_dir(path, true);
        } else {
            removed = context.vfs.delete_file(path);
        }

        if (!removed) {
            status = fail(context, std::format("cannot remove '{}': {}", operand, removed.error().reason()));
        }
    }

    return status;
}

int builtin_touch(CommandContext &context) {
    if (context.args.empty()) {
        return usage_error(context, "missing file operand");
    }

    int status = 0;
    for (const auto &operand : context.args) {
        if (auto touched = context.vfs.touch(context.resolve_path(operand)); !touched) {
            status = fail(context, std::format("cannot touch '{}': {}", operand, touched.error().reason()));
        }
    }
    return status;
}

FsResult<void> copy_tree(VirtualFileSystem &vfs, const std::string &from, const std::string &to, bool recursive) {
    auto node = vfs.stat(from);
    if (!node) {
        return std::unexpected(node.error());
    }

    if (!node->is_directory()) {
        auto data = vfs.read_file(from);
        if (!data) {
            return std::unexpected(data.error());
        }
        return vfs.write_file(to, *data, node->permission_bits);
    }

    if (!recursive) {
        return fs_fail(FsErrorCode::IsDirectory, from);
    }

    if (auto existing = vfs.stat(to); !existing) {
        if (auto created = vfs.create_dir(to, CreateDirOptions{.recursive = false, .mode = node->permission_bits}); !created) {
            return created;
        }
    } else if (!existing->is_directory()) {
        return fs_fail(FsErrorCode::NotADirectory, to);
    }

    auto listing = vfs.read_dir(from);
    if (!listing) {
        return std::unexpected(listing.error());
    }

    for (const auto &entry : *listing) {
        if (auto copied = copy_tree(vfs, paths::join(from, entry.name), paths::join(to, entry.name), true); !copied) {
            return copied;
        }
    }
    return {};
}

// Last operand is the destination; with several sources it must be a
// directory.
template <typename Transfer> int transfer_all(CommandContext &context, const std::vector<std::string> &operands, Transfer transfer) {
    if (operands.size() < 2) {
        return usage_error(context, operands.empty() ? "missing file operand"
                                                     : std::format("missing destination file operand after '{}'", operands.front()));
    }

    const std::string destination = context.resolve_path(operands.back());
    auto destination_node = context.vfs.stat(destination);
    const bool into_directory = destination_node.has_value() && destination_node->is_directory();

    if (operands.size() > 2 && !into_directory) {
        return fail(context, std::format("target '{}' is not a directory", operands.back()));
    }

    int status = 0;
    for (std::size_t i = 0; i + 1 < operands.size(); ++i) {
        const std::string source = context.resolve_path(operands[i]);
        const std::string target = into_directory ? paths::join(destination, paths::basename(source)) : destination;

        if (paths::is_within(target, source)) {
            status = fail(context, std::format("cannot move or copy '{}' into itself", operands[i]));
            continue;
        }
        if (auto done = transfer(source, target); !done) {
            status = fail(context, std::format("'{}': {}", operands[i], done.error().reason()));
        }
    }
    return status;
}

int builtin_cp(CommandContext &context) {
    auto options = parse_options(context.args, "rR");
    if (!options) {
        return usage_error(context, options.error());
    }

    const bool recursive = options->has('r') || options->has('R');
    return transfer_all(context, options->operands, [&](const std::string &source, const std::string &target) {
        auto node = context.vfs.stat(source);
        if (node && node->is_directory() && !recursive) {
            return FsResult<void>(fs_fail(FsErrorCode::IsDirectory, source));
        }
        return copy_tree(context.vfs, source, target, recursive);
    });
}

int builtin_mv(CommandContext &context) {
    auto options = parse_options(context.args, "f");
    if (!options) {
        return usage_error(context, options.error());
    }

    return transfer_all(context, options->operands, [&](const std::string &source, const std::string &target) {
        auto moved = context.vfs.rename(source, target);
        if (moved || moved.error().code != FsErrorCode::InvalidPath) {
            return moved;
        }

        // Different mounts: copy, then remove the original.
        if (auto copied = copy_tree(context.vfs, source, target, true); !copied) {
            return copied;
        }
        auto node = context.vfs.lstat(source);
        if (!node) {
            return FsResult<void>(std::unexpected(node.error()));
        }
        return node->is_directory() ? context.vfs.delete_dir(source, true) : context.vfs.delete_file(source);
    });
}

int builtin_ln(CommandContext &context) {
    auto options = parse_options(context.args, "sf");
    if (!options) {
        return usage_error(context, options.error());
    }
    if (!options->has('s')) {
        return fail(context, "hard links are not supported, use -s");
    }
    if (options->operands.size() != 2) {
        return usage_error(context, "usage: ln -s TARGET LINK_NAME");
    }

    const std::string &target = options->operands[0];
    std::string link = context.resolve_path(options->operands[1]);
    if (auto node = context.vfs.stat(link); node && node->is_directory()) {
        link = paths::join(link, paths::basename(target));
    }

    if (options->has('f')) {
        if (auto existing = context.vfs.lstat(link); existing && !existing->is_directory()) {
            if (auto removed = context.vfs.delete_file(link); !removed) {
                return fail(context, removed.error());
            }
        }
    }

    if (auto created = context.vfs.symlink(target, link); !created) {
        return fail(context, std::format("failed to create symbolic link '{}': {}", options->operands[1], created.error().reason()));
    }
    return 0;
}

int builtin_readlink(CommandContext &context) {
    if (context.args.empty()) {
        return usage_error(context, "missing operand");
    }

    int status = 0;
    for (const auto &operand : context.args) {
        auto target = context.vfs.readlink(context.resolve_path(operand));
        if (!target) {
            status = 1;
            continue;
        }
        context.out << *target << '\n';
    }
    return status;
}

int builtin_chmod(CommandContext &context) {
    if (context.args.size() < 2) {
        return usage_error(context, "usage: chmod MODE FILE...");
    }

    auto mode = parse_octal_mode(context.args.front());
    if (!mode) {
        return usage_error(context, std::format("invalid mode: '{}'", context.args.front()));
    }

    int status = 0;
    for (std::size_t i = 1; i < context.args.size(); ++i) {
        if (auto changed = context.vfs.chmod(context.resolve_path(context.args[i]), *mode); !changed) {
            status = fail(context, std::format("cannot access '{}': {}", context.args[i], changed.error().reason()));
        }
    }
    return status;
}

int builtin_chown(CommandContext &context) {
    if (context.args.size() < 2) {
        return usage_error(context, "usage: chown OWNER[:GROUP] FILE...");
    }

    const std::string &ownership = context.args.front();
    const std::size_t colon = ownership.find(':');
    const std::string owner = ownership.substr(0, colon);
    std::optional<std::string> group;
    if (colon != std::string::npos && colon + 1 < ownership.size()) {
        group = ownership.substr(colon + 1);
    }

    if (owner.empty() && !group) {
        return usage_error(context, std::format("invalid owner: '{}'", ownership));
    }

    int status = 0;
    for (std::size_t i = 1; i < context.args.size(); ++i) {
        if (auto changed = context.vfs.chown(context.resolve_path(context.args[i]), owner, group); !changed) {
            status = fail(context, std::format("cannot access '{}': {}", context.args[i], changed.error().reason()));
        }
    }
    return status;
}

int builtin_stat(CommandContext &context) {
    if (context.args.empty()) {
        return usage_error(context, "missing operand");
    }

    int status = 0;
    for (const auto &operand : context.args) {
        auto node = context.vfs.lstat(context.resolve_path(operand));
        if (!node) {
            status = fail(context, std::format("cannot stat '{}': {}", operand, node.error().reason()));
            continue;
        }

        std::string name = operand;
        if (node->is_symlink() && node->symlink_target) {
            name = std::format("{} -> {}", operand, *node->symlink_target);
        }

        context.out << std::format("  File: {}\n", name);
        context.out << std::format("  Size: {:<10} Type: {}\n", node->size_bytes, to_string(node->kind));
        context.out << std::format("Access: ({:04o}/{}{})  Uid: {}  Gid: {}\n", node->permission_bits, type_char(node->kind),
                                   format_permissions(node->permission_bits), node->owner, node->group);
        context.out << std::format(" Inode: {:<10} Links: {}\n", node->number, node->link_count);
        context.out << std::format("Modify: {}\n", format_time(node->modified_at));
        context.out << std::format("Change: {}\n", format_time(node->created_at));
    }
    return status;
}

struct FindFilter {
    std::optional<std::string> name;
    std::optional<char> type;
    std::optional<long> max_depth;
};

void find_walk(CommandContext &context, const std::string &absolute, const std::string &shown, const FindFilter &filter,
               long depth, int &status) {
    auto node = context.vfs.lstat(absolute);
    if (!node) {
        status = fail(context, std::format("'{}': {}", shown, node.error().reason()));
        return;
    }

    const bool name_ok = !filter.name || wildcard_match(*filter.name, paths::basename(absolute));
    const bool type_ok = !filter.type || (*filter.type == 'd' && node->is_directory()) ||
                         (*filter.type == 'f' && node->is_file()) || (*filter.type == 'l' && node->is_symlink());
    if (name_ok && type_ok) {
        context.out << shown << '\n';
    }

    if (!node->is_directory() || (filter.max_depth && depth >= *filter.max_depth) || context.stop.stop_requested()) {
        return;
    }

    auto listing = context.vfs.read_dir(absolute);
    if (!listing) {
        status = fail(context, std::format("'{}': {}", shown, listing.error().reason()));
        return;
    }

    std::vector<std::string> names;
    for (const auto &entry : *listing) {
        names.push_back(entry.name);
    }
    std::ranges::sort(names);

    for (const auto &name : names) {
        find_walk(context, paths::join(absolute, name), shown == "/" ? "/" + name : shown + "/" + name, filter, depth + 1, status);
    }
}

int builtin_find(CommandContext &context) {
    std::vector<std::string> roots;
    FindFilter filter;

    for (std::size_t i = 0; i < context.args.size(); ++i) {
        const std::string &arg = context.args[i];
        const bool has_value = i + 1 < context.args.size();

        if (arg == "-name" && has_value) {
            filter.name = context.args[++i];
        } else if (arg == "-type" && has_value) {
            const std::string &type = context.args[++i];
            if (type != "f" && type != "d" && type != "l") {
                return usage_error(context, std::format("unknown argument to -type: {}", type));
            }
            filter.type = type.front();
        } else if (arg == "-maxdepth" && has_value) {
            filter.max_depth = parse_count(context.args[++i]);
            if (!filter.max_depth) {
                return usage_error(context, std::format("invalid depth '{}'", context.args[i]));
            }
        } else if (arg.starts_with('-')) {
            return usage_error(context, std::format("unknown predicate '{}'", arg));
        } else {
            roots.push_back(arg);
        }
    }

    if (roots.empty()) {
        roots.emplace_back(".");
    }

    int status = 0;
    for (const auto &root : roots) {
        find_walk(context, context.resolve_path(root), root, filter, 0, status);
    }
    return status;
}

int builtin_mount(CommandContext &context) {
    auto options = parse_options(context.args, "r", "t");
    if (!options) {
        return usage_error(context, options.error());
    }

    if (options->operands.empty()) {
        for (const auto &mount : context.vfs.mounts()) {
            context.out << std::format("{} on {} type {} ({})\n", mount.provider, mount.path, mount.provider,
                                       mount.read_only ? "ro" : "rw");
        }
        return 0;
    }

    auto kind = ProviderKind::Memory;
    if (auto it = options->values.find('t'); it != options->values.end()) {
        auto parsed = provider_kind_from_string(it->second);
        if (!parsed) {
            return usage_error(context, std::format("unknown filesystem type '{}'", it->second));
        }
        kind = *parsed;
    }

    const std::string path = context.resolve_path(options->operands.front());
    if (!context.vfs.exists(path)) {
        if (auto created = context.vfs.create_dir(path, CreateDirOptions{.recursive = true, .mode = 0755}); !created) {
            return fail(context, created.error());
        }
    }

    const ProviderOptions provider{.capacity_bytes = 0, .owner = context.env("USER", "user"), .group = context.env("USER", "user")};
    if (auto mounted = context.vfs.mount(path, kind, options->has('r'), provider); !mounted) {
        return fail(context, mounted.error());
    }
    return 0;
}

int builtin_umount(CommandContext &context) {
    if (context.args.size() != 1) {
        return usage_error(context, "usage: umount PATH");
    }

    if (auto removed = context.vfs.unmount(context.resolve_path(context.args.front())); !removed) {
        return fail(context, as_typed(removed.error(), context.args.front()));
    }
    return 0;
}

} // namespace

void register_filesystem_builtins(CommandRegistry &registry) {
    add_builtin(registry, "cd", "Change the working directory", "cd [DIR | - | ~]", builtin_cd);
    add_builtin(registry, "pwd", "Print the working directory", "pwd", builtin_pwd);
    add_builtin(registry, "ls", "List directory contents", "ls [-alhrt] [PATH...]", builtin_ls);
    add_builtin(registry, "mkdir", "Create directories", "mkdir [-p] [-m MODE] DIR...", builtin_mkdir);
    add_builtin(registry, "rmdir", "Remove empty directories", "rmdir DIR...", builtin_rmdir);
    add_builtin(registry, "rm", "Remove files or directories", "rm [-rf] PATH...", builtin_rm);
    add_builtin(registry, "touch", "Create files or update their timestamps", "touch FILE...", builtin_touch);
    add_builtin(registry, "cp", "Copy files and directories", "cp [-r] SOURCE... DEST", builtin_cp);
    add_builtin(registry, "mv", "Move or rename files", "mv SOURCE... DEST", builtin_mv);
    add_builtin(registry, "ln", "Create symbolic links", "ln -s [-f] TARGET LINK_NAME", builtin_ln);
    add_builtin(registry, "readlink", "Print the target of a symbolic link", "readlink LINK...", builtin_readlink);
    add_builtin(registry, "chmod", "Change permission bits", "chmod MODE FILE...", builtin_chmod);
    add_builtin(registry, "chown", "Change owner and group", "chown OWNER[:GROUP] FILE...", builtin_chown);
    add_builtin(registry, "stat", "Display file status", "stat PATH...", builtin_stat);
    add_builtin(registry, "find", "Search a directory tree", "find [PATH...] [-name PATTERN] [-type f|d|l] [-maxdepth N]",
                builtin_find);
    add_builtin(registry, "mount", "Attach a storage provider or list mounts", "mount [-r] [-t TYPE] [PATH]", builtin_mount);
    add_builtin(registry, "umount", "Detach a mounted provider", "umount PATH", builtin_umount);
}

} // namespace vshell::builtins
