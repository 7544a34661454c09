#include "vfs/vfs.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "vfs/glob.hpp"
#include "vfs/memory_provider.hpp"
#include "vfs/path.hpp"

namespace vshell {

namespace {

constexpr int kMaxSymlinkHops = 40;

[[nodiscard]] FsError at_path(FsError error, std::string_view path) {
    error.path = std::string(path);
    return error;
}

[[nodiscard]] bool is_hidden(std::string_view name) noexcept { return !name.empty() && name.front() == '.'; }

// Dotfiles only match patterns that spell out the leading dot.
[[nodiscard]] bool name_matches(std::string_view pattern, std::string_view name) {
    if (is_hidden(name) && !is_hidden(pattern)) {
        return false;
    }
    return wildcard_match(pattern, name);
}

} // namespace

VirtualFileSystem::VirtualFileSystem(std::unique_ptr<StorageProvider> root_provider) {
    auto root = std::make_unique<Mount>();
    root->path = "/";
    root->provider = std::move(root_provider);
    if (!root->provider) {
        root->provider = std::make_unique<MemoryProvider>();
    }
    mounts_.emplace("/", std::move(root));
}

VirtualFileSystem::Mount &VirtualFileSystem::mount_for(std::string_view absolute_path) const {
    Mount *best = mounts_.find("/")->second.get();
    for (const auto &[path, mount] : mounts_) {
        if (path.size() > best->path.size() && paths::is_within(absolute_path, path)) {
            best = mount.get();
        }
    }
    return *best;
}

FsResult<INode> VirtualFileSystem::inode_of(Mount &mount, InodeNumber inode) {
    if (auto cached = mount.inode_cache.find(inode); cached != mount.inode_cache.end()) {
        return cached->second;
    }

    auto node = mount.provider->read_inode(inode);
    if (node) {
        mount.inode_cache.emplace(inode, *node);
    }
    return node;
}

FsResult<VirtualFileSystem::Resolved> VirtualFileSystem::lookup(std::string_view path, bool follow_final, int depth) {
    const std::string absolute = paths::resolve(path);
    if (depth > kMaxSymlinkHops) {
        return fs_fail(FsErrorCode::TooManyLinks, absolute);
    }

    Mount &mount = mount_for(absolute);
    Resolved current{.mount = &mount, .inode = mount.provider->root_inode(), .path = mount.path};
    const auto segments = paths::split(paths::relative_to(absolute, mount.path));

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const bool last = i + 1 == segments.size();
        std::string child_path = paths::join(current.path, segments[i]);

        InodeNumber child = 0;
        if (auto cached = mount.path_cache.find(child_path); cached != mount.path_cache.end()) {
            child = cached->second;
        } else {
            auto listing = mount.provider->read_dir(current.inode);
            if (!listing) {
                return std::unexpected(at_path(listing.error(), current.path));
            }

            const auto entry = std::ranges::find(*listing, segments[i], &DirEntry::name);
            if (entry == listing->end()) {
                return fs_fail(FsErrorCode::NotFound, absolute);
            }

            child = entry->inode;
            mount.path_cache[child_path] = child;
        }

        auto node = inode_of(mount, child);
        if (!node) {
            mount.path_cache.erase(child_path);
            return fs_fail(FsErrorCode::NotFound, absolute);
        }

        if (node->is_symlink() && (!last || follow_final)) {
            auto target = mount.provider->read_file(child);
            if (!target) {
                return std::unexpected(at_path(target.error(), child_path));
            }

            std::string next = paths::resolve_from(current.path, *target);
            for (std::size_t rest = i + 1; rest < segments.size(); ++rest) {
                next = paths::join(next, segments[rest]);
            }
            return lookup(next, follow_final, depth + 1);
        }

        if (!last && !node->is_directory()) {
            return fs_fail(FsErrorCode::NotADirectory, child_path);
        }

        current = Resolved{.mount = &mount, .inode = child, .path = std::move(child_path)};
    }

    return current;
}

FsResult<VirtualFileSystem::Resolved> VirtualFileSystem::resolve_parent(std::string_view absolute_path) {
    const std::string parent_path = paths::dirname(absolute_path);
    auto parent = lookup(parent_path, true);
    if (!parent) {
        return std::unexpected(parent.error());
    }

    auto node = inode_of(*parent->mount, parent->inode);
    if (!node) {
        return std::unexpected(at_path(node.error(), parent_path));
    }
    if (!node->is_directory()) {
        return fs_fail(FsErrorCode::NotADirectory, parent_path);
    }
    return parent;
}

FsResult<void> VirtualFileSystem::ensure_writable(const Mount &mount, std::string_view path) {
    if (mount.read_only) {
        return fs_fail(FsErrorCode::AccessDenied, path);
    }
    return {};
}

FsResult<VirtualFileSystem::Resolved> VirtualFileSystem::create_node(const Resolved &parent, std::string_view name,
                                                                     FileKind kind, std::uint32_t mode) {
    Mount &mount = *parent.mount;
    const std::string child_path = paths::join(parent.path, name);

    if (auto writable = ensure_writable(mount, child_path); !writable) {
        return std::unexpected(writable.error());
    }

    auto created = mount.provider->create_inode(kind, mode);
    if (!created) {
        return std::unexpected(at_path(created.error(), child_path));
    }

    if (auto linked = mount.provider->add_child(parent.inode, name, created->number); !linked) {
        auto rollback = mount.provider->delete_inode(created->number);
        return std::unexpected(at_path(rollback ? linked.error() : rollback.error(), child_path));
    }

    mount.inode_cache.erase(parent.inode);
    mount.inode_cache[created->number] = *created;
    mount.path_cache[child_path] = created->number;
    return Resolved{.mount = &mount, .inode = created->number, .path = child_path};
}

FsResult<void> VirtualFileSystem::unlink_node(const Resolved &node) {
    Mount &mount = *node.mount;
    if (node.inode == mount.provider->root_inode()) {
        return fs_fail(FsErrorCode::AccessDenied, node.path);
    }

    auto parent = resolve_parent(node.path);
    if (!parent) {
        return std::unexpected(parent.error());
    }

    const std::string name = paths::basename(node.path);
    if (auto removed = mount.provider->remove_child(parent->inode, name); !removed) {
        return std::unexpected(at_path(removed.error(), node.path));
    }

    if (auto deleted = mount.provider->delete_inode(node.inode); !deleted) {
        auto relinked = mount.provider->add_child(parent->inode, name, node.inode);
        return std::unexpected(at_path(relinked ? deleted.error() : relinked.error(), node.path));
    }

    forget_subtree(mount, node.path);
    mount.inode_cache.erase(node.inode);
    mount.inode_cache.erase(parent->inode);
    return {};
}

void VirtualFileSystem::forget_subtree(Mount &mount, std::string_view absolute_path) {
    std::erase_if(mount.path_cache, [absolute_path](const auto &entry) { return paths::is_within(entry.first, absolute_path); });
}

void VirtualFileSystem::emit(VfsEventKind kind, std::string path, InodeNumber inode) const {
    events_.emit(kind, VfsEvent{.kind = kind, .path = std::move(path), .inode = inode});
}

FsResult<std::string> VirtualFileSystem::read_file(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, true);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    auto node = inode_of(*resolved->mount, resolved->inode);
    if (!node) {
        return std::unexpected(at_path(node.error(), absolute));
    }
    if (node->is_directory()) {
        return fs_fail(FsErrorCode::IsDirectory, absolute);
    }

    return resolved->mount->provider->read_file(resolved->inode).transform_error(
        [&absolute](FsError error) { return at_path(std::move(error), absolute); });
}

FsResult<void> VirtualFileSystem::write_file(std::string_view path, std::string_view data, std::uint32_t mode) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);
    if (absolute == "/") {
        return fs_fail(FsErrorCode::IsDirectory, absolute);
    }

    auto existing = lookup(absolute, true);
    if (existing) {
        Mount &mount = *existing->mount;
        auto node = inode_of(mount, existing->inode);
        if (!node) {
            return std::unexpected(at_path(node.error(), absolute));
        }
        if (node->is_directory()) {
            return fs_fail(FsErrorCode::IsDirectory, absolute);
        }
        if (auto writable = ensure_writable(mount, absolute); !writable) {
            return writable;
        }
        if (auto written = mount.provider->write_file(existing->inode, data); !written) {
            return std::unexpected(at_path(written.error(), absolute));
        }

        mount.inode_cache.erase(existing->inode);
        emit(VfsEventKind::FileChanged, existing->path, existing->inode);
        return {};
    }

    if (existing.error().code != FsErrorCode::NotFound) {
        return std::unexpected(existing.error());
    }

    auto parent = resolve_parent(absolute);
    if (!parent) {
        return std::unexpected(parent.error());
    }

    auto created = create_node(*parent, paths::basename(absolute), FileKind::File, mode);
    if (!created) {
        return std::unexpected(created.error());
    }

    Mount &mount = *created->mount;
    if (auto written = mount.provider->write_file(created->inode, data); !written) {
        auto rollback = unlink_node(*created);
        return std::unexpected(at_path(rollback ? written.error() : rollback.error(), absolute));
    }

    mount.inode_cache.erase(created->inode);
    emit(VfsEventKind::FileCreated, created->path, created->inode);
    return {};
}

FsResult<void> VirtualFileSystem::append_file(std::string_view path, std::string_view data) {
    std::lock_guard lock(mutex_);

    auto current = read_file(path);
    if (!current) {
        if (current.error().code == FsErrorCode::NotFound) {
            return write_file(path, data);
        }
        return std::unexpected(current.error());
    }

    current->append(data);
    return write_file(path, *current);
}

FsResult<void> VirtualFileSystem::delete_file(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, false);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    auto node = inode_of(*resolved->mount, resolved->inode);
    if (!node) {
        return std::unexpected(at_path(node.error(), absolute));
    }
    if (node->is_directory()) {
        return fs_fail(FsErrorCode::IsDirectory, absolute);
    }
    if (auto writable = ensure_writable(*resolved->mount, absolute); !writable) {
        return writable;
    }
    if (auto unlinked = unlink_node(*resolved); !unlinked) {
        return unlinked;
    }

    emit(VfsEventKind::FileDeleted, resolved->path, resolved->inode);
    return {};
}

FsResult<void> VirtualFileSystem::touch(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, true);
    if (!resolved) {
        if (resolved.error().code == FsErrorCode::NotFound) {
            return write_file(absolute, {});
        }
        return std::unexpected(resolved.error());
    }

    Mount &mount = *resolved->mount;
    if (auto writable = ensure_writable(mount, absolute); !writable) {
        return writable;
    }

    const auto now = std::chrono::system_clock::now();
    auto updated = mount.provider->update_inode(resolved->inode, INodeUpdate{.modified_at = now, .accessed_at = now});
    if (!updated) {
        return std::unexpected(at_path(updated.error(), absolute));
    }

    mount.inode_cache[resolved->inode] = *updated;
    emit(VfsEventKind::FileChanged, resolved->path, resolved->inode);
    return {};
}

FsResult<INode> VirtualFileSystem::stat(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, true);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return inode_of(*resolved->mount, resolved->inode).transform_error([&absolute](FsError error) {
        return at_path(std::move(error), absolute);
    });
}

FsResult<INode> VirtualFileSystem::lstat(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, false);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return inode_of(*resolved->mount, resolved->inode).transform_error([&absolute](FsError error) {
        return at_path(std::move(error), absolute);
    });
}

bool VirtualFileSystem::exists(std::string_view path) {
    std::lock_guard lock(mutex_);
    return lookup(path, true).has_value();
}

FsResult<std::vector<DirEntry>> VirtualFileSystem::read_dir(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, true);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    auto node = inode_of(*resolved->mount, resolved->inode);
    if (!node) {
        return std::unexpected(at_path(node.error(), absolute));
    }
    if (!node->is_directory()) {
        return fs_fail(FsErrorCode::NotADirectory, absolute);
    }

    return resolved->mount->provider->read_dir(resolved->inode).transform_error(
        [&absolute](FsError error) { return at_path(std::move(error), absolute); });
}

FsResult<void> VirtualFileSystem::create_dir_locked(const std::string &absolute_path, std::uint32_t mode) {
    auto parent = resolve_parent(absolute_path);
    if (!parent) {
        return std::unexpected(parent.error());
    }

    auto created = create_node(*parent, paths::basename(absolute_path), FileKind::Directory, mode);
    if (!created) {
        return std::unexpected(created.error());
    }

    emit(VfsEventKind::DirectoryCreated, created->path, created->inode);
    return {};
}

FsResult<void> VirtualFileSystem::create_dir(std::string_view path, CreateDirOptions options) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    if (auto existing = lookup(absolute, false); existing) {
        return fs_fail(FsErrorCode::FileExists, absolute);
    } else if (existing.error().code != FsErrorCode::NotFound) {
        return std::unexpected(existing.error());
    }

    if (options.recursive) {
        const auto segments = paths::split(absolute);
        std::string ancestor = "/";
        for (std::size_t i = 0; i + 1 < segments.size(); ++i) {
            ancestor = paths::join(ancestor, segments[i]);

            auto found = lookup(ancestor, true);
            if (found) {
                auto node = inode_of(*found->mount, found->inode);
                if (!node) {
                    return std::unexpected(at_path(node.error(), ancestor));
                }
                if (!node->is_directory()) {
                    return fs_fail(FsErrorCode::NotADirectory, ancestor);
                }
                continue;
            }

            if (found.error().code != FsErrorCode::NotFound) {
                return std::unexpected(found.error());
            }
            if (auto made = create_dir_locked(ancestor, options.mode); !made) {
                return made;
            }
        }
    }

    return create_dir_locked(absolute, options.mode);
}

FsResult<void> VirtualFileSystem::delete_dir_locked(const std::string &absolute_path, bool recursive) {
    auto resolved = lookup(absolute_path, false);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    Mount &mount = *resolved->mount;
    auto node = inode_of(mount, resolved->inode);
    if (!node) {
        return std::unexpected(at_path(node.error(), absolute_path));
    }
    if (!node->is_directory()) {
        return fs_fail(FsErrorCode::NotADirectory, absolute_path);
    }
    if (resolved->inode == mount.provider->root_inode()) {
        return fs_fail(FsErrorCode::AccessDenied, absolute_path);
    }
    if (auto writable = ensure_writable(mount, absolute_path); !writable) {
        return writable;
    }

    auto listing = mount.provider->read_dir(resolved->inode);
    if (!listing) {
        return std::unexpected(at_path(listing.error(), absolute_path));
    }
    if (!listing->empty() && !recursive) {
        return fs_fail(FsErrorCode::NotEmpty, absolute_path);
    }

    for (const auto &entry : *listing) {
        const std::string child = paths::join(resolved->path, entry.name);
        auto removed = entry.kind == FileKind::Directory ? delete_dir_locked(child, true) : delete_file(child);
        if (!removed) {
            return removed;
        }
    }

    if (auto unlinked = unlink_node(*resolved); !unlinked) {
        return unlinked;
    }

    emit(VfsEventKind::DirectoryDeleted, resolved->path, resolved->inode);
    return {};
}

FsResult<void> VirtualFileSystem::delete_dir(std::string_view path, bool recursive) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);
    if (absolute == "/") {
        return fs_fail(FsErrorCode::AccessDenied, absolute);
    }
    return delete_dir_locked(absolute, recursive);
}

FsResult<void> VirtualFileSystem::symlink(std::string_view target, std::string_view link_path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(link_path);

    if (auto existing = lookup(absolute, false); existing) {
        return fs_fail(FsErrorCode::FileExists, absolute);
    } else if (existing.error().code != FsErrorCode::NotFound) {
        return std::unexpected(existing.error());
    }

    auto parent = resolve_parent(absolute);
    if (!parent) {
        return std::unexpected(parent.error());
    }

    auto created = create_node(*parent, paths::basename(absolute), FileKind::Symlink, 0777);
    if (!created) {
        return std::unexpected(created.error());
    }

    Mount &mount = *created->mount;
    if (auto written = mount.provider->write_file(created->inode, target); !written) {
        auto rollback = unlink_node(*created);
        return std::unexpected(at_path(rollback ? written.error() : rollback.error(), absolute));
    }

    mount.inode_cache.erase(created->inode);
    emit(VfsEventKind::FileCreated, created->path, created->inode);
    return {};
}

FsResult<std::string> VirtualFileSystem::readlink(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, false);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    auto node = inode_of(*resolved->mount, resolved->inode);
    if (!node) {
        return std::unexpected(at_path(node.error(), absolute));
    }
    if (!node->is_symlink()) {
        return fs_fail(FsErrorCode::InvalidPath, absolute);
    }

    return resolved->mount->provider->read_file(resolved->inode).transform_error(
        [&absolute](FsError error) { return at_path(std::move(error), absolute); });
}

FsResult<void> VirtualFileSystem::rename(std::string_view from, std::string_view to) {
    std::lock_guard lock(mutex_);
    const std::string source_path = paths::resolve(from);
    const std::string target_path = paths::resolve(to);

    auto source = lookup(source_path, false);
    if (!source) {
        return std::unexpected(source.error());
    }

    Mount &mount = *source->mount;
    if (source->inode == mount.provider->root_inode()) {
        return fs_fail(FsErrorCode::AccessDenied, source_path);
    }
    if (target_path == source->path) {
        return {};
    }
    if (paths::is_within(target_path, source->path)) {
        return fs_fail(FsErrorCode::InvalidPath, target_path);
    }

    auto source_node = inode_of(mount, source->inode);
    if (!source_node) {
        return std::unexpected(at_path(source_node.error(), source_path));
    }

    auto target_parent = resolve_parent(target_path);
    if (!target_parent) {
        return std::unexpected(target_parent.error());
    }
    // Inode numbers are provider-local, so entries cannot move between mounts.
    if (target_parent->mount != &mount) {
        return fs_fail(FsErrorCode::InvalidPath, target_path);
    }
    if (auto writable = ensure_writable(mount, target_path); !writable) {
        return writable;
    }

    if (auto existing = lookup(target_path, false); existing) {
        auto existing_node = inode_of(mount, existing->inode);
        if (!existing_node) {
            return std::unexpected(at_path(existing_node.error(), target_path));
        }
        if (source_node->is_directory() && !existing_node->is_directory()) {
            return fs_fail(FsErrorCode::NotADirectory, target_path);
        }
        if (!source_node->is_directory() && existing_node->is_directory()) {
            return fs_fail(FsErrorCode::IsDirectory, target_path);
        }
        if (auto replaced = existing_node->is_directory() ? delete_dir_locked(existing->path, false) : delete_file(existing->path);
            !replaced) {
            return replaced;
        }
    } else if (existing.error().code != FsErrorCode::NotFound) {
        return std::unexpected(existing.error());
    }

    auto source_parent = resolve_parent(source->path);
    if (!source_parent) {
        return std::unexpected(source_parent.error());
    }

    const std::string old_name = paths::basename(source->path);
    const std::string new_name = paths::basename(target_path);
    if (auto removed = mount.provider->remove_child(source_parent->inode, old_name); !removed) {
        return std::unexpected(at_path(removed.error(), source_path));
    }
    if (auto linked = mount.provider->add_child(target_parent->inode, new_name, source->inode); !linked) {
        auto restored = mount.provider->add_child(source_parent->inode, old_name, source->inode);
        return std::unexpected(at_path(restored ? linked.error() : restored.error(), target_path));
    }

    const std::string moved_path = paths::join(target_parent->path, new_name);
    forget_subtree(mount, source->path);
    mount.path_cache[moved_path] = source->inode;
    mount.inode_cache.erase(source_parent->inode);
    mount.inode_cache.erase(target_parent->inode);

    const bool directory = source_node->is_directory();
    emit(directory ? VfsEventKind::DirectoryDeleted : VfsEventKind::FileDeleted, source->path, source->inode);
    emit(directory ? VfsEventKind::DirectoryCreated : VfsEventKind::FileCreated, moved_path, source->inode);
    return {};
}

FsResult<void> VirtualFileSystem::chmod(std::string_view path, std::uint32_t permission_bits) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, true);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    Mount &mount = *resolved->mount;
    if (auto writable = ensure_writable(mount, absolute); !writable) {
        return writable;
    }

    auto updated = mount.provider->update_inode(resolved->inode, INodeUpdate{.permission_bits = permission_bits & 07777});
    if (!updated) {
        return std::unexpected(at_path(updated.error(), absolute));
    }

    mount.inode_cache[resolved->inode] = *updated;
    emit(VfsEventKind::FileChanged, resolved->path, resolved->inode);
    return {};
}

FsResult<void> VirtualFileSystem::chown(std::string_view path, std::string_view owner, std::optional<std::string> group) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    auto resolved = lookup(absolute, true);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    Mount &mount = *resolved->mount;
    if (auto writable = ensure_writable(mount, absolute); !writable) {
        return writable;
    }

    INodeUpdate update;
    if (!owner.empty()) {
        update.owner = std::string(owner);
    }
    update.group = std::move(group);

    auto updated = mount.provider->update_inode(resolved->inode, update);
    if (!updated) {
        return std::unexpected(at_path(updated.error(), absolute));
    }

    mount.inode_cache[resolved->inode] = *updated;
    emit(VfsEventKind::FileChanged, resolved->path, resolved->inode);
    return {};
}

FsResult<void> VirtualFileSystem::mount(std::string_view path, std::unique_ptr<StorageProvider> provider, bool read_only) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    if (!provider) {
        return fs_fail(FsErrorCode::InvalidPath, absolute);
    }
    if (mounts_.contains(absolute)) {
        return fs_fail(FsErrorCode::FileExists, absolute);
    }

    auto entry = std::make_unique<Mount>();
    entry->path = absolute;
    entry->provider = std::move(provider);
    entry->read_only = read_only;

    const InodeNumber root = entry->provider->root_inode();
    mounts_.emplace(absolute, std::move(entry));
    emit(VfsEventKind::MountAdded, absolute, root);
    return {};
}

FsResult<void> VirtualFileSystem::mount(std::string_view path, ProviderKind kind, bool read_only, const ProviderOptions &options) {
    return mount(path, make_provider(kind, options), read_only);
}

FsResult<void> VirtualFileSystem::unmount(std::string_view path) {
    std::lock_guard lock(mutex_);
    const std::string absolute = paths::resolve(path);

    if (absolute == "/") {
        return fs_fail(FsErrorCode::AccessDenied, absolute);
    }

    auto it = mounts_.find(absolute);
    if (it == mounts_.end()) {
        return fs_fail(FsErrorCode::NotFound, absolute);
    }

    const InodeNumber root = it->second->provider->root_inode();
    mounts_.erase(it);
    emit(VfsEventKind::MountRemoved, absolute, root);
    return {};
}

std::vector<MountInfo> VirtualFileSystem::mounts() const {
    std::lock_guard lock(mutex_);

    std::vector<MountInfo> result;
    result.reserve(mounts_.size());
    for (const auto &[path, mount] : mounts_) {
        result.push_back(MountInfo{.path = path, .provider = std::string(mount->provider->name()), .read_only = mount->read_only});
    }
    return result;
}

void VirtualFileSystem::collect_glob(const std::string &directory, const std::vector<std::string> &segments,
                                     std::string_view name_pattern, std::vector<std::string> &matches) {
    auto listing = read_dir(directory);
    if (!listing) {
        // Unreadable directories contribute no matches.
        return;
    }

    const std::size_t depth = paths::split(directory).size();

    for (const auto &entry : *listing) {
        const std::string child = paths::join(directory, entry.name);
        const bool descend = entry.kind == FileKind::Directory;

        if (segments.empty()) {
            if (name_matches(name_pattern, entry.name)) {
                matches.push_back(child);
            }
            if (descend) {
                collect_glob(child, segments, name_pattern, matches);
            }
            continue;
        }

        if (depth >= segments.size() || !name_matches(segments[depth], entry.name)) {
            continue;
        }

        if (depth + 1 == segments.size()) {
            matches.push_back(child);
        } else if (descend) {
            collect_glob(child, segments, name_pattern, matches);
        }
    }
}

std::vector<std::string> VirtualFileSystem::glob(std::string_view pattern, std::string_view start) {
    std::lock_guard lock(mutex_);

    std::vector<std::string> matches;
    const std::string base = paths::resolve(start);

    if (pattern.find('/') == std::string_view::npos) {
        collect_glob(base, {}, pattern, matches);
    } else {
        const std::string absolute = paths::resolve_from(base, pattern);
        const auto segments = paths::split(absolute);

        if (!has_wildcard(absolute)) {
            if (lookup(absolute, true)) {
                matches.push_back(absolute);
            }
            return matches;
        }

        std::string fixed = "/";
        for (std::size_t i = 0; i + 1 < segments.size() && !has_wildcard(segments[i]); ++i) {
            fixed = paths::join(fixed, segments[i]);
        }
        collect_glob(fixed, segments, {}, matches);
    }

    std::ranges::sort(matches);
    return matches;
}

Unsubscribe VirtualFileSystem::subscribe(VfsEventKind kind, EventHandler handler) { return events_.subscribe(kind, std::move(handler)); }

Unsubscribe VirtualFileSystem::watch(std::string_view path, EventHandler handler) {
    const std::string watched = paths::resolve(path);
    auto shared = std::make_shared<EventHandler>(std::move(handler));

    std::vector<Unsubscribe> subscriptions;
    for (auto kind : {VfsEventKind::FileCreated, VfsEventKind::FileChanged, VfsEventKind::FileDeleted,
                      VfsEventKind::DirectoryCreated, VfsEventKind::DirectoryDeleted}) {
        subscriptions.push_back(events_.subscribe(kind, [watched, shared](const VfsEvent &event) {
            if (paths::is_within(event.path, watched)) {
                (*shared)(event);
            }
        }));
    }

    return [subscriptions = std::move(subscriptions)]() {
        for (const auto &unsubscribe : subscriptions) {
            unsubscribe();
        }
    };
}

CacheStats VirtualFileSystem::cache_stats() const {
    std::lock_guard lock(mutex_);

    CacheStats stats{.mounts = mounts_.size()};
    for (const auto &[path, mount] : mounts_) {
        stats.path_entries += mount->path_cache.size();
        stats.inode_entries += mount->inode_cache.size();
    }
    return stats;
}

void VirtualFileSystem::clear_cache() {
    std::lock_guard lock(mutex_);
    for (auto &[path, mount] : mounts_) {
        mount->path_cache.clear();
        mount->inode_cache.clear();
    }
}

} // namespace vshell
