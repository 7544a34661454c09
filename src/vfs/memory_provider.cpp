#include "vfs/memory_provider.hpp"

#include <format>
#include <utility>

namespace vshell {

namespace {

[[nodiscard]] std::string inode_label(InodeNumber inode) { return std::format("inode {}", inode); }

} // namespace

MemoryProvider::MemoryProvider(ProviderOptions options) : options_(std::move(options)) {
    auto root = create_inode(FileKind::Directory, 0755);
    root_ = root.has_value() ? root->number : 0;
}

MemoryProvider::Entry *MemoryProvider::find(InodeNumber inode) {
    auto it = entries_.find(inode);
    return it == entries_.end() ? nullptr : &it->second;
}

FsResult<std::string> MemoryProvider::read_file(InodeNumber inode) {
    Entry *entry = find(inode);
    if (entry == nullptr) {
        return fs_fail(FsErrorCode::NotFound, inode_label(inode));
    }

    if (entry->inode.is_directory()) {
        return fs_fail(FsErrorCode::IsDirectory, inode_label(inode));
    }

    entry->inode.accessed_at = std::chrono::system_clock::now();
    return entry->data;
}

FsResult<void> MemoryProvider::write_file(InodeNumber inode, std::string_view data) {
    Entry *entry = find(inode);
    if (entry == nullptr) {
        return fs_fail(FsErrorCode::NotFound, inode_label(inode));
    }

    if (entry->inode.is_directory()) {
        return fs_fail(FsErrorCode::IsDirectory, inode_label(inode));
    }

    const std::size_t next_used = used_bytes_ - entry->data.size() + data.size();
    if (options_.capacity_bytes != 0 && next_used > options_.capacity_bytes) {
        return fs_fail(FsErrorCode::NoSpace, {});
    }

    used_bytes_ = next_used;
    entry->data.assign(data);

    const auto now = std::chrono::system_clock::now();
    entry->inode.size_bytes = data.size();
    entry->inode.modified_at = now;
    entry->inode.accessed_at = now;
    if (entry->inode.is_symlink()) {
        entry->inode.symlink_target = entry->data;
    }

    return {};
}

FsResult<INode> MemoryProvider::create_inode(FileKind kind, std::uint32_t permission_bits) {
    const auto now = std::chrono::system_clock::now();

    INode inode{
        .number = next_inode_++,
        .kind = kind,
        .permission_bits = permission_bits,
        .owner = options_.owner,
        .group = options_.group,
        .size_bytes = 0,
        .created_at = now,
        .modified_at = now,
        .accessed_at = now,
        .link_count = kind == FileKind::Directory ? 2U : 1U,
        .symlink_target = std::nullopt,
    };

    entries_.emplace(inode.number, Entry{.inode = inode, .data = {}, .children = {}});
    return inode;
}

FsResult<void> MemoryProvider::delete_inode(InodeNumber inode) {
    Entry *entry = find(inode);
    if (entry == nullptr) {
        return fs_fail(FsErrorCode::NotFound, inode_label(inode));
    }

    if (!entry->children.empty()) {
        return fs_fail(FsErrorCode::NotEmpty, inode_label(inode));
    }

    if (inode == root_) {
        return fs_fail(FsErrorCode::AccessDenied, inode_label(inode));
    }

    used_bytes_ -= entry->data.size();
    entries_.erase(inode);
    return {};
}

FsResult<INode> MemoryProvider::update_inode(InodeNumber inode, const INodeUpdate &update) {
    Entry *entry = find(inode);
    if (entry == nullptr) {
        return fs_fail(FsErrorCode::NotFound, inode_label(inode));
    }

    INode &node = entry->inode;
    if (update.permission_bits) {
        node.permission_bits = *update.permission_bits;
    }
    if (update.owner) {
        node.owner = *update.owner;
    }
    if (update.group) {
        node.group = *update.group;
    }
    if (update.modified_at) {
        node.modified_at = *update.modified_at;
    }
    if (update.accessed_at) {
        node.accessed_at = *update.accessed_at;
    }
    if (update.link_count) {
        node.link_count = *update.link_count;
    }
    if (update.symlink_target) {
        node.symlink_target = *update.symlink_target;
    }

    return node;
}

FsResult<std::vector<DirEntry>> MemoryProvider::read_dir(InodeNumber inode) {
    Entry *entry = find(inode);
    if (entry == nullptr) {
        return fs_fail(FsErrorCode::NotFound, inode_label(inode));
    }

    if (!entry->inode.is_directory()) {
        return fs_fail(FsErrorCode::NotADirectory, inode_label(inode));
    }

    std::vector<DirEntry> listing;
    listing.reserve(entry->children.size());

    for (const auto &[name, child] : entry->children) {
        const Entry *child_entry = find(child);
        listing.push_back(DirEntry{
            .name = name,
            .inode = child,
            .kind = child_entry != nullptr ? child_entry->inode.kind : FileKind::File,
        });
    }

    return listing;
}

bool MemoryProvider::exists(InodeNumber inode) { return entries_.contains(inode); }

FsResult<INode> MemoryProvider::read_inode(InodeNumber inode) {
    const Entry *entry = find(inode);
    if (entry == nullptr) {
        return fs_fail(FsErrorCode::NotFound, inode_label(inode));
    }
    return entry->inode;
}

FsResult<void> MemoryProvider::add_child(InodeNumber parent, std::string_view name, InodeNumber child) {
    Entry *entry = find(parent);
    if (entry == nullptr || !exists(child)) {
        return fs_fail(FsErrorCode::NotFound, inode_label(entry == nullptr ? parent : child));
    }

    if (!entry->inode.is_directory()) {
        return fs_fail(FsErrorCode::NotADirectory, inode_label(parent));
    }

    if (entry->children.contains(name)) {
        return fs_fail(FsErrorCode::FileExists, name);
    }

    entry->children.emplace(std::string(name), child);
    entry->inode.modified_at = std::chrono::system_clock::now();
    return {};
}

FsResult<void> MemoryProvider::remove_child(InodeNumber parent, std::string_view name) {
    Entry *entry = find(parent);
    if (entry == nullptr) {
        return fs_fail(FsErrorCode::NotFound, inode_label(parent));
    }

    const auto it = entry->children.find(name);
    if (it == entry->children.end()) {
        return fs_fail(FsErrorCode::NotFound, name);
    }

    entry->children.erase(it);
    entry->inode.modified_at = std::chrono::system_clock::now();
    return {};
}

std::unique_ptr<StorageProvider> make_provider(ProviderKind kind, const ProviderOptions &options) {
    switch (kind) {
    case ProviderKind::Memory:
        return std::make_unique<MemoryProvider>(options);
    }

    return std::make_unique<MemoryProvider>(options);
}

std::optional<ProviderKind> provider_kind_from_string(std::string_view name) noexcept {
    if (name == "memory") {
        return ProviderKind::Memory;
    }
    return std::nullopt;
}

std::string_view to_string(ProviderKind kind) noexcept {
    switch (kind) {
    case ProviderKind::Memory:
        return "memory";
    }
    return "unknown";
}

} // namespace vshell
