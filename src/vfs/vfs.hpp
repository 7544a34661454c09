#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/event_hub.hpp"
#include "vfs/fs_error.hpp"
#include "vfs/inode.hpp"
#include "vfs/storage_provider.hpp"

namespace vshell {

enum class VfsEventKind {
    FileCreated,
    FileChanged,
    FileDeleted,
    DirectoryCreated,
    DirectoryDeleted,
    MountAdded,
    MountRemoved,
};

struct VfsEvent {
    VfsEventKind kind;
    std::string path;
    InodeNumber inode{0};
};

struct MountInfo {
    std::string path;
    std::string provider;
    bool read_only{false};
};

struct CreateDirOptions {
    bool recursive{false};
    std::uint32_t mode{0755};
};

struct CacheStats {
    std::size_t path_entries{0};
    std::size_t inode_entries{0};
    std::size_t mounts{0};
};

// Unified namespace over one or more storage providers. All operations take
// absolute paths and are serialized by one filesystem-wide lock, so several
// sessions may share an instance.
class VirtualFileSystem {
  public:
    using EventHandler = std::function<void(const VfsEvent &)>;

    explicit VirtualFileSystem(std::unique_ptr<StorageProvider> root_provider);

    VirtualFileSystem(const VirtualFileSystem &) = delete;
    VirtualFileSystem &operator=(const VirtualFileSystem &) = delete;

    FsResult<std::string> read_file(std::string_view path);
    // Creates the file when absent (FileCreated), overwrites it otherwise
    // (FileChanged).
    FsResult<void> write_file(std::string_view path, std::string_view data, std::uint32_t mode = 0644);
    FsResult<void> append_file(std::string_view path, std::string_view data);
    FsResult<void> delete_file(std::string_view path);
    // Creates an empty file, or bumps the timestamps of an existing entry.
    FsResult<void> touch(std::string_view path);

    FsResult<INode> stat(std::string_view path);
    FsResult<INode> lstat(std::string_view path);
    [[nodiscard]] bool exists(std::string_view path);

    FsResult<std::vector<DirEntry>> read_dir(std::string_view path);
    FsResult<void> create_dir(std::string_view path, CreateDirOptions options = {});
    FsResult<void> delete_dir(std::string_view path, bool recursive = false);

    FsResult<void> symlink(std::string_view target, std::string_view link_path);
    FsResult<std::string> readlink(std::string_view path);
    FsResult<void> rename(std::string_view from, std::string_view to);

    FsResult<void> chmod(std::string_view path, std::uint32_t permission_bits);
    FsResult<void> chown(std::string_view path, std::string_view owner, std::optional<std::string> group = {});

    FsResult<void> mount(std::string_view path, std::unique_ptr<StorageProvider> provider, bool read_only = false);
    FsResult<void> mount(std::string_view path, ProviderKind kind, bool read_only = false, const ProviderOptions &options = {});
    FsResult<void> unmount(std::string_view path);
    [[nodiscard]] std::vector<MountInfo> mounts() const;

    // Without a '/', the pattern matches entry names anywhere below `start`.
    // With one, it is resolved against `start` and each segment matches one
    // directory level. Results are sorted absolute paths.
    [[nodiscard]] std::vector<std::string> glob(std::string_view pattern, std::string_view start = "/");

    Unsubscribe watch(std::string_view path, EventHandler handler);
    Unsubscribe subscribe(VfsEventKind kind, EventHandler handler);

    [[nodiscard]] CacheStats cache_stats() const;
    void clear_cache();

  private:
    struct Mount {
        std::string path;
        std::unique_ptr<StorageProvider> provider;
        bool read_only{false};
        std::unordered_map<std::string, InodeNumber> path_cache;
        std::unordered_map<InodeNumber, INode> inode_cache;
    };

    struct Resolved {
        Mount *mount{nullptr};
        InodeNumber inode{0};
        // Absolute path after following symlinks.
        std::string path;
    };

    std::map<std::string, std::unique_ptr<Mount>, std::less<>> mounts_;
    mutable std::recursive_mutex mutex_;
    EventHub<VfsEventKind, VfsEvent> events_;

    [[nodiscard]] Mount &mount_for(std::string_view absolute_path) const;
    FsResult<Resolved> lookup(std::string_view path, bool follow_final, int depth = 0);
    FsResult<INode> inode_of(Mount &mount, InodeNumber inode);
    FsResult<Resolved> resolve_parent(std::string_view absolute_path);
    FsResult<Resolved> create_node(const Resolved &parent, std::string_view name, FileKind kind, std::uint32_t mode);
    FsResult<void> unlink_node(const Resolved &node);
    FsResult<void> create_dir_locked(const std::string &absolute_path, std::uint32_t mode);
    FsResult<void> delete_dir_locked(const std::string &absolute_path, bool recursive);

    void forget_subtree(Mount &mount, std::string_view absolute_path);
    void emit(VfsEventKind kind, std::string path, InodeNumber inode) const;
    [[nodiscard]] static FsResult<void> ensure_writable(const Mount &mount, std::string_view path);
    void collect_glob(const std::string &directory, const std::vector<std::string> &segments, std::string_view name_pattern,
                      std::vector<std::string> &matches);
};

} // namespace vshell
