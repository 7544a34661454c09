#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vfs/fs_error.hpp"
#include "vfs/inode.hpp"

namespace vshell {

// Durable inode and byte storage behind one mount point. Inode numbers are
// assigned monotonically by the provider; directories hold name -> inode
// mappings.
class StorageProvider {
  public:
    virtual ~StorageProvider() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual InodeNumber root_inode() const noexcept = 0;

    virtual FsResult<std::string> read_file(InodeNumber inode) = 0;
    virtual FsResult<void> write_file(InodeNumber inode, std::string_view data) = 0;
    virtual FsResult<INode> create_inode(FileKind kind, std::uint32_t permission_bits) = 0;
    // Fails with NotEmpty while a directory still has children.
    virtual FsResult<void> delete_inode(InodeNumber inode) = 0;
    virtual FsResult<INode> update_inode(InodeNumber inode, const INodeUpdate &update) = 0;
    virtual FsResult<std::vector<DirEntry>> read_dir(InodeNumber inode) = 0;
    [[nodiscard]] virtual bool exists(InodeNumber inode) = 0;

    virtual FsResult<INode> read_inode(InodeNumber inode) = 0;
    virtual FsResult<void> add_child(InodeNumber parent, std::string_view name, InodeNumber child) = 0;
    virtual FsResult<void> remove_child(InodeNumber parent, std::string_view name) = 0;
};

enum class ProviderKind {
    Memory,
};

struct ProviderOptions {
    // Zero means unbounded; writes beyond it fail with NoSpace.
    std::size_t capacity_bytes{0};
    std::string owner{"user"};
    std::string group{"user"};
};

[[nodiscard]] std::unique_ptr<StorageProvider> make_provider(ProviderKind kind, const ProviderOptions &options = {});

[[nodiscard]] std::optional<ProviderKind> provider_kind_from_string(std::string_view name) noexcept;
[[nodiscard]] std::string_view to_string(ProviderKind kind) noexcept;

} // namespace vshell
