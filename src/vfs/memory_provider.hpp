#pragma once

#include <map>
#include <string>
#include <unordered_map>

#include "vfs/storage_provider.hpp"

namespace vshell {

class MemoryProvider final : public StorageProvider {
  public:
    explicit MemoryProvider(ProviderOptions options = {});

    [[nodiscard]] std::string_view name() const noexcept override { return "memory"; }
    [[nodiscard]] InodeNumber root_inode() const noexcept override { return root_; }

    FsResult<std::string> read_file(InodeNumber inode) override;
    FsResult<void> write_file(InodeNumber inode, std::string_view data) override;
    FsResult<INode> create_inode(FileKind kind, std::uint32_t permission_bits) override;
    FsResult<void> delete_inode(InodeNumber inode) override;
    FsResult<INode> update_inode(InodeNumber inode, const INodeUpdate &update) override;
    FsResult<std::vector<DirEntry>> read_dir(InodeNumber inode) override;
    [[nodiscard]] bool exists(InodeNumber inode) override;

    FsResult<INode> read_inode(InodeNumber inode) override;
    FsResult<void> add_child(InodeNumber parent, std::string_view name, InodeNumber child) override;
    FsResult<void> remove_child(InodeNumber parent, std::string_view name) override;

    [[nodiscard]] std::size_t used_bytes() const noexcept { return used_bytes_; }
    [[nodiscard]] std::size_t inode_count() const noexcept { return entries_.size(); }

  private:
    struct Entry {
        INode inode;
        std::string data;
        std::map<std::string, InodeNumber, std::less<>> children;
    };

    ProviderOptions options_;
    std::unordered_map<InodeNumber, Entry> entries_;
    InodeNumber next_inode_{1};
    InodeNumber root_{0};
    std::size_t used_bytes_{0};

    [[nodiscard]] Entry *find(InodeNumber inode);
};

} // namespace vshell
