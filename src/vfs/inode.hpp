#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vshell {

using InodeNumber = std::uint64_t;
using Timestamp = std::chrono::system_clock::time_point;

enum class FileKind {
    File,
    Directory,
    Symlink,
    Hardlink,
    BlockDevice,
    CharDevice,
    Fifo,
};

struct INode {
    InodeNumber number{0};
    FileKind kind{FileKind::File};
    std::uint32_t permission_bits{0644};
    std::string owner{"user"};
    std::string group{"user"};
    std::uint64_t size_bytes{0};
    Timestamp created_at{};
    Timestamp modified_at{};
    Timestamp accessed_at{};
    std::uint32_t link_count{1};
    std::optional<std::string> symlink_target;

    [[nodiscard]] bool is_directory() const noexcept { return kind == FileKind::Directory; }
    [[nodiscard]] bool is_symlink() const noexcept { return kind == FileKind::Symlink; }
    [[nodiscard]] bool is_file() const noexcept { return kind == FileKind::File || kind == FileKind::Hardlink; }
};

// Fields left empty are not touched by StorageProvider::update_inode.
struct INodeUpdate {
    std::optional<std::uint32_t> permission_bits;
    std::optional<std::string> owner;
    std::optional<std::string> group;
    std::optional<Timestamp> modified_at;
    std::optional<Timestamp> accessed_at;
    std::optional<std::uint32_t> link_count;
    std::optional<std::string> symlink_target;
};

struct DirEntry {
    std::string name;
    InodeNumber inode{0};
    FileKind kind{FileKind::File};

    [[nodiscard]] bool operator==(const DirEntry &other) const = default;
};

[[nodiscard]] std::string_view to_string(FileKind kind) noexcept;

// 'd' for directories, 'l' for symlinks, '-' for files, as `ls -l` prints them.
[[nodiscard]] char type_char(FileKind kind) noexcept;

// "rwxr-xr-x"
[[nodiscard]] std::string format_permissions(std::uint32_t permission_bits);

} // namespace vshell
