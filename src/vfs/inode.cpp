#include "vfs/inode.hpp"

namespace vshell {

std::string_view to_string(FileKind kind) noexcept {
    switch (kind) {
    case FileKind::File:
        return "regular file";
    case FileKind::Directory:
        return "directory";
    case FileKind::Symlink:
        return "symbolic link";
    case FileKind::Hardlink:
        return "hard link";
    case FileKind::BlockDevice:
        return "block special file";
    case FileKind::CharDevice:
        return "character special file";
    case FileKind::Fifo:
        return "fifo";
    }

    return "unknown";
}

char type_char(FileKind kind) noexcept {
    switch (kind) {
    case FileKind::Directory:
        return 'd';
    case FileKind::Symlink:
        return 'l';
    case FileKind::BlockDevice:
        return 'b';
    case FileKind::CharDevice:
        return 'c';
    case FileKind::Fifo:
        return 'p';
    case FileKind::File:
    case FileKind::Hardlink:
        return '-';
    }

    return '?';
}

std::string format_permissions(std::uint32_t permission_bits) {
    std::string text(9, '-');
    constexpr char symbols[] = {'r', 'w', 'x'};

    for (int i = 0; i < 9; ++i) {
        if ((permission_bits & (1U << (8 - i))) != 0) {
            text[static_cast<std::size_t>(i)] = symbols[i % 3];
        }
    }

    return text;
}

} // namespace vshell
