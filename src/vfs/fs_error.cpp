#include "vfs/fs_error.hpp"

#include <format>

namespace vshell {

std::string_view to_string(FsErrorCode code) noexcept {
    switch (code) {
    case FsErrorCode::NotFound:
        return "No such file or directory";
    case FsErrorCode::AccessDenied:
        return "Permission denied";
    case FsErrorCode::IsDirectory:
        return "Is a directory";
    case FsErrorCode::NotAFile:
        return "Not a regular file";
    case FsErrorCode::NotADirectory:
        return "Not a directory";
    case FsErrorCode::FileExists:
        return "File exists";
    case FsErrorCode::NotEmpty:
        return "Directory not empty";
    case FsErrorCode::InvalidPath:
        return "Invalid argument";
    case FsErrorCode::NoSpace:
        return "No space left on device";
    case FsErrorCode::TooManyLinks:
        return "Too many levels of symbolic links";
    }

    return "Unknown error";
}

std::string_view FsError::reason() const noexcept { return to_string(code); }

std::string FsError::message() const {
    if (path.empty()) {
        return std::string(reason());
    }
    return std::format("{}: {}", path, reason());
}

} // namespace vshell
