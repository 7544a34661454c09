#pragma once

#include <expected>
#include <string>
#include <string_view>

namespace vshell {

enum class FsErrorCode {
    NotFound,
    AccessDenied,
    IsDirectory,
    NotAFile,
    NotADirectory,
    FileExists,
    NotEmpty,
    InvalidPath,
    NoSpace,
    TooManyLinks,
};

struct FsError {
    FsErrorCode code;
    std::string path;

    // "No such file or directory"
    [[nodiscard]] std::string_view reason() const noexcept;
    // "/tmp/x: No such file or directory"
    [[nodiscard]] std::string message() const;
};

template <typename T> using FsResult = std::expected<T, FsError>;

[[nodiscard]] std::string_view to_string(FsErrorCode code) noexcept;

[[nodiscard]] inline std::unexpected<FsError> fs_fail(FsErrorCode code, std::string_view path) {
    return std::unexpected(FsError{.code = code, .path = std::string(path)});
}

} // namespace vshell
