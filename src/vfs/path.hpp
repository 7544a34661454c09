#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace vshell::paths {

// Normalizes to an absolute path: drops empty and `.` segments, pops on `..`
// (never above root). Relative input is taken as rooted at `/`.
[[nodiscard]] std::string resolve(std::string_view path);

// Resolves `path` against `base` unless it is already absolute.
[[nodiscard]] std::string resolve_from(std::string_view base, std::string_view path);

[[nodiscard]] std::string join(std::string_view left, std::string_view right);
[[nodiscard]] std::string dirname(std::string_view path);
[[nodiscard]] std::string basename(std::string_view path, std::string_view strip_extension = {});
[[nodiscard]] std::string extname(std::string_view path);

[[nodiscard]] std::vector<std::string> split(std::string_view path);

// True when `path` equals `ancestor` or lies below it. Both must be resolved.
[[nodiscard]] bool is_within(std::string_view path, std::string_view ancestor) noexcept;

// `path` expressed relative to `ancestor`, rooted at `/`. Requires is_within.
[[nodiscard]] std::string relative_to(std::string_view path, std::string_view ancestor);

} // namespace vshell::paths
