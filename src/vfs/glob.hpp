#pragma once

#include <string_view>

namespace vshell {

// `*` is the only wildcard and matches any run of characters, '/' included.
[[nodiscard]] bool wildcard_match(std::string_view pattern, std::string_view text) noexcept;

[[nodiscard]] inline bool has_wildcard(std::string_view text) noexcept { return text.find('*') != std::string_view::npos; }

} // namespace vshell
