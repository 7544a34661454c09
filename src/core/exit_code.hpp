#pragma once

namespace vshell::exit_code {

inline constexpr int kSuccess = 0;
inline constexpr int kFailure = 1;
inline constexpr int kUsage = 2;
inline constexpr int kNotFound = 127;
inline constexpr int kInvalidExit = 128;
inline constexpr int kInterrupted = 130;

} // namespace vshell::exit_code
