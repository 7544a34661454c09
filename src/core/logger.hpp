#pragma once

#include <format>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vshell {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

// Line-oriented diagnostics: "[level] component: message". Writes to the
// stream given at construction, std::clog by default.
class Logger {
  public:
    Logger();
    explicit Logger(std::ostream &sink, LogLevel threshold = LogLevel::Warn);

    void set_level(LogLevel level) noexcept { threshold_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return threshold_; }
    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level != LogLevel::Off && level >= threshold_; }

    void write(LogLevel level, std::string_view component, std::string_view message);

    template <typename... Args>
    void debug(std::string_view component, std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::Debug, component, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::string_view component, std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::Info, component, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::string_view component, std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::Warn, component, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(std::string_view component, std::format_string<Args...> fmt, Args &&...args) {
        log(LogLevel::Error, component, fmt, std::forward<Args>(args)...);
    }

  private:
    std::ostream *sink_;
    LogLevel threshold_;
    std::mutex mutex_;

    template <typename... Args>
    void log(LogLevel level, std::string_view component, std::format_string<Args...> fmt, Args &&...args) {
        if (enabled(level)) {
            write(level, component, std::format(fmt, std::forward<Args>(args)...));
        }
    }
};

} // namespace vshell
