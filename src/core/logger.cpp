#include "core/logger.hpp"

#include <iostream>

namespace vshell {

std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:
        return "debug";
    case LogLevel::Info:
        return "info";
    case LogLevel::Warn:
        return "warn";
    case LogLevel::Error:
        return "error";
    case LogLevel::Off:
        return "off";
    }
    return "off";
}

std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept {
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        if (to_string(level) == name) {
            return level;
        }
    }
    if (name == "warning") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

Logger::Logger() : Logger(std::clog) {}

Logger::Logger(std::ostream &sink, LogLevel threshold) : sink_(&sink), threshold_(threshold) {}

void Logger::write(LogLevel level, std::string_view component, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    std::lock_guard lock(mutex_);
    *sink_ << std::format("[{}] {}: {}\n", to_string(level), component, message);
    sink_->flush();
}

} // namespace vshell
