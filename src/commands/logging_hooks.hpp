#pragma once

#include "commands/command_handler.hpp"
#include "core/logger.hpp"

namespace vshell {

class LoggingHooks final : public CommandHooks {
  public:
    explicit LoggingHooks(Logger &logger) : logger_(logger) {}

    void before(const CommandContext &context) override;
    void after(const CommandContext &context, int exit_code) override;
    void on_error(const CommandContext &context, std::string_view reason) override;

  private:
    Logger &logger_;
};

} // namespace vshell
