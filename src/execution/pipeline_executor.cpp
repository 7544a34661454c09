#include "execution/pipeline_executor.hpp"

#include <exception>
#include <format>
#include <iterator>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include "commands/command_registry.hpp"
#include "core/exit_code.hpp"
#include "execution/redirection.hpp"
#include "session/expander.hpp"
#include "vfs/vfs.hpp"

namespace vshell {

namespace {

// Arguments after expansion, with `NAME=value` operands put back where they
// were written.
[[nodiscard]] std::vector<std::string> build_arguments(const PipelineSegment &segment, const Expander &expander) {
    std::vector<std::string> args;

    auto add_operands_at = [&](std::size_t position) {
        for (const auto &assignment : segment.local_environment) {
            if (assignment.follows_command_name && assignment.argument_index == position) {
                args.push_back(std::format("{}={}", assignment.name, expander.expand_assignment(assignment)));
            }
        }
    };

    for (std::size_t i = 0; i < segment.arguments.size(); ++i) {
        add_operands_at(i);
        auto fields = expander.expand_word(segment.arguments[i]);
        args.insert(args.end(), std::make_move_iterator(fields.begin()), std::make_move_iterator(fields.end()));
    }
    add_operands_at(segment.arguments.size());

    return args;
}

void notify_error(const std::vector<std::shared_ptr<CommandHooks>> &hooks, const CommandContext &context,
                  std::string_view reason) {
    for (const auto &hook : hooks) {
        hook->on_error(context, reason);
    }
}

} // namespace

PipelineExecutor::PipelineExecutor(CommandRegistry &registry, VirtualFileSystem &vfs) : registry_(registry), vfs_(vfs) {}

ExecutionResult PipelineExecutor::run(const ParsedCommand &command, const Expander &expander, const PipelineScope &scope) {
    const auto started = std::chrono::steady_clock::now();

    ExecutionResult result;
    std::string carried;

    for (std::size_t i = 0; i < command.segments.size(); ++i) {
        if (scope.stop.stop_requested()) {
            result.exit_code = exit_code::kInterrupted;
            result.out.clear();
            break;
        }

        ExecutionResult segment = run_segment(command.segments[i], expander, scope, std::move(carried));
        carried.clear();

        // Only the last segment's streams make up the result.
        result.exit_code = segment.exit_code;
        if (i + 1 == command.segments.size()) {
            result.out = std::move(segment.out);
            result.err = std::move(segment.err);
        } else {
            carried = std::move(segment.out);
        }
    }

    result.elapsed = std::chrono::steady_clock::now() - started;
    return result;
}

ExecutionResult PipelineExecutor::run_segment(const PipelineSegment &segment, const Expander &expander,
                                              const PipelineScope &scope, std::string input) {
    ExecutionResult result;
    const std::string &name = segment.command_name;

    auto handler = registry_.get(name);
    if (!handler) {
        result.exit_code = exit_code::kNotFound;
        result.err = std::format("{}: command not found\n", name);
        return result;
    }

    auto redirections = RedirectionSet::open(vfs_, scope.cwd, segment.redirections);
    if (!redirections) {
        result.exit_code = exit_code::kFailure;
        result.err = std::format("{}: {}\n", name, redirections.error().message());
        return result;
    }
    if (redirections->input().has_value()) {
        input = *redirections->input();
    }

    std::ostringstream out;
    std::ostringstream err;

    CommandContext context{
        .command = name,
        .args = {},
        .environment = scope.environment,
        .cwd = scope.cwd,
        .input = std::move(input),
        .vfs = vfs_,
        .session = scope.session,
        .state = scope.state,
        .out = out,
        .err = err,
        .stop = scope.stop,
    };

    for (const auto &assignment : segment.local_environment) {
        if (!assignment.follows_command_name) {
            context.environment[assignment.name] = expander.expand_assignment(assignment);
        }
    }

    const auto hooks = registry_.hooks();

    try {
        context.args = build_arguments(segment, expander);

        for (const auto &hook : hooks) {
            hook->before(context);
        }

        result.exit_code = handler->execute(context);

        for (const auto &hook : hooks) {
            hook->after(context, result.exit_code);
        }
    } catch (const std::exception &e) {
        err << std::format("{}: {}\n", name, e.what());
        result.exit_code = exit_code::kFailure;
        notify_error(hooks, context, e.what());
    } catch (...) {
        err << std::format("{}: unknown error\n", name);
        result.exit_code = exit_code::kFailure;
        notify_error(hooks, context, "unknown error");
    }

    if (auto routed = redirections->route(out.str(), err.str(), result.out, result.err); !routed) {
        result.err += std::format("{}: {}\n", name, routed.error().message());
        result.exit_code = exit_code::kFailure;
    }

    return result;
}

} // namespace vshell
