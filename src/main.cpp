#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "app/config.hpp"
#include "app/shell_app.hpp"
#include "core/exit_code.hpp"

int main(int argc, char **argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    auto config = vshell::load_config(args, vshell::process_environment());
    if (!config) {
        std::cerr << "vshell: " << config.error() << '\n' << vshell::usage_text("vshell");
        return vshell::exit_code::kUsage;
    }
    if (config->show_usage) {
        std::cout << vshell::usage_text("vshell");
        return vshell::exit_code::kSuccess;
    }

    vshell::ShellApp app(std::move(*config));
    return app.run();
}
