#include <print>
#include <string>
#include <vector>

#include "command/args.hpp"
#include "command/commands.hpp"
#include "pngstash/auxiliary/app_configs.hpp"


int main(int argc, char** argv) {
    const std::string program_name = "pngstash";
    const std::vector<std::string> args(argv + 1, argv + argc);

    const auto command = pngstash::parse_args(args);
    if (!command) {
        std::println(stderr, "Error: {}\n", command.error());
        std::println(stderr, "{}", pngstash::usage_text(program_name));
        return pngstash::EXIT_USAGE;
    }

    const auto config_path = pngstash::find_config_path();
    const auto configs = pngstash::load_app_configs(config_path);
    if (!configs) {
        std::println(stderr, "Cannot load configs: {}", configs.error());
        return pngstash::EXIT_IO;
    }

    pngstash::CommandRunner runner{ *configs };
    return runner.run(*command);
}
