#include "command_builder.hpp"
#include "constants.hpp"
#include <fmt/format.h>

std::string ssh_destination(const RemoteConfig& config) {
    return fmt::format("{}@{}", config.user(), config.host());
}

std::vector<std::string> build_ssh_command(const RemoteConfig& config,
                                           const std::vector<std::string>& remote_cmd) {
    std::vector<std::string> argv = {
        SSH_PROGRAM,
        "-i", config.key(),
        "-p", std::to_string(config.port()),
        ssh_destination(config),
    };
    argv.insert(argv.end(), remote_cmd.begin(), remote_cmd.end());
    return argv;
}
