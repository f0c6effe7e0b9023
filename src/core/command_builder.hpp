#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Build the ssh argument vector for running remote_cmd on the configured host:
//   ssh -i <key> -p <port> <user>@<host> <remote_cmd...>
// remote_cmd is appended as-is, one element per argument. Nothing is joined,
// quoted or split, so arguments with spaces reach ssh unchanged.
std::vector<std::string> build_ssh_command(const RemoteConfig& config,
                                           const std::vector<std::string>& remote_cmd);

// "<user>@<host>"
std::string ssh_destination(const RemoteConfig& config);
