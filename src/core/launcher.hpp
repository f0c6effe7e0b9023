#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Runs an external program to completion.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // argv[0] is the program (looked up through PATH), the rest are its
    // arguments. Blocks until the program exits or the user interrupts.
    virtual LaunchResult launch(const std::vector<std::string>& argv) = 0;
};

// Spawns a real child process sharing this terminal. Ctrl-C during the wait
// gives the child a short window to exit, then kills it and reports
// LaunchStatus::Interrupted.
class SystemLauncher : public ProcessLauncher {
public:
    LaunchResult launch(const std::vector<std::string>& argv) override;
};
