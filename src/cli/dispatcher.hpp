#pragma once

#include <string>
#include <vector>
#include <iostream>
#include <core/types.hpp>
#include <core/config.hpp>
#include <core/resolver.hpp>
#include <core/launcher.hpp>

// Progress of a single run(). ConfigFailed, Completed, LaunchFailed and
// Interrupted are terminal.
enum class DispatchState {
    Start,
    ConfigLoaded,
    ConfigFailed,
    ResolveAttempted,
    CommandBuilt,
    ProcessLaunched,
    Completed,
    LaunchFailed,
    Interrupted,
};

const char* to_string(DispatchState state);

// What the command line asked for
struct ParsedArgs {
    enum class Action {
        Run,        // execute request remotely
        Usage,      // print usage, exit with exit_code
        Guidance,   // subcommand missing its arguments
    };

    Action action = Action::Usage;
    int exit_code = 0;
    CommandRequest request;
    std::string subcommand;     // set for Guidance
};

// Map argv[1..] to an action. Pure: no config, no I/O.
//   (nothing)          → Usage, exit 1
//   -h | --help        → Usage, exit 0
//   ping <args...>     → remote "ping <args...>", label "ping"
//   nslookup <args...> → remote "nslookup <args...>", label "nslookup"
//   <cmd> [args...]    → remote "<cmd> [args...]", label "<cmd>"
// ping and nslookup without arguments yield Guidance, exit 1.
ParsedArgs parse_command_line(const std::vector<std::string>& args);

void print_usage(std::ostream& out);

// Print the "requires arguments" message and an example for a wrapped
// subcommand. Returns false if name is not one.
bool print_guidance(const std::string& name, std::ostream& out);

class Dispatcher {
public:
    Dispatcher(ConfigStore store, HostResolver& resolver, ProcessLauncher& launcher,
               std::ostream& out = std::cout, std::ostream& err = std::cerr);

    // Full CLI entry: parse args (without the program name), then run.
    // Returns the process exit code.
    int dispatch(const std::vector<std::string>& args);

    // Load config, resolve, print the banner, run ssh and return its exit
    // code (1 on config or launch failure, 130 on Ctrl-C).
    int run(const CommandRequest& request, bool show_banner = true);

    DispatchState state() const { return state_; }

    // Address shown in the last banner
    const std::string& resolved_address() const { return resolved_; }

private:
    ConfigStore store_;
    HostResolver& resolver_;
    ProcessLauncher& launcher_;
    std::ostream& out_;
    std::ostream& err_;

    DispatchState state_ = DispatchState::Start;
    std::string resolved_;
};
