#include "dispatcher.hpp"
#include "theme.hpp"
#include <core/command_builder.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <map>

namespace {

// Subcommands that wrap a remote tool and need at least one argument
struct WrappedCommand {
    std::string requirement;
    std::string example;
};

const std::map<std::string, WrappedCommand>& wrapped_commands() {
    static const std::map<std::string, WrappedCommand> commands = {
        {"ping",     {"rcr ping requires ping arguments.", "rcr ping 8.8.8.8 -c 4"}},
        {"nslookup", {"rcr nslookup requires a hostname.", "rcr nslookup example.com"}},
    };
    return commands;
}

} // namespace

const char* to_string(DispatchState state) {
    switch (state) {
        case DispatchState::Start:            return "start";
        case DispatchState::ConfigLoaded:     return "config-loaded";
        case DispatchState::ConfigFailed:     return "config-failed";
        case DispatchState::ResolveAttempted: return "resolve-attempted";
        case DispatchState::CommandBuilt:     return "command-built";
        case DispatchState::ProcessLaunched:  return "process-launched";
        case DispatchState::Completed:        return "completed";
        case DispatchState::LaunchFailed:     return "launch-failed";
        case DispatchState::Interrupted:      return "interrupted";
    }
    return "?";
}

// ── Argument parsing ─────────────────────────────────────────

ParsedArgs parse_command_line(const std::vector<std::string>& args) {
    ParsedArgs parsed;

    if (args.empty()) {
        parsed.action = ParsedArgs::Action::Usage;
        parsed.exit_code = EXIT_FAILURE_CODE;
        return parsed;
    }

    const std::string& command = args.front();
    if (command == "-h" || command == "--help") {
        parsed.action = ParsedArgs::Action::Usage;
        parsed.exit_code = EXIT_OK;
        return parsed;
    }

    if (wrapped_commands().count(command) && args.size() < 2) {
        parsed.action = ParsedArgs::Action::Guidance;
        parsed.exit_code = EXIT_FAILURE_CODE;
        parsed.subcommand = command;
        return parsed;
    }

    // ping and nslookup run the remote tool of the same name, so with
    // arguments present they forward exactly like any other command.
    parsed.action = ParsedArgs::Action::Run;
    parsed.request.remote_cmd = args;
    parsed.request.label = command;
    return parsed;
}

void print_usage(std::ostream& out) {
    out << theme::section("Usage");
    out << theme::usage_row("rcr ping <ping-arguments...>", "Run ping on the remote host");
    out << theme::usage_row("rcr nslookup <nslookup-arguments...>", "Run nslookup on the remote host");
    out << theme::usage_row("rcr <command> [args...]", "Run any command on the remote host");
    out << "\n";
    out << theme::section("Examples");
    out << theme::usage_row("rcr ping 8.8.8.8 -c 4");
    out << theme::usage_row("rcr nslookup example.com");
    out << theme::usage_row("rcr uname -a");
    out << theme::usage_row("rcr systemctl status ssh");
    out << "\n";
    out << theme::dim(fmt::format("Connection settings are read from the [{}] section of ~/{}",
                                  CONFIG_SECTION, CONFIG_FILE_NAME)) << "\n";
}

bool print_guidance(const std::string& name, std::ostream& out) {
    auto it = wrapped_commands().find(name);
    if (it == wrapped_commands().end()) return false;
    out << theme::fail(it->second.requirement);
    out << theme::step("Example: " + it->second.example);
    return true;
}

// ── Dispatcher ───────────────────────────────────────────────

Dispatcher::Dispatcher(ConfigStore store, HostResolver& resolver, ProcessLauncher& launcher,
                       std::ostream& out, std::ostream& err)
    : store_(std::move(store)), resolver_(resolver), launcher_(launcher),
      out_(out), err_(err) {}

int Dispatcher::dispatch(const std::vector<std::string>& args) {
    ParsedArgs parsed = parse_command_line(args);

    switch (parsed.action) {
        case ParsedArgs::Action::Usage:
            print_usage(err_);
            return parsed.exit_code;
        case ParsedArgs::Action::Guidance:
            print_guidance(parsed.subcommand, err_);
            return parsed.exit_code;
        case ParsedArgs::Action::Run:
            break;
    }
    return run(parsed.request);
}

int Dispatcher::run(const CommandRequest& request, bool show_banner) {
    state_ = DispatchState::Start;
    resolved_.clear();

    auto loaded = store_.load();
    if (loaded.is_err()) {
        state_ = DispatchState::ConfigFailed;
        rcr_log(fmt::format("run: config failed: {}", loaded.error));
        err_ << theme::fail(loaded.error);
        if (!loaded.hint.empty()) err_ << theme::step(loaded.hint);
        return EXIT_FAILURE_CODE;
    }
    const RemoteConfig& config = loaded.value;
    state_ = DispatchState::ConfigLoaded;

    resolved_ = resolver_.resolve(config.host()).str();
    state_ = DispatchState::ResolveAttempted;

    if (show_banner) {
        out_ << theme::info(fmt::format("Running {} on host {} with IP {}",
                                        request.display_label(), config.host(), resolved_));
        out_.flush();  // before ssh starts writing to the same terminal
    }

    auto argv = build_ssh_command(config, request.remote_cmd);
    state_ = DispatchState::CommandBuilt;
    rcr_log_argv("run:", argv);

    state_ = DispatchState::ProcessLaunched;
    LaunchResult result = launcher_.launch(argv);

    switch (result.status) {
        case LaunchStatus::Completed:
            state_ = DispatchState::Completed;
            return result.exit_code;
        case LaunchStatus::Interrupted:
            state_ = DispatchState::Interrupted;
            return EXIT_INTERRUPTED;
        case LaunchStatus::LaunchFailed:
            break;
    }

    state_ = DispatchState::LaunchFailed;
    err_ << theme::fail(fmt::format("Could not start the ssh client ({}): {}",
                                    argv.front(), result.error));
    err_ << theme::step("Install the OpenSSH client and ensure 'ssh' is in PATH.");
    return EXIT_FAILURE_CODE;
}
