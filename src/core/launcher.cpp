#include "launcher.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/process.hpp>
#include <fmt/format.h>

LaunchResult SystemLauncher::launch(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return LaunchResult::failed("empty command");
    }

    // Installed before spawning so a Ctrl-C at any point after this is
    // reported as an interrupt. The child resets the handler on exec.
    platform::InterruptGuard guard;

    std::vector<std::string> args(argv.begin() + 1, argv.end());
    auto proc = platform::spawn(argv.front(), args);
    if (!proc.valid()) {
        rcr_log(fmt::format("launch: spawn failed: {}", proc.error()));
        return LaunchResult::failed(proc.error());
    }
    rcr_log(fmt::format("launch: started {}", argv.front()));

    int code = proc.wait();
    if (code == platform::WAIT_INTERRUPTED || guard.triggered()) {
        // The terminal delivered SIGINT to the child too; let it wind down
        if (proc.wait(INTERRUPT_GRACE_MS) == platform::WAIT_TIMED_OUT) {
            proc.terminate();
        }
        rcr_log("launch: interrupted");
        return LaunchResult::interrupted();
    }

    if (code < 0) code = EXIT_FAILURE_CODE;  // status could not be collected
    rcr_log(fmt::format("launch: exit {}", code));
    return LaunchResult::completed(code);
}
