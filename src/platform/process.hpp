#pragma once

#include <string>
#include <vector>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#endif

namespace platform {

// Sentinel return values of ProcessHandle::wait().
constexpr int WAIT_TIMED_OUT   = -1;
constexpr int WAIT_INTERRUPTED = -2;

// Opaque handle to a spawned child process. Move-only; a child that is
// still running when the handle is destroyed gets terminated and reaped.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Why spawn() failed. Empty for valid handles.
    const std::string& error() const { return error_; }

    // True if the process is still running.
    bool running();

    // Wait for the process to exit. Returns its exit code, 128 + signal
    // number if it was killed by a signal, or WAIT_TIMED_OUT when timeout_ms
    // elapsed. timeout_ms = -1 means indefinite wait; only an indefinite wait
    // returns WAIT_INTERRUPTED, when an InterruptGuard caught SIGINT.
    // Invalid handles return -1.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM then SIGKILL on Unix, TerminateProcess on Windows).
    void terminate();

private:
    void reset();

#ifdef _WIN32
    HANDLE handle_ = INVALID_HANDLE_VALUE;
    HANDLE thread_ = INVALID_HANDLE_VALUE;
#else
    int pid_ = -1;
#endif
    bool reaped_ = false;
    int exit_code_ = -1;
    std::string error_;

    friend ProcessHandle spawn(const std::string& program,
                               const std::vector<std::string>& args);
};

// Spawn a child process. program is looked up through PATH; args are passed
// as discrete arguments (argv[1..]), never through a shell. The child
// inherits stdin, stdout and stderr.
// Returns an invalid handle carrying error() if the program could not be
// started (not found, not executable, fork failure).
ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args);

// RAII guard that catches SIGINT (Ctrl-C on Windows) for its lifetime instead
// of letting it kill this process. The previous disposition is restored on
// destruction.
class InterruptGuard {
public:
    InterruptGuard();
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

    // True once SIGINT arrived while the guard was installed.
    bool triggered() const;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// True if an installed InterruptGuard has caught SIGINT.
bool interrupt_requested();

} // namespace platform
