#include "process.hpp"
#include "platform.hpp"

#include <csignal>

#ifdef _WIN32
#  include <windows.h>
#else
#  include <unistd.h>
#  include <sys/wait.h>
#  include <signal.h>
#  include <fcntl.h>
#  include <cerrno>
#  include <cstring>
#endif

namespace platform {

namespace {

constexpr int kSignalExitBase = 128;
constexpr int kPollIntervalMs = 50;
constexpr int kTerminateGraceMs = 2000;

volatile std::sig_atomic_t g_interrupted = 0;

#ifdef _WIN32

BOOL WINAPI ctrl_handler(DWORD type) {
    if (type == CTRL_C_EVENT || type == CTRL_BREAK_EVENT) {
        g_interrupted = 1;
        return TRUE;
    }
    return FALSE;
}

#else

void sigint_handler(int) {
    g_interrupted = 1;
}

// Map a waitpid status to a shell-style exit code.
int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return kSignalExitBase + WTERMSIG(status);
    return -1;
}

#endif

} // namespace

bool interrupt_requested() {
    return g_interrupted != 0;
}

// ── InterruptGuard ───────────────────────────────────────────

#ifdef _WIN32

struct InterruptGuard::Impl {};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    g_interrupted = 0;
    SetConsoleCtrlHandler(ctrl_handler, TRUE);
}

InterruptGuard::~InterruptGuard() {
    SetConsoleCtrlHandler(ctrl_handler, FALSE);
    delete impl_;
}

#else

struct InterruptGuard::Impl {
    struct sigaction old_sa;
};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    g_interrupted = 0;

    // No SA_RESTART: a blocking waitpid() must return EINTR on Ctrl-C.
    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &impl_->old_sa);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &impl_->old_sa, nullptr);
    delete impl_;
}

#endif

bool InterruptGuard::triggered() const {
    return interrupt_requested();
}

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    reset();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
#ifdef _WIN32
    handle_ = other.handle_;
    thread_ = other.thread_;
    other.handle_ = INVALID_HANDLE_VALUE;
    other.thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = other.pid_;
    other.pid_ = -1;
#endif
    reaped_ = other.reaped_;
    exit_code_ = other.exit_code_;
    error_ = std::move(other.error_);
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        reset();
#ifdef _WIN32
        handle_ = other.handle_;
        thread_ = other.thread_;
        other.handle_ = INVALID_HANDLE_VALUE;
        other.thread_ = INVALID_HANDLE_VALUE;
#else
        pid_ = other.pid_;
        other.pid_ = -1;
#endif
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        error_ = std::move(other.error_);
    }
    return *this;
}

void ProcessHandle::reset() {
    if (valid() && running()) terminate();
#ifdef _WIN32
    if (handle_ != INVALID_HANDLE_VALUE) CloseHandle(handle_);
    if (thread_ != INVALID_HANDLE_VALUE) CloseHandle(thread_);
    handle_ = INVALID_HANDLE_VALUE;
    thread_ = INVALID_HANDLE_VALUE;
#else
    pid_ = -1;
#endif
}

bool ProcessHandle::valid() const {
#ifdef _WIN32
    return handle_ != INVALID_HANDLE_VALUE;
#else
    return pid_ > 0;
#endif
}

bool ProcessHandle::running() {
    if (!valid() || reaped_) return false;
#ifdef _WIN32
    DWORD code;
    if (!GetExitCodeProcess(handle_, &code)) return false;
    if (code == STILL_ACTIVE) return true;
    reaped_ = true;
    exit_code_ = static_cast<int>(code);
    return false;
#else
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == 0) return true;  // 0 means still running
    reaped_ = true;
    if (ret == pid_) exit_code_ = decode_status(status);
    return false;
#endif
}

int ProcessHandle::wait(int timeout_ms) {
    if (!valid()) return -1;
    if (reaped_) return exit_code_;

#ifdef _WIN32
    int elapsed = 0;
    while (true) {
        DWORD ret = WaitForSingleObject(handle_, kPollIntervalMs);
        if (ret == WAIT_OBJECT_0) {
            DWORD code = 1;
            GetExitCodeProcess(handle_, &code);
            reaped_ = true;
            exit_code_ = static_cast<int>(code);
            return exit_code_;
        }
        if (ret == WAIT_FAILED) {
            reaped_ = true;
            return exit_code_;
        }
        if (timeout_ms < 0) {
            if (interrupt_requested()) return WAIT_INTERRUPTED;
            continue;
        }
        elapsed += kPollIntervalMs;
        if (elapsed >= timeout_ms) return WAIT_TIMED_OUT;
    }
#else
    if (timeout_ms < 0) {
        while (true) {
            int status;
            pid_t ret = waitpid(pid_, &status, 0);
            if (ret == pid_) {
                reaped_ = true;
                exit_code_ = decode_status(status);
                return exit_code_;
            }
            if (ret < 0 && errno == EINTR) {
                if (interrupt_requested()) return WAIT_INTERRUPTED;
                continue;
            }
            // ECHILD: nothing left to wait for
            reaped_ = true;
            return exit_code_;
        }
    }

    // Poll with timeout
    int elapsed = 0;
    while (true) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reaped_ = true;
            exit_code_ = decode_status(status);
            return exit_code_;
        }
        if (ret < 0 && errno != EINTR) {
            reaped_ = true;
            return exit_code_;
        }
        if (elapsed >= timeout_ms) return WAIT_TIMED_OUT;
        sleep_ms(kPollIntervalMs);
        elapsed += kPollIntervalMs;
    }
#endif
}

void ProcessHandle::terminate() {
    if (!valid() || reaped_) return;
#ifdef _WIN32
    TerminateProcess(handle_, 1);
    wait(kTerminateGraceMs);
#else
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    wait(kTerminateGraceMs);
    if (reaped_) return;

    kill(pid_, SIGKILL);
    int status;
    pid_t ret;
    do {
        ret = waitpid(pid_, &status, 0);
    } while (ret < 0 && errno == EINTR);
    reaped_ = true;
    if (ret == pid_) exit_code_ = decode_status(status);
#endif
}

// ── spawn ────────────────────────────────────────────────────

#ifdef _WIN32

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    // Build command line
    std::string cmd_str = "\"" + program + "\"";
    for (const auto& arg : args) {
        cmd_str += " \"" + arg + "\"";
    }

    STARTUPINFOA si = {};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi = {};

    if (!CreateProcessA(nullptr, cmd_str.data(), nullptr, nullptr, TRUE,
                        0, nullptr, nullptr, &si, &pi)) {
        DWORD err = GetLastError();
        if (err == ERROR_FILE_NOT_FOUND || err == ERROR_PATH_NOT_FOUND) {
            handle.error_ = program + ": No such file or directory";
        } else {
            handle.error_ = program + ": CreateProcess failed (error " + std::to_string(err) + ")";
        }
        return handle;
    }

    handle.handle_ = pi.hProcess;
    handle.thread_ = pi.hThread;
    return handle;
}

#else // Unix

ProcessHandle spawn(const std::string& program,
                    const std::vector<std::string>& args) {
    ProcessHandle handle;

    // exec failures are reported back through a close-on-exec pipe: EOF means
    // the exec succeeded, an errno value means it did not.
    int fds[2];
    if (pipe(fds) != 0) {
        handle.error_ = std::string("pipe: ") + std::strerror(errno);
        return handle;
    }
    fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    fcntl(fds[1], F_SETFD, FD_CLOEXEC);

    // Build argv array before forking
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(program.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(fds[0]);
        close(fds[1]);
        handle.error_ = std::string("fork: ") + std::strerror(err);
        return handle;
    }

    if (pid == 0) {
        // Child process
        close(fds[0]);
        execvp(program.c_str(), argv.data());
        int err = errno;
        ssize_t n = write(fds[1], &err, sizeof(err));
        (void)n;
        _exit(127);  // exec failed
    }

    // Parent
    close(fds[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(fds[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(fds[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        pid_t ret;
        do {
            ret = waitpid(pid, nullptr, 0);
        } while (ret < 0 && errno == EINTR);
        handle.error_ = program + ": " + std::strerror(child_errno);
        return handle;
    }

    handle.pid_ = pid;
    return handle;
}

#endif

} // namespace platform
