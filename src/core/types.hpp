#pragma once

#include <string>
#include <utility>
#include <vector>
#include "constants.hpp"

// Failure categories surfaced by the config stage
enum class ErrorKind {
    None,
    ConfigMissing,
    ConfigMalformed,
    SectionMissing,
    FieldMissing,
    PortInvalid,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    std::string hint;                      // optional follow-up line for the user

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None, ""};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err,
                         const std::string& hint = "") {
        return {false, T{}, err, kind, hint};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Connection settings for the remote host. Only ConfigStore hands these out,
// and only after every field validated.
class RemoteConfig {
public:
    RemoteConfig() = default;
    RemoteConfig(std::string host, std::string user, std::string key, int port)
        : host_(std::move(host)), user_(std::move(user)),
          key_(std::move(key)), port_(port) {}

    const std::string& host() const { return host_; }
    const std::string& user() const { return user_; }
    const std::string& key() const { return key_; }
    int port() const { return port_; }

private:
    std::string host_;
    std::string user_;
    std::string key_;
    int port_ = DEFAULT_SSH_PORT;
};

// A command to run on the remote host
struct CommandRequest {
    std::vector<std::string> remote_cmd;
    std::string label;                     // banner label; empty = derive

    // Label shown in the banner: explicit label, else the first token.
    std::string display_label() const {
        if (!label.empty()) return label;
        return remote_cmd.empty() ? "command" : remote_cmd.front();
    }
};

// Outcome of one external process run
enum class LaunchStatus {
    Completed,
    LaunchFailed,
    Interrupted,
};

struct LaunchResult {
    LaunchStatus status;
    int exit_code;
    std::string error;

    static LaunchResult completed(int code) { return {LaunchStatus::Completed, code, ""}; }
    static LaunchResult failed(const std::string& err) { return {LaunchStatus::LaunchFailed, EXIT_FAILURE_CODE, err}; }
    static LaunchResult interrupted() { return {LaunchStatus::Interrupted, EXIT_INTERRUPTED, ""}; }

    bool ok() const { return status == LaunchStatus::Completed; }
};
