#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Failure categories surfaced by the session engine.
enum class ErrorKind {
    None,
    Transport,        // handshake / network / inactivity; session must be discarded
    Auth,             // key unreadable or rejected; session must be discarded
    ChannelSetup,     // open / pty / subsystem / exec request failed
    RemoteOperation,  // a single remote file or exec call failed
    LocalIo,          // local filesystem access failed during a transfer
    CommandFailed,    // one-shot command exited non-zero
    ShellTerminated,  // remote shell already exited
    ShellBusy,        // a forwarding loop is already running
    InvalidArgument,
    Config,
};

// Which step of a channel setup sequence failed.
enum class SetupStep {
    None,
    Open,
    Pty,
    Subsystem,
    Exec,
};

const char* error_kind_name(ErrorKind kind);
const char* setup_step_name(SetupStep step);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    SetupStep step = SetupStep::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None, SetupStep::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind, SetupStep::None};
    }

    // Failure that still carries a partial value (e.g. output of a failed command).
    static Result<T> Err(ErrorKind kind, const std::string& err, T partial) {
        return {false, std::move(partial), err, kind, SetupStep::None};
    }

    static Result<T> SetupErr(SetupStep step, const std::string& err) {
        return {false, T{}, err, ErrorKind::ChannelSetup, step};
    }

    // Re-type another result's failure.
    template <typename U>
    static Result<T> From(const Result<U>& other) {
        return {false, T{}, other.error, other.kind, other.step};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;
    SetupStep step = SetupStep::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None, SetupStep::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind, SetupStep::None};
    }

    static Result<void> SetupErr(SetupStep step, const std::string& err) {
        return {false, err, ErrorKind::ChannelSetup, step};
    }

    template <typename U>
    static Result<void> From(const Result<U>& other) {
        return {false, other.error, other.kind, other.step};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Human-readable status line for the boundary ("Transport error: ...").
template <typename T>
std::string describe_error(const Result<T>& r) {
    std::string out = error_kind_name(r.kind);
    if (r.kind == ErrorKind::ChannelSetup && r.step != SetupStep::None) {
        out += " (";
        out += setup_step_name(r.step);
        out += ")";
    }
    return out + ": " + r.error;
}

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Identifies one remote endpoint. Immutable once a session is established.
struct ConnectionParams {
    std::string host;
    int port = 22;
    std::string username;
    std::optional<std::string> identity_key_path;

    // "user@host:port", also the persistence key for session state
    std::string display_name() const;
};

// Snapshot of one directory entry. Not kept in sync with the remote.
struct FileEntry {
    std::string name;
    std::string path;
    bool is_dir = false;
    uint64_t size = 0;
    std::optional<int64_t> modified;      // seconds since epoch
    std::optional<uint32_t> permissions;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
