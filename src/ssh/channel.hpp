#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <variant>
#include <unistd.h>
#include <core/types.hpp>
#include <core/constants.hpp>

typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;

class Session;

enum class ChannelKind {
    FileTransferSubsystem,
    OneShotExec,
    InteractiveShell,
};

const char* channel_kind_name(ChannelKind kind);

struct PtyOptions {
    std::string term_type = DEFAULT_TERM_TYPE;
    int cols = DEFAULT_TERM_COLS;
    int rows = DEFAULT_TERM_ROWS;

    // Size taken from the local terminal (80x24 when fd is not a tty)
    static PtyOptions from_terminal(int fd = STDOUT_FILENO,
                                    const std::string& term_type = DEFAULT_TERM_TYPE);
};

// ── Channel requests ───────────────────────────────────────────
// One variant per channel kind; the setup sequence lives in Channel::open.

struct FileTransferRequest {};

struct ExecRequest {
    std::string command;
    PtyOptions pty;
};

struct ShellRequest {
    std::string initial_directory;
    PtyOptions pty;
};

using ChannelRequest = std::variant<FileTransferRequest, ExecRequest, ShellRequest>;

ChannelKind request_kind(const ChannelRequest& request);

// "cd '<dir>' && exec $SHELL -l"
std::string login_shell_command(const std::string& directory);

// Error for a failed setup step, given the libssh2 code and message.
// Transport-class codes give ErrorKind::Transport; anything else gives
// ErrorKind::ChannelSetup naming the step.
Result<void> setup_step_error(int rc, SetupStep step, const std::string& context,
                              const std::string& detail);

// libssh2_sftp_init opens the channel and requests the subsystem in one
// call; its error message tells which of the two failed.
SetupStep sftp_init_failed_step(const std::string& detail);

// Non-blocking read result when nothing is buffered yet
constexpr int CHANNEL_AGAIN = -37;   // == LIBSSH2_ERROR_EAGAIN

// A logical channel on a Session. Owned exclusively by whoever opened it;
// closed on destruction or when the session goes away, whichever is first.
//
// Every libssh2 call goes through the session's retry loop, so a blocked
// channel only waits on the socket and never holds the session lock.
class Channel {
public:
    // Run the setup sequence for the request. Any failed step abandons the
    // attempt and returns ErrorKind::ChannelSetup naming the step (or
    // ErrorKind::Transport when the session itself broke).
    static Result<std::unique_ptr<Channel>> open(const std::shared_ptr<Session>& session,
                                                 const ChannelRequest& request);

    ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    ChannelKind kind() const { return kind_; }
    const std::shared_ptr<Session>& session() const { return session_; }

    // Serializes operations issued against this channel
    std::mutex& op_mutex() { return op_mutex_; }

    // Single non-blocking read: >0 bytes, 0 at end of stream,
    // CHANNEL_AGAIN when nothing is buffered, other negatives are errors.
    // Once the session is unusable every read fails with a transport code.
    int try_read(char* buf, size_t len);
    int try_read_stderr(char* buf, size_t len);

    // Block until the whole buffer is accepted by the channel
    Result<void> write_all(const char* data, size_t len);

    // Remote side has sent EOF, or the session is gone
    bool eof();

    // Close the channel and wait for the server's close, then return the
    // remote exit status.
    Result<int> finish();

    Result<void> resize_pty(int cols, int rows);

    // SFTP handle (FileTransferSubsystem only)
    LIBSSH2_SFTP* sftp() const { return sftp_; }

    void close();
    bool is_open() const { return channel_ != nullptr; }

private:
    Channel(std::shared_ptr<Session> session, ChannelKind kind);

    struct Opener;
    Result<void> open_session_channel();
    Result<void> request_pty(const PtyOptions& pty);
    Result<void> start_exec(const std::string& command);
    Result<void> start_sftp();

    std::shared_ptr<Session> session_;
    ChannelKind kind_;
    LIBSSH2_CHANNEL* channel_ = nullptr;
    LIBSSH2_SFTP* sftp_ = nullptr;
    std::mutex op_mutex_;
    bool closed_remote_ = false;
};
