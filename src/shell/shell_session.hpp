#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unistd.h>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <ssh/duplex_stream.hpp>

enum class ShellState {
    Suspended,    // no loop running, channel idle but alive
    Forwarding,   // loop moving bytes
    Terminated,   // remote shell exited; absorbing
};

const char* shell_state_name(ShellState state);

struct ForwardOptions {
    int input_fd = STDIN_FILENO;
    int output_fd = STDOUT_FILENO;
    unsigned char detach_byte = DETACH_BYTE;
    bool raw_mode = true;          // RawModeGuard on input_fd
    bool alt_screen = true;        // AltScreenGuard on output_fd
    bool track_resize = true;      // SIGWINCH -> remote PTY size
    int wait_ms = FORWARD_WAIT_MS;
};

enum class ForwardOutcome {
    Detached,       // detach byte seen; back to Suspended
    RemoteClosed,   // end of stream or error; now Terminated
};

// A long-lived interactive shell that can be forwarded to the local
// terminal, detached, and resumed on the same remote process.
class ShellSession {
public:
    explicit ShellSession(std::unique_ptr<DuplexStream> stream);
    ~ShellSession();

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    // Forward until detach or remote exit. Fails with ErrorKind::ShellBusy
    // when another loop is running and ErrorKind::ShellTerminated once the
    // remote side has gone away.
    Result<ForwardOutcome> run(const ForwardOptions& options = ForwardOptions());

    ShellState state() const;
    bool active() const { return state() != ShellState::Terminated; }

    // Drop the channel. Moves to Terminated unless a loop is running.
    void close();

private:
    ForwardOutcome forward(ReadHalf& reader, WriteHalf& writer, const ForwardOptions& options);
    void finish(ForwardOutcome outcome, ReadHalf reader, WriteHalf writer);

    mutable std::mutex mutex_;
    ShellState state_ = ShellState::Suspended;
    std::unique_ptr<DuplexStream> stream_;
};
