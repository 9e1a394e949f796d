#include "shell_session.hpp"
#include <core/log.hpp>
#include <platform/terminal.hpp>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <optional>

const char* shell_state_name(ShellState state) {
    switch (state) {
        case ShellState::Suspended:  return "suspended";
        case ShellState::Forwarding: return "forwarding";
        case ShellState::Terminated: return "terminated";
    }
    return "unknown";
}

static bool write_fd(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t w = ::write(fd, data, len);
        if (w < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return false;
        }
        data += w;
        len -= static_cast<size_t>(w);
    }
    return true;
}

// SIGWINCH handler installed for one forwarding loop
struct ResizeWatch {
    bool on;
    explicit ResizeWatch(bool enable) : on(enable) {
        if (on) platform::watch_terminal_resize();
    }
    ~ResizeWatch() {
        if (on) platform::unwatch_terminal_resize();
    }
};

// ── Lifecycle ──────────────────────────────────────────────────

ShellSession::ShellSession(std::unique_ptr<DuplexStream> stream)
    : stream_(std::move(stream)) {
    if (!stream_) state_ = ShellState::Terminated;
}

ShellSession::~ShellSession() = default;

ShellState ShellSession::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void ShellSession::close() {
    std::unique_ptr<DuplexStream> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ShellState::Forwarding) return;
        dropped = std::move(stream_);
        state_ = ShellState::Terminated;
    }
    bssh_log("shell closed");
}

// ── Forwarding ─────────────────────────────────────────────────

Result<ForwardOutcome> ShellSession::run(const ForwardOptions& options) {
    using R = Result<ForwardOutcome>;

    std::unique_ptr<DuplexStream> stream;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == ShellState::Terminated) {
            return R::Err(ErrorKind::ShellTerminated, "Remote shell has exited");
        }
        if (state_ == ShellState::Forwarding) {
            return R::Err(ErrorKind::ShellBusy, "Shell is already being forwarded");
        }
        state_ = ShellState::Forwarding;
        stream = std::move(stream_);
    }
    bssh_log("shell: suspended -> forwarding");

    auto halves = split_stream(std::move(stream));
    ForwardOutcome outcome = ForwardOutcome::Detached;
    try {
        // Declaration order matters: the alternate screen is left before
        // the terminal mode is restored.
        std::optional<platform::RawModeGuard> raw;
        if (options.raw_mode) raw.emplace(options.input_fd);
        std::optional<platform::AltScreenGuard> alt;
        if (options.alt_screen) alt.emplace(options.output_fd);
        ResizeWatch resize(options.track_resize);

        if (options.track_resize) {
            halves.second.resize(platform::term_width(options.output_fd),
                                 platform::term_height(options.output_fd));
        }
        outcome = forward(halves.first, halves.second, options);
    } catch (...) {
        finish(ForwardOutcome::Detached, std::move(halves.first), std::move(halves.second));
        throw;
    }

    finish(outcome, std::move(halves.first), std::move(halves.second));
    return R::Ok(outcome);
}

ForwardOutcome ShellSession::forward(ReadHalf& reader, WriteHalf& writer,
                                     const ForwardOptions& options) {
    char rbuf[SHELL_REMOTE_BUF_SIZE];
    char lbuf[SHELL_LOCAL_BUF_SIZE];
    bool input_open = true;

    for (;;) {
        if (options.track_resize && platform::take_resize()) {
            writer.resize(platform::term_width(options.output_fd),
                          platform::term_height(options.output_fd));
        }

        // Remote -> local. Drain everything buffered first: the transport
        // may hold data the socket no longer signals.
        for (;;) {
            int n = reader.read_some(rbuf, sizeof(rbuf));
            if (n == STREAM_AGAIN) break;
            if (n <= 0) {
                bssh_log(n == 0 ? "shell: remote end of stream" : "shell: remote read error");
                return ForwardOutcome::RemoteClosed;
            }
            if (!write_fd(options.output_fd, rbuf, static_cast<size_t>(n))) {
                bssh_log(std::string("shell: local write failed: ") + std::strerror(errno));
                return ForwardOutcome::Detached;
            }
        }

        struct pollfd fds[2];
        nfds_t nfds = 1;
        fds[0] = {reader.wait_fd(), POLLIN, 0};
        if (input_open) {
            fds[1] = {options.input_fd, POLLIN, 0};
            nfds = 2;
        }

        int pr = poll(fds, nfds, options.wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            bssh_log(std::string("shell: poll failed: ") + std::strerror(errno));
            return ForwardOutcome::Detached;
        }
        if (pr == 0 || nfds < 2) continue;
        if (!(fds[1].revents & (POLLIN | POLLHUP | POLLERR))) continue;

        // Local -> remote
        ssize_t n = ::read(options.input_fd, lbuf, sizeof(lbuf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            input_open = false;
            continue;
        }
        if (n == 0) {
            // Local input closed; keep showing remote output
            input_open = false;
            continue;
        }

        auto* hit = static_cast<const char*>(std::memchr(lbuf, options.detach_byte,
                                                         static_cast<size_t>(n)));
        size_t forward_len = hit ? static_cast<size_t>(hit - lbuf) : static_cast<size_t>(n);
        if (forward_len > 0 && !writer.write_all(lbuf, forward_len)) {
            return ForwardOutcome::RemoteClosed;
        }
        if (hit) return ForwardOutcome::Detached;
    }
}

void ShellSession::finish(ForwardOutcome outcome, ReadHalf reader, WriteHalf writer) {
    std::unique_ptr<DuplexStream> released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome == ForwardOutcome::Detached) {
            stream_ = unsplit_stream(std::move(reader), std::move(writer));
            state_ = ShellState::Suspended;
        } else {
            released = unsplit_stream(std::move(reader), std::move(writer));
            state_ = ShellState::Terminated;
        }
    }
    bssh_log(std::string("shell: forwarding -> ") +
             (outcome == ForwardOutcome::Detached ? "suspended" : "terminated"));
}
