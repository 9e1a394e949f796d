#include "channel.hpp"
#include "session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/terminal.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>

static_assert(CHANNEL_AGAIN == LIBSSH2_ERROR_EAGAIN, "CHANNEL_AGAIN must match libssh2");

const char* channel_kind_name(ChannelKind kind) {
    switch (kind) {
        case ChannelKind::FileTransferSubsystem: return "file-transfer";
        case ChannelKind::OneShotExec:           return "exec";
        case ChannelKind::InteractiveShell:      return "shell";
    }
    return "unknown";
}

PtyOptions PtyOptions::from_terminal(int fd, const std::string& term_type) {
    PtyOptions pty;
    pty.term_type = term_type;
    pty.cols = platform::term_width(fd);
    pty.rows = platform::term_height(fd);
    return pty;
}

ChannelKind request_kind(const ChannelRequest& request) {
    if (std::holds_alternative<ExecRequest>(request)) return ChannelKind::OneShotExec;
    if (std::holds_alternative<ShellRequest>(request)) return ChannelKind::InteractiveShell;
    return ChannelKind::FileTransferSubsystem;
}

std::string login_shell_command(const std::string& directory) {
    return "cd " + shell_escape(directory) + " && exec $SHELL -l";
}

Result<void> setup_step_error(int rc, SetupStep step, const std::string& context,
                              const std::string& detail) {
    std::string msg = Session::error_message(rc, context, detail);
    if (Session::is_transport_error(rc)) return Result<void>::Err(ErrorKind::Transport, msg);
    return Result<void>::SetupErr(step, msg);
}

SetupStep sftp_init_failed_step(const std::string& detail) {
    if (detail.find("subsystem") != std::string::npos ||
        detail.find("SFTP") != std::string::npos ||
        detail.find("FXP") != std::string::npos) {
        return SetupStep::Subsystem;
    }
    return SetupStep::Open;
}

// Failed setup step: transport-class codes break the whole session,
// everything else only abandons this channel attempt.
static Result<void> setup_failure(Session& session, int rc, SetupStep step,
                                  const std::string& context,
                                  const std::string& detail) {
    auto r = setup_step_error(rc, step, context, detail);
    if (r.kind == ErrorKind::Transport) session.invalidate(r.error);
    return r;
}

static Result<void> setup_failure(Session& session, int rc, SetupStep step,
                                  const std::string& context) {
    return setup_failure(session, rc, step, context, session.last_error_message());
}

// ── Setup sequences ────────────────────────────────────────────

struct Channel::Opener {
    Channel& ch;

    Result<void> operator()(const FileTransferRequest&) const {
        // libssh2_sftp_init opens the session channel and negotiates the
        // subsystem in one call.
        return ch.start_sftp();
    }

    Result<void> operator()(const ExecRequest& req) const {
        auto r = ch.open_session_channel();
        if (r.is_err()) return r;
        r = ch.request_pty(req.pty);
        if (r.is_err()) return r;
        return ch.start_exec(req.command);
    }

    Result<void> operator()(const ShellRequest& req) const {
        auto r = ch.open_session_channel();
        if (r.is_err()) return r;
        r = ch.request_pty(req.pty);
        if (r.is_err()) return r;
        return ch.start_exec(login_shell_command(req.initial_directory));
    }
};

Result<std::unique_ptr<Channel>> Channel::open(const std::shared_ptr<Session>& session,
                                               const ChannelRequest& request) {
    using R = Result<std::unique_ptr<Channel>>;

    if (!session) {
        return R::SetupErr(SetupStep::Open, "No session");
    }
    auto usable = session->check_usable();
    if (usable.is_err()) return R::From(usable);

    ChannelKind kind = request_kind(request);
    std::unique_ptr<Channel> ch(new Channel(session, kind));
    bssh_log(fmt::format("open {} channel", channel_kind_name(kind)));

    auto r = std::visit(Opener{*ch}, request);
    if (r.is_err()) {
        bssh_log_error(fmt::format("{} channel setup", channel_kind_name(kind)), r);
        ch->close();
        return R::From(r);
    }
    return R::Ok(std::move(ch));
}

Channel::Channel(std::shared_ptr<Session> session, ChannelKind kind)
    : session_(std::move(session)), kind_(kind) {}

Channel::~Channel() {
    close();
}

Result<void> Channel::open_session_channel() {
    LIBSSH2_SESSION* raw = session_->raw();
    int rc = 0;
    void* handle = session_->retry_handle([raw]() -> void* {
        return libssh2_channel_open_session(raw);
    }, &rc);
    if (!handle) {
        return setup_failure(*session_, rc, SetupStep::Open, "Failed to open session channel");
    }
    channel_ = static_cast<LIBSSH2_CHANNEL*>(handle);
    return Result<void>::Ok();
}

Result<void> Channel::request_pty(const PtyOptions& pty) {
    LIBSSH2_CHANNEL* ch = channel_;
    int rc = session_->retry([&] {
        return libssh2_channel_request_pty_ex(
            ch, pty.term_type.c_str(), static_cast<unsigned>(pty.term_type.size()),
            nullptr, 0, pty.cols, pty.rows, 0, 0);
    });
    if (rc != 0) {
        return setup_failure(*session_, rc, SetupStep::Pty, "Failed to request PTY");
    }
    return Result<void>::Ok();
}

Result<void> Channel::start_exec(const std::string& command) {
    LIBSSH2_CHANNEL* ch = channel_;
    int rc = session_->retry([&] {
        return libssh2_channel_process_startup(
            ch, "exec", 4, command.c_str(), static_cast<unsigned>(command.size()));
    });
    if (rc != 0) {
        return setup_failure(*session_, rc, SetupStep::Exec, "Failed to exec '" + command + "'");
    }
    return Result<void>::Ok();
}

Result<void> Channel::start_sftp() {
    LIBSSH2_SESSION* raw = session_->raw();
    int rc = 0;
    void* handle = session_->retry_handle([raw]() -> void* {
        return libssh2_sftp_init(raw);
    }, &rc);
    if (!handle) {
        std::string detail = session_->last_error_message();
        SetupStep step = sftp_init_failed_step(detail);
        const char* context = step == SetupStep::Subsystem
            ? "Failed to request SFTP subsystem"
            : "Failed to open session channel";
        return setup_failure(*session_, rc, step, context, detail);
    }
    sftp_ = static_cast<LIBSSH2_SFTP*>(handle);
    channel_ = libssh2_sftp_get_channel(sftp_);
    return Result<void>::Ok();
}

// ── I/O ────────────────────────────────────────────────────────

int Channel::try_read(char* buf, size_t len) {
    std::lock_guard<std::mutex> lock(session_->io_mutex());
    if (!channel_ || !session_->is_usable()) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
    ssize_t n = libssh2_channel_read(channel_, buf, len);
    if (n > 0) session_->note_activity();
    return static_cast<int>(n);
}

int Channel::try_read_stderr(char* buf, size_t len) {
    std::lock_guard<std::mutex> lock(session_->io_mutex());
    if (!channel_ || !session_->is_usable()) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
    ssize_t n = libssh2_channel_read_stderr(channel_, buf, len);
    if (n > 0) session_->note_activity();
    return static_cast<int>(n);
}

Result<void> Channel::write_all(const char* data, size_t len) {
    if (!channel_) return Result<void>::Err(ErrorKind::RemoteOperation, "Channel closed");

    size_t sent = 0;
    while (sent < len) {
        LIBSSH2_CHANNEL* ch = channel_;
        int w = session_->retry([&] {
            return static_cast<int>(libssh2_channel_write(ch, data + sent, len - sent));
        });
        if (w < 0) {
            return session_->fail<void>(w, ErrorKind::RemoteOperation, "Channel write failed");
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

bool Channel::eof() {
    std::lock_guard<std::mutex> lock(session_->io_mutex());
    if (!channel_ || !session_->is_usable()) return true;
    return libssh2_channel_eof(channel_) != 0;
}

Result<int> Channel::finish() {
    if (!channel_) return Result<int>::Err(ErrorKind::RemoteOperation, "Channel closed");
    LIBSSH2_CHANNEL* ch = channel_;

    int rc = session_->retry([ch] { return libssh2_channel_close(ch); });
    if (rc != 0) {
        return session_->fail<int>(rc, ErrorKind::RemoteOperation, "Failed to close channel");
    }
    rc = session_->retry([ch] { return libssh2_channel_wait_closed(ch); });
    if (rc != 0) {
        return session_->fail<int>(rc, ErrorKind::RemoteOperation, "Failed waiting for channel close");
    }
    closed_remote_ = true;

    std::lock_guard<std::mutex> lock(session_->io_mutex());
    return Result<int>::Ok(libssh2_channel_get_exit_status(ch));
}

Result<void> Channel::resize_pty(int cols, int rows) {
    if (!channel_) return Result<void>::Err(ErrorKind::RemoteOperation, "Channel closed");
    LIBSSH2_CHANNEL* ch = channel_;
    int rc = session_->retry([&] {
        return libssh2_channel_request_pty_size_ex(ch, cols, rows, 0, 0);
    });
    if (rc != 0) {
        return session_->fail<void>(rc, ErrorKind::RemoteOperation, "Failed to resize PTY");
    }
    return Result<void>::Ok();
}

void Channel::close() {
    if (!channel_ && !sftp_) return;

    // After a transport failure the session frees the channel itself;
    // retry() bails out without touching the handle.
    int rc = 0;
    if (sftp_) {
        LIBSSH2_SFTP* sftp = sftp_;
        rc = session_->retry([sftp] { return libssh2_sftp_shutdown(sftp); });
    } else {
        LIBSSH2_CHANNEL* ch = channel_;
        if (!closed_remote_) {
            rc = session_->retry([ch] { return libssh2_channel_close(ch); });
        }
        int free_rc = session_->retry([ch] { return libssh2_channel_free(ch); });
        if (rc == 0) rc = free_rc;
    }
    if (rc != 0) {
        bssh_log(fmt::format("{} channel close rc={}", channel_kind_name(kind_), rc));
    }

    sftp_ = nullptr;
    channel_ = nullptr;
    bssh_log(fmt::format("{} channel closed", channel_kind_name(kind_)));
}
