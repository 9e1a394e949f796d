#include "bssh_service.hpp"
#include <core/log.hpp>
#include <sftp/libssh2_sftp_channel.hpp>
#include <sftp/sftp_channel_pool.hpp>
#include <ssh/exec.hpp>
#include <fmt/format.h>

BsshService::BsshService(Config config) : config_(std::move(config)) {}

BsshService::~BsshService() {
    disconnect();
}

// ── Connection lifecycle ──────────────────────────────────────

Result<void> BsshService::connect(const ConnectionParams& params, StatusCallback cb) {
    disconnect();
    params_ = params;

    SessionOptions options;
    options.connect_timeout = config_.connection().connect_timeout;
    options.inactivity_timeout = config_.connection().inactivity_timeout;
    options.keepalive_interval = config_.connection().keepalive_interval;

    auto session = Session::connect(params, options, accept_any_host_key, cb);
    if (session.is_err()) return Result<void>::From(session);
    session_ = session.value;

    if (cb) cb("Opening SFTP subsystem...");
    auto pool = open_sftp_pool(config_.listing().sftp_channels);
    if (pool.is_err()) {
        disconnect();
        return Result<void>::From(pool);
    }
    sftp_ = std::move(pool.value);
    return Result<void>::Ok();
}

// The first channel is required. Servers cap channels per connection
// (OpenSSH MaxSessions), so a refused extra one only shrinks the pool.
Result<std::unique_ptr<SftpChannel>> BsshService::open_sftp_pool(int count) {
    using R = Result<std::unique_ptr<SftpChannel>>;
    std::vector<std::unique_ptr<SftpChannel>> slots;
    for (int i = 0; i < count; i++) {
        auto channel = session_->open_channel(FileTransferRequest{});
        if (channel.is_err()) {
            if (slots.empty() || channel.kind == ErrorKind::Transport) return R::From(channel);
            bssh_log_error(fmt::format("sftp channel {} of {}", i + 1, count), channel);
            break;
        }
        slots.push_back(std::make_unique<Libssh2SftpChannel>(std::move(channel.value)));
    }
    bssh_log(fmt::format("sftp pool: {} channels", slots.size()));
    return R::Ok(std::make_unique<SftpChannelPool>(std::move(slots)));
}

void BsshService::disconnect() {
    shell_.reset();
    sftp_.reset();
    if (session_) {
        session_->close();
        session_.reset();
        bssh_log("disconnected " + params_.display_name());
    }
}

bool BsshService::is_connected() const {
    return session_ && session_->is_usable() && sftp_;
}

std::string BsshService::status_line() const {
    if (!session_) return "not connected";
    std::string line = params_.display_name();
    if (session_->is_usable()) {
        line += " connected";
    } else {
        std::string reason = session_->invalid_reason();
        line += " disconnected" + (reason.empty() ? "" : " (" + reason + ")");
    }
    if (shell_) line += fmt::format(", shell {}", shell_state_name(shell_->state()));
    return line;
}

Result<void> BsshService::require_connected() const {
    if (!session_ || !sftp_) {
        return Result<void>::Err(ErrorKind::Transport, "Not connected");
    }
    return session_->check_usable();
}

// ── File operations ───────────────────────────────────────────

Result<std::vector<FileEntry>> BsshService::list(const std::string& path) {
    auto ok = require_connected();
    if (ok.is_err()) return Result<std::vector<FileEntry>>::From(ok);
    return list_directory(*sftp_, path, config_.listing().max_parallel_stats);
}

Result<uint64_t> BsshService::download(const std::string& remote, const std::string& local,
                                       ProgressCallback progress) {
    auto ok = require_connected();
    if (ok.is_err()) return Result<uint64_t>::From(ok);
    return download_file(*sftp_, remote, local, config_.transfer().chunk_size, std::move(progress));
}

Result<uint64_t> BsshService::upload(const std::string& local, const std::string& remote,
                                     ProgressCallback progress) {
    auto ok = require_connected();
    if (ok.is_err()) return Result<uint64_t>::From(ok);
    return upload_file(*sftp_, local, remote, config_.transfer().chunk_size, std::move(progress));
}

Result<void> BsshService::remove_file(const std::string& path) {
    auto ok = require_connected();
    if (ok.is_err()) return ok;
    return delete_file(*sftp_, path);
}

Result<void> BsshService::remove_directory(const std::string& path) {
    auto ok = require_connected();
    if (ok.is_err()) return ok;
    return delete_directory(*sftp_, path);
}

Result<void> BsshService::make_directory(const std::string& path) {
    auto ok = require_connected();
    if (ok.is_err()) return ok;
    return create_directory(*sftp_, path);
}

Result<void> BsshService::rename(const std::string& from, const std::string& to) {
    auto ok = require_connected();
    if (ok.is_err()) return ok;
    return rename_path(*sftp_, from, to);
}

Result<std::string> BsshService::read_text(const std::string& path) {
    auto ok = require_connected();
    if (ok.is_err()) return Result<std::string>::From(ok);
    return read_text_file(*sftp_, path);
}

Result<void> BsshService::write_text(const std::string& path, const std::string& text) {
    auto ok = require_connected();
    if (ok.is_err()) return ok;
    return write_text_file(*sftp_, path, text);
}

// ── Shell operations ──────────────────────────────────────────

Result<SSHResult> BsshService::exec(const std::string& command) {
    auto ok = require_connected();
    if (ok.is_err()) return Result<SSHResult>::From(ok);
    return exec_one_shot(session_, command,
                         PtyOptions::from_terminal(STDOUT_FILENO, config_.terminal().type));
}

Result<ForwardOutcome> BsshService::shell(const std::string& directory) {
    auto ok = require_connected();
    if (ok.is_err()) return Result<ForwardOutcome>::From(ok);

    if (!shell_ || !shell_->active()) {
        ShellRequest req;
        req.initial_directory = directory;
        req.pty = PtyOptions::from_terminal(STDOUT_FILENO, config_.terminal().type);
        auto channel = session_->open_channel(req);
        if (channel.is_err()) return Result<ForwardOutcome>::From(channel);
        shell_ = std::make_unique<ShellSession>(
            std::make_unique<ChannelStream>(std::move(channel.value)));
    }

    ForwardOptions options;
    options.detach_byte = static_cast<unsigned char>(config_.terminal().detach_key);
    auto outcome = shell_->run(options);

    // A shell lost with its session is a transport failure, not an exit
    if (outcome.is_ok() && outcome.value == ForwardOutcome::RemoteClosed) {
        auto usable = session_->check_usable();
        if (usable.is_err()) return Result<ForwardOutcome>::From(usable);
    }
    return outcome;
}
