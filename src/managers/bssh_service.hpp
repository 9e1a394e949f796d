#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/session.hpp>
#include <sftp/sftp_channel.hpp>
#include <sftp/file_ops.hpp>
#include <shell/shell_session.hpp>

// Headless facade over one remote session: the file-transfer channels opened
// at connect time, one-shot exec, and the long-lived interactive shell.
class BsshService {
public:
    explicit BsshService(Config config = Config());
    ~BsshService();

    // ── Connection lifecycle ──────────────────────────────────

    // Connect, authenticate, and open the file-transfer channels.
    Result<void> connect(const ConnectionParams& params, StatusCallback cb = nullptr);
    void disconnect();

    bool is_connected() const;
    const ConnectionParams& params() const { return params_; }
    const Config& config() const { return config_; }

    // One line: "user@host:port connected (shell suspended)" etc.
    std::string status_line() const;

    // ── File operations ───────────────────────────────────────

    Result<std::vector<FileEntry>> list(const std::string& path);
    Result<uint64_t> download(const std::string& remote, const std::string& local,
                              ProgressCallback progress = nullptr);
    Result<uint64_t> upload(const std::string& local, const std::string& remote,
                            ProgressCallback progress = nullptr);
    Result<void> remove_file(const std::string& path);
    Result<void> remove_directory(const std::string& path);
    Result<void> make_directory(const std::string& path);
    Result<void> rename(const std::string& from, const std::string& to);
    Result<std::string> read_text(const std::string& path);
    Result<void> write_text(const std::string& path, const std::string& text);

    // ── Shell operations ──────────────────────────────────────

    Result<SSHResult> exec(const std::string& command);

    // Resume the running shell, or start one in directory when there is none
    // (or the previous one has exited).
    Result<ForwardOutcome> shell(const std::string& directory);

    bool has_shell() const { return shell_ && shell_->active(); }

private:
    Result<void> require_connected() const;
    Result<std::unique_ptr<SftpChannel>> open_sftp_pool(int count);

    Config config_;
    ConnectionParams params_;
    std::shared_ptr<Session> session_;
    std::unique_ptr<SftpChannel> sftp_;
    std::unique_ptr<ShellSession> shell_;
};
