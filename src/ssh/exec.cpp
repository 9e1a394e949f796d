#include "exec.hpp"
#include "session.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

Result<SSHResult> collect_output(Channel& channel) {
    SSHResult result{-1, "", ""};
    char buf[SSH_READ_BUF_SIZE];
    bool out_done = false;
    bool err_done = false;

    while (!out_done || !err_done) {
        bool progressed = false;

        if (!out_done) {
            int n = channel.try_read(buf, sizeof(buf));
            if (n > 0) {
                result.stdout_data.append(buf, static_cast<size_t>(n));
                progressed = true;
            } else if (n == 0) {
                out_done = true;
            } else if (n != CHANNEL_AGAIN) {
                return channel.session()->fail<SSHResult>(n, ErrorKind::RemoteOperation,
                                                         "Failed to read command output");
            }
        }

        if (!err_done) {
            int n = channel.try_read_stderr(buf, sizeof(buf));
            if (n > 0) {
                result.stderr_data.append(buf, static_cast<size_t>(n));
                progressed = true;
            } else if (n == 0) {
                err_done = true;
            } else if (n != CHANNEL_AGAIN) {
                return channel.session()->fail<SSHResult>(n, ErrorKind::RemoteOperation,
                                                         "Failed to read command stderr");
            }
        }

        if (!progressed && (!out_done || !err_done)) {
            if (!channel.session()->wait_socket()) {
                return Result<SSHResult>::Err(ErrorKind::Transport,
                    "Session lost while reading output: " + channel.session()->invalid_reason());
            }
        }
    }

    auto status = channel.finish();
    if (status.is_err()) return Result<SSHResult>::From(status);
    result.exit_code = status.value;
    return Result<SSHResult>::Ok(std::move(result));
}

Result<SSHResult> exec_one_shot(const std::shared_ptr<Session>& session,
                                const std::string& command,
                                const PtyOptions& pty) {
    auto ch = Channel::open(session, ExecRequest{command, pty});
    if (ch.is_err()) return Result<SSHResult>::From(ch);

    auto out = collect_output(*ch.value);
    if (out.is_err()) return out;

    bssh_log_ssh("exec", command, out.value);
    if (out.value.failed()) {
        std::string msg = fmt::format("Command exited with code {}", out.value.exit_code);
        std::string text = out.value.get_output();
        if (!text.empty()) msg += ": " + text;
        return Result<SSHResult>::Err(ErrorKind::CommandFailed, msg, std::move(out.value));
    }
    return out;
}
