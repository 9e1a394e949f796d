#include "libssh2_sftp_channel.hpp"
#include <ssh/session.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>

std::string sftp_status_reason(unsigned long status) {
    switch (status) {
        case LIBSSH2_FX_NO_SUCH_FILE:
        case LIBSSH2_FX_NO_SUCH_PATH:          return "not found";
        case LIBSSH2_FX_PERMISSION_DENIED:
        case LIBSSH2_FX_WRITE_PROTECT:         return "permission denied";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS:   return "already exists";
        case LIBSSH2_FX_DIR_NOT_EMPTY:         return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:       return "not a directory";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
        case LIBSSH2_FX_QUOTA_EXCEEDED:        return "no space left";
        case LIBSSH2_FX_FAILURE:               return "operation failed";
        default:                               return fmt::format("sftp status {}", status);
    }
}

// ── RemoteFile ─────────────────────────────────────────────────

class Libssh2RemoteFile : public RemoteFile {
public:
    Libssh2RemoteFile(Channel* channel, LIBSSH2_SFTP_HANDLE* handle, std::string path)
        : channel_(channel), handle_(handle), path_(std::move(path)) {}

    ~Libssh2RemoteFile() override {
        if (handle_) {
            auto r = close();
            if (r.is_err()) bssh_log_error("close " + path_, r);
        }
    }

    Result<size_t> read(char* buf, size_t len) override {
        std::lock_guard<std::mutex> op(channel_->op_mutex());
        LIBSSH2_SFTP_HANDLE* h = handle_;
        int n = channel_->session()->retry([&] {
            return static_cast<int>(libssh2_sftp_read(h, buf, len));
        });
        if (n < 0) return fail<size_t>(n, "read " + path_);
        return Result<size_t>::Ok(static_cast<size_t>(n));
    }

    Result<void> write(const char* data, size_t len) override {
        std::lock_guard<std::mutex> op(channel_->op_mutex());
        LIBSSH2_SFTP_HANDLE* h = handle_;
        size_t sent = 0;
        while (sent < len) {
            int w = channel_->session()->retry([&] {
                return static_cast<int>(libssh2_sftp_write(h, data + sent, len - sent));
            });
            if (w < 0) return fail<void>(w, "write " + path_);
            sent += static_cast<size_t>(w);
        }
        return Result<void>::Ok();
    }

    Result<void> close() override {
        if (!handle_) return Result<void>::Ok();
        std::lock_guard<std::mutex> op(channel_->op_mutex());
        LIBSSH2_SFTP_HANDLE* h = handle_;
        handle_ = nullptr;
        int rc = channel_->session()->retry([h] { return libssh2_sftp_close_handle(h); });
        if (rc != 0) return fail<void>(rc, "close " + path_);
        return Result<void>::Ok();
    }

private:
    template <typename T>
    Result<T> fail(int rc, const std::string& context) {
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
            unsigned long status = libssh2_sftp_last_error(channel_->sftp());
            return Result<T>::Err(ErrorKind::RemoteOperation,
                                  context + ": " + sftp_status_reason(status));
        }
        return channel_->session()->fail<T>(rc, ErrorKind::RemoteOperation, context);
    }

    Channel* channel_;
    LIBSSH2_SFTP_HANDLE* handle_;
    std::string path_;
};

// ── Libssh2SftpChannel ─────────────────────────────────────────

Libssh2SftpChannel::Libssh2SftpChannel(std::unique_ptr<Channel> channel)
    : channel_(std::move(channel)) {}

Libssh2SftpChannel::~Libssh2SftpChannel() = default;

template <typename T>
Result<T> Libssh2SftpChannel::sftp_fail(int rc, const std::string& context) {
    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long status = libssh2_sftp_last_error(channel_->sftp());
        return Result<T>::Err(ErrorKind::RemoteOperation,
                              context + ": " + sftp_status_reason(status));
    }
    return channel_->session()->fail<T>(rc, ErrorKind::RemoteOperation, context);
}

Result<std::vector<std::string>> Libssh2SftpChannel::read_dir(const std::string& path) {
    using R = Result<std::vector<std::string>>;
    std::lock_guard<std::mutex> op(channel_->op_mutex());
    auto& session = *channel_->session();
    LIBSSH2_SFTP* sftp = channel_->sftp();

    int rc = 0;
    void* handle = session.retry_handle([&]() -> void* {
        return libssh2_sftp_open_ex(sftp, path.c_str(), static_cast<unsigned>(path.size()),
                                    0, 0, LIBSSH2_SFTP_OPENDIR);
    }, &rc);
    if (!handle) return sftp_fail<std::vector<std::string>>(rc, "open directory " + path);
    auto* dir = static_cast<LIBSSH2_SFTP_HANDLE*>(handle);

    std::vector<std::string> names;
    char name[SFTP_NAME_BUF_SIZE];
    LIBSSH2_SFTP_ATTRIBUTES attrs;
    int n;
    for (;;) {
        n = session.retry([&] {
            return libssh2_sftp_readdir_ex(dir, name, sizeof(name), nullptr, 0, &attrs);
        });
        if (n <= 0) break;
        names.emplace_back(name, static_cast<size_t>(n));
    }

    R result = n < 0 ? sftp_fail<std::vector<std::string>>(n, "read directory " + path)
                     : R::Ok(std::move(names));

    int close_rc = session.retry([dir] { return libssh2_sftp_close_handle(dir); });
    if (close_rc != 0 && result.is_ok()) {
        return sftp_fail<std::vector<std::string>>(close_rc, "close directory " + path);
    }
    return result;
}

Result<FileAttributes> Libssh2SftpChannel::stat(const std::string& path) {
    std::lock_guard<std::mutex> op(channel_->op_mutex());
    LIBSSH2_SFTP* sftp = channel_->sftp();
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    int rc = channel_->session()->retry([&] {
        return libssh2_sftp_stat_ex(sftp, path.c_str(), static_cast<unsigned>(path.size()),
                                    LIBSSH2_SFTP_STAT, &attrs);
    });
    if (rc != 0) return sftp_fail<FileAttributes>(rc, "stat " + path);

    FileAttributes fa;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        fa.permissions = static_cast<uint32_t>(attrs.permissions);
        fa.is_dir = LIBSSH2_SFTP_S_ISDIR(attrs.permissions);
    }
    if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fa.size = attrs.filesize;
    if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fa.mtime = static_cast<int64_t>(attrs.mtime);
    return Result<FileAttributes>::Ok(fa);
}

Result<std::unique_ptr<RemoteFile>> Libssh2SftpChannel::open(const std::string& path,
                                                             OpenMode mode) {
    std::lock_guard<std::mutex> op(channel_->op_mutex());
    LIBSSH2_SFTP* sftp = channel_->sftp();

    unsigned long flags = mode == OpenMode::Read
        ? LIBSSH2_FXF_READ
        : LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;
    long perms = mode == OpenMode::Read ? 0 : 0644;

    int rc = 0;
    void* handle = channel_->session()->retry_handle([&]() -> void* {
        return libssh2_sftp_open_ex(sftp, path.c_str(), static_cast<unsigned>(path.size()),
                                    flags, perms, LIBSSH2_SFTP_OPENFILE);
    }, &rc);
    if (!handle) return sftp_fail<std::unique_ptr<RemoteFile>>(rc, "open " + path);

    std::unique_ptr<RemoteFile> file(new Libssh2RemoteFile(
        channel_.get(), static_cast<LIBSSH2_SFTP_HANDLE*>(handle), path));
    return Result<std::unique_ptr<RemoteFile>>::Ok(std::move(file));
}

Result<void> Libssh2SftpChannel::remove(const std::string& path) {
    std::lock_guard<std::mutex> op(channel_->op_mutex());
    LIBSSH2_SFTP* sftp = channel_->sftp();
    int rc = channel_->session()->retry([&] {
        return libssh2_sftp_unlink_ex(sftp, path.c_str(), static_cast<unsigned>(path.size()));
    });
    if (rc != 0) return sftp_fail<void>(rc, "delete " + path);
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::rmdir(const std::string& path) {
    std::lock_guard<std::mutex> op(channel_->op_mutex());
    LIBSSH2_SFTP* sftp = channel_->sftp();
    int rc = channel_->session()->retry([&] {
        return libssh2_sftp_rmdir_ex(sftp, path.c_str(), static_cast<unsigned>(path.size()));
    });
    if (rc != 0) return sftp_fail<void>(rc, "remove directory " + path);
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::mkdir(const std::string& path) {
    std::lock_guard<std::mutex> op(channel_->op_mutex());
    LIBSSH2_SFTP* sftp = channel_->sftp();
    int rc = channel_->session()->retry([&] {
        return libssh2_sftp_mkdir_ex(sftp, path.c_str(), static_cast<unsigned>(path.size()), 0755);
    });
    if (rc != 0) return sftp_fail<void>(rc, "create directory " + path);
    return Result<void>::Ok();
}

Result<void> Libssh2SftpChannel::rename(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> op(channel_->op_mutex());
    LIBSSH2_SFTP* sftp = channel_->sftp();
    int rc = channel_->session()->retry([&] {
        return libssh2_sftp_rename_ex(sftp, from.c_str(), static_cast<unsigned>(from.size()),
                                      to.c_str(), static_cast<unsigned>(to.size()),
                                      LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
    });
    if (rc != 0) return sftp_fail<void>(rc, fmt::format("rename {} -> {}", from, to));
    return Result<void>::Ok();
}
