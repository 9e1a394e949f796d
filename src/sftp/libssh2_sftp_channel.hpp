#pragma once

#include <memory>
#include <ssh/channel.hpp>
#include "sftp_channel.hpp"

// SftpChannel over a FileTransferSubsystem channel.
//
// libssh2 keeps per-instance request state for stat/open/readdir, so each
// call runs to completion under the channel's op mutex. Parallel stats need
// one instance per in-flight call; see SftpChannelPool.
class Libssh2SftpChannel : public SftpChannel {
public:
    explicit Libssh2SftpChannel(std::unique_ptr<Channel> channel);
    ~Libssh2SftpChannel() override;

    Result<std::vector<std::string>> read_dir(const std::string& path) override;
    Result<FileAttributes> stat(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open(const std::string& path, OpenMode mode) override;
    Result<void> remove(const std::string& path) override;
    Result<void> rmdir(const std::string& path) override;
    Result<void> mkdir(const std::string& path) override;
    Result<void> rename(const std::string& from, const std::string& to) override;

    Channel& channel() { return *channel_; }

private:
    template <typename T>
    Result<T> sftp_fail(int rc, const std::string& context);

    std::unique_ptr<Channel> channel_;
};

// "not found", "permission denied", ... for an SFTP status code
std::string sftp_status_reason(unsigned long status);
