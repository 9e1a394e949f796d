#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>
#include "sftp_channel.hpp"

// Several independent file-transfer channels on one session, opened once at
// connect time and used as one SftpChannel.
//
// Each slot serializes its own calls, so stat() is sent to an idle slot and
// concurrent stats travel on different channels. Directory reads, file
// handles and mutations always use the first slot.
class SftpChannelPool : public SftpChannel {
public:
    // Throws std::logic_error when slots is empty
    explicit SftpChannelPool(std::vector<std::unique_ptr<SftpChannel>> slots);
    ~SftpChannelPool() override;

    size_t size() const { return slots_.size(); }

    Result<std::vector<std::string>> read_dir(const std::string& path) override;
    Result<FileAttributes> stat(const std::string& path) override;
    Result<std::unique_ptr<RemoteFile>> open(const std::string& path, OpenMode mode) override;
    Result<void> remove(const std::string& path) override;
    Result<void> rmdir(const std::string& path) override;
    Result<void> mkdir(const std::string& path) override;
    Result<void> rename(const std::string& from, const std::string& to) override;

private:
    struct Slot {
        std::unique_ptr<SftpChannel> channel;
        std::mutex busy;
    };

    // First idle slot; when all are busy, wait on the next one in turn.
    Slot& acquire(std::unique_lock<std::mutex>& lock);

    SftpChannel& primary() { return *slots_.front()->channel; }

    std::vector<std::unique_ptr<Slot>> slots_;
    std::atomic<size_t> next_{0};
};
