#include "sftp_channel_pool.hpp"
#include <stdexcept>

SftpChannelPool::SftpChannelPool(std::vector<std::unique_ptr<SftpChannel>> slots) {
    if (slots.empty()) throw std::logic_error("SftpChannelPool needs at least one channel");
    slots_.reserve(slots.size());
    for (auto& channel : slots) {
        if (!channel) throw std::logic_error("SftpChannelPool given a null channel");
        auto slot = std::make_unique<Slot>();
        slot->channel = std::move(channel);
        slots_.push_back(std::move(slot));
    }
}

SftpChannelPool::~SftpChannelPool() = default;

SftpChannelPool::Slot& SftpChannelPool::acquire(std::unique_lock<std::mutex>& lock) {
    for (auto& slot : slots_) {
        std::unique_lock<std::mutex> attempt(slot->busy, std::try_to_lock);
        if (attempt.owns_lock()) {
            lock = std::move(attempt);
            return *slot;
        }
    }
    Slot& slot = *slots_[next_++ % slots_.size()];
    lock = std::unique_lock<std::mutex>(slot.busy);
    return slot;
}

Result<FileAttributes> SftpChannelPool::stat(const std::string& path) {
    std::unique_lock<std::mutex> lock;
    Slot& slot = acquire(lock);
    return slot.channel->stat(path);
}

Result<std::vector<std::string>> SftpChannelPool::read_dir(const std::string& path) {
    return primary().read_dir(path);
}

Result<std::unique_ptr<RemoteFile>> SftpChannelPool::open(const std::string& path, OpenMode mode) {
    return primary().open(path, mode);
}

Result<void> SftpChannelPool::remove(const std::string& path) {
    return primary().remove(path);
}

Result<void> SftpChannelPool::rmdir(const std::string& path) {
    return primary().rmdir(path);
}

Result<void> SftpChannelPool::mkdir(const std::string& path) {
    return primary().mkdir(path);
}

Result<void> SftpChannelPool::rename(const std::string& from, const std::string& to) {
    return primary().rename(from, to);
}
