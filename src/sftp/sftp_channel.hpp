#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

struct FileAttributes {
    bool is_dir = false;
    uint64_t size = 0;
    std::optional<int64_t> mtime;
    std::optional<uint32_t> permissions;
};

enum class OpenMode {
    Read,
    CreateTruncate,
};

// An open remote file. Must not outlive the SftpChannel that opened it.
class RemoteFile {
public:
    virtual ~RemoteFile() = default;

    // Up to len bytes; 0 at end of file.
    virtual Result<size_t> read(char* buf, size_t len) = 0;

    // Write the whole buffer.
    virtual Result<void> write(const char* data, size_t len) = 0;

    virtual Result<void> close() = 0;
};

// The file-transfer operations the listing and transfer engine needs.
// Implementations serialize their own calls; callers may invoke stat()
// from several threads at once.
class SftpChannel {
public:
    virtual ~SftpChannel() = default;

    // Raw directory entries, server's "." and ".." included.
    virtual Result<std::vector<std::string>> read_dir(const std::string& path) = 0;

    // Follows symlinks.
    virtual Result<FileAttributes> stat(const std::string& path) = 0;

    virtual Result<std::unique_ptr<RemoteFile>> open(const std::string& path, OpenMode mode) = 0;

    virtual Result<void> remove(const std::string& path) = 0;
    virtual Result<void> rmdir(const std::string& path) = 0;
    virtual Result<void> mkdir(const std::string& path) = 0;
    virtual Result<void> rename(const std::string& from, const std::string& to) = 0;
};
