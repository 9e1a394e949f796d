#include "file_ops.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <future>

// ── Listing ────────────────────────────────────────────────────

void sort_entries(std::vector<FileEntry>& entries) {
    std::sort(entries.begin(), entries.end(), [](const FileEntry& a, const FileEntry& b) {
        if (a.is_dir != b.is_dir) return a.is_dir;
        return a.name < b.name;
    });
}

static bool is_root_path(const std::string& path) {
    return !path.empty() && path.find_first_not_of('/') == std::string::npos;
}

Result<std::vector<FileEntry>> list_directory(SftpChannel& sftp, const std::string& path,
                                              int max_parallel) {
    using R = Result<std::vector<FileEntry>>;
    if (path.empty()) return R::Err(ErrorKind::InvalidArgument, "Empty path");

    auto names = sftp.read_dir(path);
    if (names.is_err()) return R::From(names);

    std::vector<FileEntry> entries;
    entries.reserve(names.value.size() + 1);
    for (auto& name : names.value) {
        if (name == "." || name == "..") continue;
        FileEntry e;
        e.name = name;
        e.path = join_remote_path(path, name);
        entries.push_back(std::move(e));
    }

    // Fan out: workers pull indices, each result lands in its own slot.
    const size_t count = entries.size();
    std::vector<Result<FileAttributes>> stats(count);
    std::atomic<size_t> next{0};

    auto worker = [&] {
        for (size_t i = next++; i < count; i = next++) {
            stats[i] = sftp.stat(entries[i].path);
        }
    };

    size_t workers = std::min(count, static_cast<size_t>(std::max(1, max_parallel)));
    std::vector<std::future<void>> pending;
    pending.reserve(workers);
    for (size_t w = 0; w < workers; w++) {
        pending.push_back(std::async(std::launch::async, worker));
    }
    for (auto& f : pending) f.get();

    size_t failed = 0;
    for (size_t i = 0; i < count; i++) {
        auto& e = entries[i];
        if (stats[i].is_ok()) {
            e.is_dir = stats[i].value.is_dir;
            e.size = stats[i].value.size;
            e.modified = stats[i].value.mtime;
            e.permissions = stats[i].value.permissions;
        } else {
            failed++;
            bssh_log_error("stat " + e.path, stats[i]);
        }
    }

    if (!is_root_path(path)) {
        FileEntry parent;
        parent.name = "..";
        parent.path = remote_parent_path(path);
        parent.is_dir = true;
        entries.push_back(std::move(parent));
    }

    sort_entries(entries);
    bssh_log(fmt::format("list {}: {} entries ({} stat failures)", path, count, failed));
    return R::Ok(std::move(entries));
}

// ── Transfers ──────────────────────────────────────────────────

Result<uint64_t> download_file(SftpChannel& sftp, const std::string& remote_path,
                               const std::string& local_path, size_t chunk_size,
                               ProgressCallback progress) {
    using R = Result<uint64_t>;
    if (chunk_size == 0) return R::Err(ErrorKind::InvalidArgument, "Chunk size must be positive");

    auto remote = sftp.open(remote_path, OpenMode::Read);
    if (remote.is_err()) return R::From(remote);

    std::ofstream local(local_path, std::ios::binary | std::ios::trunc);
    if (!local) {
        return R::Err(ErrorKind::LocalIo,
                      fmt::format("Cannot create {}: {}", local_path, std::strerror(errno)));
    }

    bssh_log(fmt::format("download {} -> {}", remote_path, local_path));
    std::vector<char> buf(chunk_size);
    uint64_t total = 0;
    for (;;) {
        auto n = remote.value->read(buf.data(), buf.size());
        if (n.is_err()) return R::From(n);
        if (n.value == 0) break;

        local.write(buf.data(), static_cast<std::streamsize>(n.value));
        if (!local) {
            return R::Err(ErrorKind::LocalIo, "Write failed for " + local_path);
        }
        total += n.value;
        if (progress) progress(total);
    }

    local.close();
    if (!local) return R::Err(ErrorKind::LocalIo, "Close failed for " + local_path);

    auto closed = remote.value->close();
    if (closed.is_err()) return R::From(closed);

    bssh_log(fmt::format("download {} done ({} bytes)", remote_path, total));
    return R::Ok(total);
}

Result<uint64_t> upload_file(SftpChannel& sftp, const std::string& local_path,
                             const std::string& remote_path, size_t chunk_size,
                             ProgressCallback progress) {
    using R = Result<uint64_t>;
    if (chunk_size == 0) return R::Err(ErrorKind::InvalidArgument, "Chunk size must be positive");

    std::ifstream local(local_path, std::ios::binary);
    if (!local) {
        return R::Err(ErrorKind::LocalIo,
                      fmt::format("Cannot read {}: {}", local_path, std::strerror(errno)));
    }

    auto remote = sftp.open(remote_path, OpenMode::CreateTruncate);
    if (remote.is_err()) return R::From(remote);

    bssh_log(fmt::format("upload {} -> {}", local_path, remote_path));
    std::vector<char> buf(chunk_size);
    uint64_t total = 0;
    for (;;) {
        local.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = local.gcount();
        if (n > 0) {
            auto w = remote.value->write(buf.data(), static_cast<size_t>(n));
            if (w.is_err()) return R::From(w);
            total += static_cast<uint64_t>(n);
            if (progress) progress(total);
        }
        if (local.eof()) break;
        if (!local) return R::Err(ErrorKind::LocalIo, "Read failed for " + local_path);
    }

    auto closed = remote.value->close();
    if (closed.is_err()) return R::From(closed);

    bssh_log(fmt::format("upload {} done ({} bytes)", remote_path, total));
    return R::Ok(total);
}

Result<uint64_t> transfer(SftpChannel& sftp, const std::string& local_path,
                          const std::string& remote_path, TransferDirection direction,
                          size_t chunk_size, ProgressCallback progress) {
    if (direction == TransferDirection::Download) {
        return download_file(sftp, remote_path, local_path, chunk_size, std::move(progress));
    }
    return upload_file(sftp, local_path, remote_path, chunk_size, std::move(progress));
}

// ── Single-call mutations ──────────────────────────────────────

Result<void> delete_file(SftpChannel& sftp, const std::string& path) {
    return sftp.remove(path);
}

Result<void> delete_directory(SftpChannel& sftp, const std::string& path) {
    return sftp.rmdir(path);
}

Result<void> create_directory(SftpChannel& sftp, const std::string& path) {
    return sftp.mkdir(path);
}

Result<void> rename_path(SftpChannel& sftp, const std::string& from, const std::string& to) {
    return sftp.rename(from, to);
}

// ── Editor collaborator surface ────────────────────────────────

Result<std::string> read_text_file(SftpChannel& sftp, const std::string& path) {
    auto file = sftp.open(path, OpenMode::Read);
    if (file.is_err()) return Result<std::string>::From(file);

    std::string text;
    std::vector<char> buf(TRANSFER_CHUNK_SIZE);
    for (;;) {
        auto n = file.value->read(buf.data(), buf.size());
        if (n.is_err()) return Result<std::string>::From(n);
        if (n.value == 0) break;
        text.append(buf.data(), n.value);
    }

    auto closed = file.value->close();
    if (closed.is_err()) return Result<std::string>::From(closed);
    return Result<std::string>::Ok(std::move(text));
}

Result<void> write_text_file(SftpChannel& sftp, const std::string& path, const std::string& text) {
    auto file = sftp.open(path, OpenMode::CreateTruncate);
    if (file.is_err()) return Result<void>::From(file);

    for (size_t off = 0; off < text.size(); off += TRANSFER_CHUNK_SIZE) {
        size_t len = std::min(TRANSFER_CHUNK_SIZE, text.size() - off);
        auto w = file.value->write(text.data() + off, len);
        if (w.is_err()) return w;
    }
    return file.value->close();
}
