#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/constants.hpp>
#include "sftp_channel.hpp"

enum class TransferDirection {
    Download,
    Upload,
};

// Called after each chunk with the running byte count
using ProgressCallback = std::function<void(uint64_t bytes_done)>;

// ── Listing ────────────────────────────────────────────────────

// List a remote directory. Entries are stat'ed concurrently (at most
// max_parallel in flight); an entry whose stat fails is reported as a
// regular file of size 0 with no mtime. A ".." entry pointing at the parent
// is added unless path is "/". Directories first, then files, each by name.
Result<std::vector<FileEntry>> list_directory(SftpChannel& sftp, const std::string& path,
                                              int max_parallel = DEFAULT_MAX_PARALLEL_STATS);

void sort_entries(std::vector<FileEntry>& entries);

// ── Transfers ──────────────────────────────────────────────────
// Stream in chunk_size pieces. A failure leaves whatever was written so far.

Result<uint64_t> download_file(SftpChannel& sftp, const std::string& remote_path,
                               const std::string& local_path,
                               size_t chunk_size = TRANSFER_CHUNK_SIZE,
                               ProgressCallback progress = nullptr);

Result<uint64_t> upload_file(SftpChannel& sftp, const std::string& local_path,
                             const std::string& remote_path,
                             size_t chunk_size = TRANSFER_CHUNK_SIZE,
                             ProgressCallback progress = nullptr);

Result<uint64_t> transfer(SftpChannel& sftp, const std::string& local_path,
                          const std::string& remote_path, TransferDirection direction,
                          size_t chunk_size = TRANSFER_CHUNK_SIZE,
                          ProgressCallback progress = nullptr);

// ── Single-call mutations ──────────────────────────────────────

Result<void> delete_file(SftpChannel& sftp, const std::string& path);
Result<void> delete_directory(SftpChannel& sftp, const std::string& path);
Result<void> create_directory(SftpChannel& sftp, const std::string& path);
Result<void> rename_path(SftpChannel& sftp, const std::string& from, const std::string& to);

// ── Editor collaborator surface ────────────────────────────────

Result<std::string> read_text_file(SftpChannel& sftp, const std::string& path);
Result<void> write_text_file(SftpChannel& sftp, const std::string& path, const std::string& text);
