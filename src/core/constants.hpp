#pragma once

#include <cstddef>

constexpr const char* BSSH_VERSION = "0.1.0";

// ── Connection ──────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT              = 22;
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS  = 30;
constexpr int DEFAULT_INACTIVITY_SECS       = 300;   // session invalidated after this much silence
constexpr int DEFAULT_KEEPALIVE_SECS        = 0;     // 0 = no SSH keepalives
constexpr const char* DEFAULT_IDENTITY_FILE = ".ssh/id_rsa";   // relative to $HOME

// ── Terminal ────────────────────────────────────────────────
constexpr const char* DEFAULT_TERM_TYPE     = "xterm-256color";
constexpr int DEFAULT_TERM_COLS             = 80;
constexpr int DEFAULT_TERM_ROWS             = 24;
constexpr unsigned char DETACH_BYTE         = 0x13;  // Ctrl-S

// ── Polling ─────────────────────────────────────────────────
constexpr int IO_WAIT_SLICE_MS              = 50;    // max single wait on the session socket
constexpr int FORWARD_WAIT_MS               = 100;   // forwarder wait (resize checks between)

// ── Buffer sizes ────────────────────────────────────────────
constexpr size_t TRANSFER_CHUNK_SIZE        = 32768;
constexpr size_t SSH_READ_BUF_SIZE          = 4096;
constexpr size_t SHELL_REMOTE_BUF_SIZE      = 4096;
constexpr size_t SHELL_LOCAL_BUF_SIZE       = 1024;
constexpr int SFTP_NAME_BUF_SIZE            = 1024;

// ── Listing ─────────────────────────────────────────────────
constexpr int DEFAULT_MAX_PARALLEL_STATS    = 16;
constexpr int DEFAULT_SFTP_CHANNELS         = 4;    // file-transfer channels opened per session
