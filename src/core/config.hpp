#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

struct ConnectionDefaults {
    int port = DEFAULT_SSH_PORT;
    std::string identity_file;                 // empty = ~/.ssh/id_rsa
    int connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    int inactivity_timeout = DEFAULT_INACTIVITY_SECS;
    int keepalive_interval = DEFAULT_KEEPALIVE_SECS;
};

struct TerminalSettings {
    std::string type = DEFAULT_TERM_TYPE;
    int detach_key = DETACH_BYTE;
};

struct TransferSettings {
    size_t chunk_size = TRANSFER_CHUNK_SIZE;
};

struct ListingSettings {
    int max_parallel_stats = DEFAULT_MAX_PARALLEL_STATS;
    int sftp_channels = DEFAULT_SFTP_CHANNELS;
};

struct LogSettings {
    bool enabled = true;
    std::string path;                          // empty = <tmp>/bssh_debug.log
};

class Config {
public:
    // Load ~/.bssh/config.yaml (defaults when the file does not exist)
    static Result<Config> load_global();

    // Load a specific file; used by load_global() and tests
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text directly
    static Result<Config> parse(const std::string& yaml_text);

    const ConnectionDefaults& connection() const { return connection_; }
    const TerminalSettings& terminal() const { return terminal_; }
    const TransferSettings& transfer() const { return transfer_; }
    const ListingSettings& listing() const { return listing_; }
    const LogSettings& log() const { return log_; }

    // Identity path with ~ expanded; falls back to ~/.ssh/id_rsa
    std::string identity_file() const;

public:
    Config() = default;

private:
    ConnectionDefaults connection_;
    TerminalSettings terminal_;
    TransferSettings transfer_;
    ListingSettings listing_;
    LogSettings log_;
};

// Helper to check if config exists
bool global_config_exists();

// Get paths
fs::path get_global_config_dir();
fs::path get_global_config_path();

// Create default global config
Result<void> create_default_global_config();
