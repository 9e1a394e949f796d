#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Browser position remembered per endpoint
struct BrowserState {
    std::string host;
    int port = 22;
    std::string username;
    std::string current_path = "/";
    int selected_index = 0;
    std::string saved_at;           // ISO timestamp
};

// ~/.bssh/state/session_<user>@<host>_<port>.yaml
class SessionStateStore {
public:
    explicit SessionStateStore(const ConnectionParams& params);
    SessionStateStore(const ConnectionParams& params, fs::path state_dir);

    // Nothing saved (or unreadable file): state with the default path.
    BrowserState load() const;
    Result<void> save(const BrowserState& state) const;

    const fs::path& path() const { return state_path_; }

    static std::string file_name(const ConnectionParams& params);

private:
    ConnectionParams params_;
    fs::path state_path_;
};
