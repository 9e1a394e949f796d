#pragma once

#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct SavedConnection {
    std::string name;
    std::string host;
    int port = 22;
    std::string username;
    std::string identity_file;      // "" = default key

    std::string display_name() const;
    ConnectionParams to_params() const;
};

// Saved connections in ~/.bssh/connections.yaml
class ConnectionStore {
public:
    ConnectionStore();
    explicit ConnectionStore(fs::path path);

    Result<std::vector<SavedConnection>> load() const;
    Result<void> save(const std::vector<SavedConnection>& connections) const;

    // Replaces an existing entry with the same name
    Result<void> add(const SavedConnection& connection) const;

    // Err(InvalidArgument) when no entry has that name
    Result<void> remove(const std::string& name) const;

    std::optional<SavedConnection> find(const std::string& name) const;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};
