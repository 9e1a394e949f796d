#include "connection_store.hpp"
#include <core/config.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

std::string SavedConnection::display_name() const {
    return fmt::format("{}@{}:{}", username, host, port);
}

ConnectionParams SavedConnection::to_params() const {
    ConnectionParams p;
    p.host = host;
    p.port = port;
    p.username = username;
    if (!identity_file.empty()) p.identity_key_path = identity_file;
    return p;
}

ConnectionStore::ConnectionStore()
    : path_(get_global_config_dir() / "connections.yaml") {}

ConnectionStore::ConnectionStore(fs::path path) : path_(std::move(path)) {}

Result<std::vector<SavedConnection>> ConnectionStore::load() const {
    using R = Result<std::vector<SavedConnection>>;
    std::vector<SavedConnection> out;

    std::error_code ec;
    if (!fs::exists(path_, ec)) return R::Ok(out);

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        YAML::Node list = root["connections"];
        if (list && list.IsSequence()) {
            for (const auto& n : list) {
                SavedConnection c;
                c.name = n["name"].as<std::string>("");
                c.host = n["host"].as<std::string>("");
                c.port = n["port"].as<int>(22);
                c.username = n["username"].as<std::string>("");
                c.identity_file = n["identity_file"].as<std::string>("");
                if (c.name.empty() || c.host.empty()) continue;
                out.push_back(c);
            }
        }
    } catch (const YAML::Exception& e) {
        return R::Err(ErrorKind::Config, fmt::format("{}: {}", path_.string(), e.what()));
    }
    return R::Ok(out);
}

Result<void> ConnectionStore::save(const std::vector<SavedConnection>& connections) const {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::LocalIo,
                                 "Cannot create " + path_.parent_path().string() + ": " + ec.message());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "connections" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : connections) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "host" << YAML::Value << c.host;
        out << YAML::Key << "port" << YAML::Value << c.port;
        out << YAML::Key << "username" << YAML::Value << c.username;
        if (!c.identity_file.empty()) {
            out << YAML::Key << "identity_file" << YAML::Value << c.identity_file;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream fout(path_.string());
    fout << out.c_str() << "\n";
    if (!fout) return Result<void>::Err(ErrorKind::LocalIo, "Cannot write " + path_.string());
    return Result<void>::Ok();
}

Result<void> ConnectionStore::add(const SavedConnection& connection) const {
    if (connection.name.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "Connection name is empty");
    }
    auto list = load();
    if (list.is_err()) return Result<void>::From(list);

    auto& v = list.value;
    auto it = std::find_if(v.begin(), v.end(),
                           [&](const SavedConnection& c) { return c.name == connection.name; });
    if (it != v.end()) {
        *it = connection;
    } else {
        v.push_back(connection);
    }
    return save(v);
}

Result<void> ConnectionStore::remove(const std::string& name) const {
    auto list = load();
    if (list.is_err()) return Result<void>::From(list);

    auto& v = list.value;
    auto it = std::remove_if(v.begin(), v.end(),
                             [&](const SavedConnection& c) { return c.name == name; });
    if (it == v.end()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "No saved connection named " + name);
    }
    v.erase(it, v.end());
    return save(v);
}

std::optional<SavedConnection> ConnectionStore::find(const std::string& name) const {
    auto list = load();
    if (list.is_err()) return std::nullopt;
    for (const auto& c : list.value) {
        if (c.name == name) return c;
    }
    return std::nullopt;
}
