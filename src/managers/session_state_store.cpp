#include "session_state_store.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

std::string SessionStateStore::file_name(const ConnectionParams& params) {
    return fmt::format("session_{}@{}_{}.yaml", params.username, params.host, params.port);
}

SessionStateStore::SessionStateStore(const ConnectionParams& params)
    : SessionStateStore(params, get_global_config_dir() / "state") {}

SessionStateStore::SessionStateStore(const ConnectionParams& params, fs::path state_dir)
    : params_(params), state_path_(std::move(state_dir) / file_name(params)) {}

BrowserState SessionStateStore::load() const {
    BrowserState state;
    state.host = params_.host;
    state.port = params_.port;
    state.username = params_.username;

    std::error_code ec;
    if (!fs::exists(state_path_, ec)) {
        return state;
    }

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());
        state.current_path = root["current_path"].as<std::string>("/");
        state.selected_index = root["selected_index"].as<int>(0);
        state.saved_at = root["saved_at"].as<std::string>("");
        if (state.current_path.empty()) state.current_path = "/";
        if (state.selected_index < 0) state.selected_index = 0;
    } catch (const YAML::Exception& e) {
        // Corrupted state file: start fresh
        bssh_log(fmt::format("ignoring state file {}: {}", state_path_.string(), e.what()));
        BrowserState fresh;
        fresh.host = params_.host;
        fresh.port = params_.port;
        fresh.username = params_.username;
        return fresh;
    }

    return state;
}

Result<void> SessionStateStore::save(const BrowserState& state) const {
    std::error_code ec;
    fs::create_directories(state_path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::LocalIo,
                                 "Cannot create " + state_path_.parent_path().string());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "host" << YAML::Value << state.host;
    out << YAML::Key << "port" << YAML::Value << state.port;
    out << YAML::Key << "username" << YAML::Value << state.username;
    out << YAML::Key << "current_path" << YAML::Value << state.current_path;
    out << YAML::Key << "selected_index" << YAML::Value << state.selected_index;
    out << YAML::Key << "saved_at" << YAML::Value << now_iso();
    out << YAML::EndMap;

    std::ofstream fout(state_path_.string());
    fout << out.c_str() << "\n";
    if (!fout) return Result<void>::Err(ErrorKind::LocalIo, "Cannot write " + state_path_.string());
    return Result<void>::Ok();
}
