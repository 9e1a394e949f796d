#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".bssh";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# bssh configuration

connection:
  port: 22
  # identity_file: "~/.ssh/id_ed25519"   # default: ~/.ssh/id_rsa
  connect_timeout: 30                     # seconds
  inactivity_timeout: 300                 # seconds of silence before the session is dropped
  keepalive_interval: 0                   # seconds, 0 = off

terminal:
  type: "xterm-256color"
  detach_key: 19                          # Ctrl-S returns from the shell to the browser

transfer:
  chunk_size: 32768

listing:
  max_parallel_stats: 16
  sftp_channels: 4                        # stats travel on this many channels at once

log:
  enabled: true
  # path: "/tmp/bssh_debug.log"
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err(ErrorKind::Config,
                                     "Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::Config,
                                 "Failed to write config file: " + std::string(e.what()));
    }
}

static void parse_connection(const YAML::Node& node, ConnectionDefaults& c) {
    if (!node || !node.IsMap()) return;
    c.port = node["port"].as<int>(c.port);
    c.identity_file = node["identity_file"].as<std::string>(c.identity_file);
    c.connect_timeout = node["connect_timeout"].as<int>(c.connect_timeout);
    c.inactivity_timeout = node["inactivity_timeout"].as<int>(c.inactivity_timeout);
    c.keepalive_interval = node["keepalive_interval"].as<int>(c.keepalive_interval);
}

static void parse_terminal(const YAML::Node& node, TerminalSettings& t) {
    if (!node || !node.IsMap()) return;
    t.type = node["type"].as<std::string>(t.type);
    t.detach_key = node["detach_key"].as<int>(t.detach_key);
}

static Result<Config> validate(Config config) {
    const auto& c = config.connection();
    const auto& t = config.terminal();
    const auto& x = config.transfer();
    const auto& l = config.listing();
    if (c.port <= 0 || c.port > 65535)
        return Result<Config>::Err(ErrorKind::Config, "connection.port out of range");
    if (c.inactivity_timeout < 0 || c.connect_timeout <= 0 || c.keepalive_interval < 0)
        return Result<Config>::Err(ErrorKind::Config, "connection timeouts must be positive");
    if (t.detach_key < 0 || t.detach_key > 255)
        return Result<Config>::Err(ErrorKind::Config, "terminal.detach_key must be a byte value");
    if (x.chunk_size == 0)
        return Result<Config>::Err(ErrorKind::Config, "transfer.chunk_size must be non-zero");
    if (l.max_parallel_stats <= 0)
        return Result<Config>::Err(ErrorKind::Config, "listing.max_parallel_stats must be positive");
    if (l.sftp_channels <= 0)
        return Result<Config>::Err(ErrorKind::Config, "listing.sftp_channels must be positive");
    return Result<Config>::Ok(std::move(config));
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;
    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap())
            return Result<Config>::Err(ErrorKind::Config, "top level must be a mapping");

        parse_connection(root["connection"], config.connection_);
        parse_terminal(root["terminal"], config.terminal_);

        if (root["transfer"] && root["transfer"].IsMap()) {
            config.transfer_.chunk_size =
                root["transfer"]["chunk_size"].as<size_t>(config.transfer_.chunk_size);
        }
        if (root["listing"] && root["listing"].IsMap()) {
            config.listing_.max_parallel_stats =
                root["listing"]["max_parallel_stats"].as<int>(config.listing_.max_parallel_stats);
            config.listing_.sftp_channels =
                root["listing"]["sftp_channels"].as<int>(config.listing_.sftp_channels);
        }
        if (root["log"] && root["log"].IsMap()) {
            config.log_.enabled = root["log"]["enabled"].as<bool>(config.log_.enabled);
            config.log_.path = root["log"]["path"].as<std::string>(config.log_.path);
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::Config, std::string("invalid YAML: ") + e.what());
    }

    return validate(std::move(config));
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::Config, "Cannot read " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

Result<Config> Config::load_global() {
    return load_file(get_global_config_path());
}

std::string Config::identity_file() const {
    if (connection_.identity_file.empty()) {
        return (platform::home_dir() / DEFAULT_IDENTITY_FILE).string();
    }
    return expand_home(connection_.identity_file);
}
