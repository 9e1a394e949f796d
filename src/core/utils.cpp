#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <vector>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string shell_escape(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string join_remote_path(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string normalize_remote_path(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string seg = path.substr(start, end - start);
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(std::move(seg));
        }
        start = end + 1;
    }

    if (parts.empty()) return "/";
    std::string out;
    for (const auto& p : parts) out += "/" + p;
    return out;
}

std::string remote_parent_path(const std::string& path) {
    if (path.empty() || path == "/") return "/";

    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();

    auto pos = p.rfind('/');
    if (pos == std::string::npos || pos == 0) return "/";
    return p.substr(0, pos);
}

std::string base_name(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    auto pos = p.rfind('/');
    if (pos == std::string::npos) return p;
    return p.substr(pos + 1);
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

Result<ConnectionParams> parse_destination(const std::string& dest, int default_port) {
    if (dest.empty()) {
        return Result<ConnectionParams>::Err(ErrorKind::InvalidArgument, "Empty destination");
    }

    ConnectionParams params;
    params.port = default_port;

    std::string user_host = dest;
    auto colon = dest.rfind(':');
    if (colon != std::string::npos) {
        std::string port_str = dest.substr(colon + 1);
        int port = safe_stoi(port_str, -1);
        if (port <= 0 || port > 65535) {
            return Result<ConnectionParams>::Err(ErrorKind::InvalidArgument,
                                                 "Invalid port number: " + port_str);
        }
        params.port = port;
        user_host = dest.substr(0, colon);
    }

    auto at = user_host.find('@');
    if (at != std::string::npos) {
        params.username = user_host.substr(0, at);
        params.host = user_host.substr(at + 1);
    } else {
        const char* user = std::getenv("USER");
        params.username = user ? user : "root";
        params.host = user_host;
    }

    if (params.host.empty()) {
        return Result<ConnectionParams>::Err(ErrorKind::InvalidArgument,
                                             "Missing host in destination: " + dest);
    }
    if (params.username.empty()) {
        return Result<ConnectionParams>::Err(ErrorKind::InvalidArgument,
                                             "Missing user in destination: " + dest);
    }

    return Result<ConnectionParams>::Ok(params);
}

std::string format_size(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double v = static_cast<double>(bytes);
    int u = 0;
    while (v >= 1024.0 && u < 4) {
        v /= 1024.0;
        u++;
    }
    if (u == 0) return fmt::format("{} B", bytes);
    return fmt::format("{:.1f} {}", v, units[u]);
}
