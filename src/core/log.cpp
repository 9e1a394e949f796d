#include "log.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

static std::mutex g_log_mutex;
static bool g_log_enabled = true;
static std::string g_log_path;

std::string bssh_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) {
        g_log_path = (platform::temp_dir() / "bssh_debug.log").string();
    }
    return g_log_path;
}

void bssh_log_configure(bool enabled, const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_enabled = enabled;
    if (!path.empty()) g_log_path = path;
}

void bssh_log(const std::string& msg) {
    std::string path = bssh_log_path();

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (!g_log_enabled) return;

    std::ofstream out(path, std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

void bssh_log_ssh(const std::string& label, const std::string& cmd,
                  const SSHResult& r) {
    bssh_log(fmt::format("{} CMD: {}", label, cmd));
    bssh_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                         r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        bssh_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
