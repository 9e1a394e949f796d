#pragma once

#include <string>
#include "types.hpp"

// Debug log: one timestamped line per call, appended to bssh_log_path().
// Never throws; a missing or unwritable log file is silently skipped.

std::string bssh_log_path();

// Override the log location (config `log.path`) or disable logging entirely.
void bssh_log_configure(bool enabled, const std::string& path = "");

void bssh_log(const std::string& msg);

void bssh_log_ssh(const std::string& label, const std::string& cmd, const SSHResult& r);

template <typename T>
void bssh_log_error(const std::string& context, const Result<T>& r) {
    bssh_log(context + " failed: " + describe_error(r));
}
