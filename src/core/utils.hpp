#pragma once

#include <string>
#include <ctime>
#include "types.hpp"

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Wrap in single quotes for a POSIX shell; embedded ' becomes '\''.
std::string shell_escape(const std::string& s);

// Join a remote directory and an entry name with exactly one '/'.
std::string join_remote_path(const std::string& dir, const std::string& name);

// Absolute remote path with "." and ".." segments collapsed and repeated or
// trailing slashes dropped. ".." at the root stays at the root.
std::string normalize_remote_path(const std::string& path);

// Parent of a remote path. "/" and "" map to "/"; trailing slashes are ignored.
std::string remote_parent_path(const std::string& path);

// Last component of a remote or local path ("a/b/" -> "b").
std::string base_name(const std::string& path);

// Expand a leading "~/" against the home directory.
std::string expand_home(const std::string& path);

// Parse "[user@]host[:port]". Missing user falls back to $USER, then "root".
// Missing port falls back to default_port.
Result<ConnectionParams> parse_destination(const std::string& dest, int default_port = 22);

// Format a byte count as "12.3 KiB" etc.
std::string format_size(uint64_t bytes);
