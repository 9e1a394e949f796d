#pragma once

#include <unistd.h>

namespace platform {

// Get terminal dimensions (80x24 when fd is not a terminal).
int term_width(int fd = STDOUT_FILENO);
int term_height(int fd = STDOUT_FILENO);

// RAII guard for raw terminal mode (cfmakeraw).
// Constructor saves current mode and enters raw mode.
// Destructor restores the saved mode.
//
// Raw mode is process-wide state with a single owner: constructing a second
// guard while one is alive throws std::logic_error. When fd is not a terminal
// the guard still takes ownership but leaves the fd untouched.
struct RawModeGuard {
    explicit RawModeGuard(int fd = STDIN_FILENO);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    // True when the terminal mode was actually changed.
    bool engaged() const { return impl_ != nullptr; }

    // True while any guard is alive.
    static bool held();

private:
    struct Impl;
    Impl* impl_ = nullptr;
    int fd_;
};

// RAII guard for the alternate screen buffer. No-op when fd is not a terminal.
struct AltScreenGuard {
    explicit AltScreenGuard(int fd = STDOUT_FILENO);
    ~AltScreenGuard();

    AltScreenGuard(const AltScreenGuard&) = delete;
    AltScreenGuard& operator=(const AltScreenGuard&) = delete;

private:
    int fd_;
    bool active_ = false;
};

// SIGWINCH tracking. take_resize() returns true once per resize since the
// last call.
void watch_terminal_resize();
void unwatch_terminal_resize();
bool take_resize();

} // namespace platform
