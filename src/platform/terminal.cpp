#include "terminal.hpp"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <poll.h>
#include <signal.h>
#include <atomic>
#include <cstring>
#include <stdexcept>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

int term_width(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0)
        return ws.ws_col;
    return 80;
}

int term_height(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0)
        return ws.ws_row;
    return 24;
}

// ── RawModeGuard ─────────────────────────────────────────────

static std::atomic<bool> g_raw_owned{false};

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard(int fd) : fd_(fd) {
    if (g_raw_owned.exchange(true)) {
        throw std::logic_error("terminal raw mode is already owned");
    }

    struct termios current;
    if (!isatty(fd_) || tcgetattr(fd_, &current) != 0) {
        return;
    }

    impl_ = new Impl;
    impl_->old_term = current;
    struct termios raw = current;
    cfmakeraw(&raw);
    tcsetattr(fd_, TCSAFLUSH, &raw);
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(fd_, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
    g_raw_owned.store(false);
}

bool RawModeGuard::held() {
    return g_raw_owned.load();
}

// ── AltScreenGuard ───────────────────────────────────────────

static void write_all(int fd, const char* s) {
    size_t len = std::strlen(s);
    while (len > 0) {
        ssize_t w = ::write(fd, s, len);
        if (w <= 0) return;
        s += w;
        len -= static_cast<size_t>(w);
    }
}

AltScreenGuard::AltScreenGuard(int fd) : fd_(fd) {
    if (isatty(fd_)) {
        write_all(fd_, "\033[?1049h\033[H");
        active_ = true;
    }
}

AltScreenGuard::~AltScreenGuard() {
    if (active_) write_all(fd_, "\033[?1049l");
}

// ── Resize tracking ──────────────────────────────────────────

static volatile sig_atomic_t g_resize_flag = 0;
static struct sigaction g_old_sa;
static bool g_watching = false;

static void sigwinch_handler(int) {
    g_resize_flag = 1;
}

void watch_terminal_resize() {
    if (g_watching) return;
    g_resize_flag = 0;

    struct sigaction sa;
    sa.sa_handler = sigwinch_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGWINCH, &sa, &g_old_sa);
    g_watching = true;
}

void unwatch_terminal_resize() {
    if (!g_watching) return;
    sigaction(SIGWINCH, &g_old_sa, nullptr);
    g_watching = false;
}

bool take_resize() {
    if (!g_resize_flag) return false;
    g_resize_flag = 0;
    return true;
}

} // namespace platform
