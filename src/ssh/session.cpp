#include "session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <filesystem>
#include <fstream>

static int64_t steady_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

static std::once_flag g_libssh2_init;

// ── Lifecycle ──────────────────────────────────────────────────

Session::Session(const ConnectionParams& params, const SessionOptions& options)
    : params_(params), options_(options) {
    last_activity_ms_ = steady_now_ms();
    last_keepalive_ms_ = last_activity_ms_.load();
}

Session::~Session() {
    close();
}

Result<std::shared_ptr<Session>> Session::connect(const ConnectionParams& params,
                                                  const SessionOptions& options,
                                                  HostKeyVerifier verify_host,
                                                  StatusCallback callback) {
    using R = Result<std::shared_ptr<Session>>;

    int init_rc = 0;
    std::call_once(g_libssh2_init, [&init_rc] { init_rc = libssh2_init(0); });
    if (init_rc != 0) {
        return R::Err(ErrorKind::Transport, "Failed to initialize libssh2");
    }

    if (callback) callback("Connecting to " + params.display_name() + "...");
    bssh_log("connect " + params.display_name());

    auto sock_result = platform::connect_tcp(params.host, params.port, options.connect_timeout);
    if (sock_result.is_err()) {
        bssh_log_error("tcp connect", sock_result);
        return R::From(sock_result);
    }

    std::shared_ptr<Session> s(new Session(params, options));
    s->sock_ = sock_result.value;
    platform::enable_tcp_keepalive(s->sock_);

    s->session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!s->session_) {
        s->close();
        return R::Err(ErrorKind::Transport, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(s->session_, 0);
    s->usable_ = true;

    auto hs = s->handshake(verify_host, callback);
    if (hs.is_err()) {
        bssh_log_error("handshake", hs);
        s->close();
        return R::From(hs);
    }

    auto auth = s->authenticate(callback);
    if (auth.is_err()) {
        bssh_log_error("authentication", auth);
        s->close();
        return R::From(auth);
    }

    s->note_activity();
    if (callback) callback("Connected to " + params.display_name());
    bssh_log("session established " + params.display_name());
    return R::Ok(s);
}

Result<void> Session::handshake(const HostKeyVerifier& verify_host, StatusCallback callback) {
    if (callback) callback("TCP connected, starting SSH handshake...");

    int rc = retry([this] { return libssh2_session_handshake(session_, sock_); });
    if (rc != 0) {
        std::string msg = "SSH handshake failed";
        std::string detail = last_error_message();
        if (!detail.empty()) msg += ": " + detail;
        invalidate(msg);
        return Result<void>::Err(ErrorKind::Transport, msg);
    }

    HostKeyInfo info;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        info = read_host_key(session_, params_.host, params_.port);
    }
    if (verify_host && !verify_host(info)) {
        std::string msg = fmt::format("Host key for {} rejected ({} {})",
                                      params_.host, info.key_type, info.fingerprint);
        invalidate(msg);
        return Result<void>::Err(ErrorKind::Transport, msg);
    }

    if (options_.keepalive_interval > 0) {
        std::lock_guard<std::mutex> lock(io_mutex_);
        libssh2_keepalive_config(session_, 1, static_cast<unsigned>(options_.keepalive_interval));
    }

    return Result<void>::Ok();
}

Result<void> Session::authenticate(StatusCallback callback) {
    std::string key_path = params_.identity_key_path
        ? expand_home(*params_.identity_key_path)
        : (platform::home_dir() / DEFAULT_IDENTITY_FILE).string();

    if (callback) callback("Authenticating with " + key_path + "...");

    std::error_code ec;
    if (!std::filesystem::is_regular_file(key_path, ec) || !std::ifstream(key_path)) {
        return Result<void>::Err(ErrorKind::Auth, "Failed to load SSH key: " + key_path);
    }

    const std::string& user = params_.username;
    int rc = retry([&] {
        return libssh2_userauth_publickey_fromfile_ex(
            session_, user.c_str(), static_cast<unsigned>(user.size()),
            nullptr, key_path.c_str(), nullptr);
    });

    if (rc == 0) {
        if (callback) callback("Authentication successful");
        return Result<void>::Ok();
    }

    if (is_transport_error(rc)) {
        return fail<void>(rc, ErrorKind::Transport, "Connection lost during authentication");
    }
    if (rc == LIBSSH2_ERROR_FILE) {
        return fail<void>(rc, ErrorKind::Auth, "Failed to load SSH key " + key_path);
    }
    return fail<void>(rc, ErrorKind::Auth, "Authentication failed for " + user);
}

void Session::close() {
    // Mark unusable first so concurrent operations bail out early
    usable_ = false;

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (session_) {
        // Bounded blocking disconnect; the socket may already be dead.
        libssh2_session_set_timeout(session_, 2000);
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }

    if (sock_ != BSSH_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = BSSH_INVALID_SOCKET;
    }
}

// ── State ──────────────────────────────────────────────────────

bool Session::is_usable() const {
    return usable_.load() && session_ != nullptr;
}

std::string Session::invalid_reason() const {
    std::lock_guard<std::mutex> lock(reason_mutex_);
    return invalid_reason_;
}

void Session::invalidate(const std::string& reason) {
    bool was_usable = usable_.exchange(false);
    {
        std::lock_guard<std::mutex> lock(reason_mutex_);
        if (invalid_reason_.empty()) invalid_reason_ = reason;
    }
    if (was_usable) bssh_log("session invalidated: " + reason);
}

Result<void> Session::check_usable() const {
    if (is_usable()) return Result<void>::Ok();
    std::string reason = invalid_reason();
    if (reason.empty()) reason = "session closed";
    return Result<void>::Err(ErrorKind::Transport, "Session unusable: " + reason);
}

Result<std::unique_ptr<Channel>> Session::open_channel(const ChannelRequest& request) {
    return Channel::open(shared_from_this(), request);
}

// ── I/O plumbing ───────────────────────────────────────────────

void Session::note_activity() {
    last_activity_ms_ = steady_now_ms();
}

bool Session::is_transport_error(int rc) {
    switch (rc) {
        case LIBSSH2_ERROR_SOCKET_NONE:
        case LIBSSH2_ERROR_BANNER_RECV:
        case LIBSSH2_ERROR_BANNER_SEND:
        case LIBSSH2_ERROR_INVALID_MAC:
        case LIBSSH2_ERROR_KEX_FAILURE:
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_KEY_EXCHANGE_FAILURE:
        case LIBSSH2_ERROR_TIMEOUT:
        case LIBSSH2_ERROR_DECRYPT:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_PROTO:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_ENCRYPT:
        case LIBSSH2_ERROR_BAD_SOCKET:
            return true;
        default:
            return false;
    }
}

ErrorKind Session::error_kind_for(int rc, ErrorKind kind) {
    return is_transport_error(rc) ? ErrorKind::Transport : kind;
}

std::string Session::error_message(int rc, const std::string& context,
                                   const std::string& detail) {
    std::string msg = context;
    if (!detail.empty()) msg += ": " + detail;
    return msg + " (rc=" + std::to_string(rc) + ")";
}

std::string Session::last_error_message() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!session_) return "";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : "";
}

void Session::send_keepalive_if_due() {
    if (options_.keepalive_interval <= 0) return;

    int64_t now = steady_now_ms();
    if (now - last_keepalive_ms_.load() < options_.keepalive_interval * 1000LL) return;
    last_keepalive_ms_ = now;

    int rc;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (!session_) return;
        int seconds_to_next = 0;
        rc = libssh2_keepalive_send(session_, &seconds_to_next);
    }
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN && is_transport_error(rc)) {
        invalidate("keepalive failed (rc=" + std::to_string(rc) + ")");
    }
}

bool Session::wait_socket(int timeout_ms) {
    int dir = 0;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (!session_) return false;
        dir = libssh2_session_block_directions(session_);
    }

    short events = 0;
    if (dir & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    if (events == 0) events = POLLIN;

    platform::poll_socket(sock_, events, timeout_ms);
    send_keepalive_if_due();

    if (options_.inactivity_timeout > 0) {
        int64_t idle = steady_now_ms() - last_activity_ms_.load();
        if (idle > options_.inactivity_timeout * 1000LL) {
            invalidate(fmt::format("no activity for {}s", options_.inactivity_timeout));
            return false;
        }
    }
    return is_usable();
}

int Session::retry(const std::function<int()>& fn) {
    for (;;) {
        if (!usable_.load()) return LIBSSH2_ERROR_SOCKET_DISCONNECT;

        int rc;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!session_) return LIBSSH2_ERROR_SOCKET_DISCONNECT;
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) {
            if (rc >= 0) note_activity();
            return rc;
        }
        if (!wait_socket()) {
            return usable_.load() ? LIBSSH2_ERROR_TIMEOUT : LIBSSH2_ERROR_SOCKET_DISCONNECT;
        }
    }
}

void* Session::retry_handle(const std::function<void*()>& fn, int* rc_out) {
    for (;;) {
        if (!usable_.load()) {
            *rc_out = LIBSSH2_ERROR_SOCKET_DISCONNECT;
            return nullptr;
        }

        void* handle = nullptr;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!session_) {
                *rc_out = LIBSSH2_ERROR_SOCKET_DISCONNECT;
                return nullptr;
            }
            handle = fn();
            if (!handle) err = libssh2_session_last_errno(session_);
        }

        if (handle) {
            note_activity();
            *rc_out = 0;
            return handle;
        }
        if (err != LIBSSH2_ERROR_EAGAIN) {
            *rc_out = err;
            return nullptr;
        }
        if (!wait_socket()) {
            *rc_out = LIBSSH2_ERROR_TIMEOUT;
            return nullptr;
        }
    }
}
