#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/socket_util.hpp>
#include "host_key.hpp"
#include "channel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

struct SessionOptions {
    int connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    int inactivity_timeout = DEFAULT_INACTIVITY_SECS;   // 0 disables
    int keepalive_interval = DEFAULT_KEEPALIVE_SECS;    // 0 disables
};

// One authenticated SSH connection, parent of every channel.
//
// The libssh2 session runs in non-blocking mode. Every libssh2 call is made
// under a brief io_mutex_ hold; callers that get EAGAIN wait on the socket
// outside the lock, so operations on different channels interleave.
//
// A transport-level failure (socket error, protocol error, inactivity
// timeout) invalidates the session permanently. Channels keep a shared_ptr
// to their session, so the Session object outlives them even after close().
class Session : public std::enable_shared_from_this<Session> {
public:
    // Handshake, host-key check, public-key auth. Failures are
    // ErrorKind::Transport or ErrorKind::Auth.
    static Result<std::shared_ptr<Session>> connect(const ConnectionParams& params,
                                                    const SessionOptions& options = SessionOptions(),
                                                    HostKeyVerifier verify_host = accept_any_host_key,
                                                    StatusCallback callback = nullptr);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const ConnectionParams& params() const { return params_; }

    // False once closed or invalidated by a transport error.
    bool is_usable() const;
    std::string invalid_reason() const;

    // Disconnect and free the libssh2 session (and with it every channel).
    void close();

    // Mark unusable after a transport failure. Idempotent.
    void invalidate(const std::string& reason);

    // Err(Transport) when the session can no longer carry channels.
    Result<void> check_usable() const;

    // Open a channel of the requested kind. Independent of other channels.
    Result<std::unique_ptr<Channel>> open_channel(const ChannelRequest& request);

    // ── Channel plumbing ───────────────────────────────────────

    LIBSSH2_SESSION* raw() const { return session_; }
    socket_t socket() const { return sock_; }
    std::mutex& io_mutex() { return io_mutex_; }

    // Call fn under io_mutex_ until it returns something other than
    // LIBSSH2_ERROR_EAGAIN. Returns LIBSSH2_ERROR_TIMEOUT once the
    // inactivity timeout expires (the session is invalidated first), and
    // LIBSSH2_ERROR_SOCKET_DISCONNECT when the session is already unusable.
    int retry(const std::function<int()>& fn);

    // Same for calls returning a handle: nullptr + EAGAIN is retried.
    // On failure returns nullptr; *rc_out receives the libssh2 error code.
    void* retry_handle(const std::function<void*()>& fn, int* rc_out);

    // Wait (bounded) for the socket in the direction libssh2 is blocked on.
    // Returns false when the inactivity timeout has expired.
    bool wait_socket(int timeout_ms = IO_WAIT_SLICE_MS);

    void note_activity();

    // Last libssh2 error message (under io_mutex_).
    std::string last_error_message();

    // Convert a libssh2 return code into an error of the given kind.
    // Transport-class codes override the kind and invalidate the session.
    template <typename T>
    Result<T> fail(int rc, ErrorKind kind, const std::string& context);

    static bool is_transport_error(int rc);

    // Kind reported for rc: Transport for transport-class codes, else kind.
    static ErrorKind error_kind_for(int rc, ErrorKind kind);

    // "<context>: <detail> (rc=N)"
    static std::string error_message(int rc, const std::string& context,
                                     const std::string& detail);

private:
    Session(const ConnectionParams& params, const SessionOptions& options);

    Result<void> handshake(const HostKeyVerifier& verify_host, StatusCallback callback);
    Result<void> authenticate(StatusCallback callback);
    void send_keepalive_if_due();

    ConnectionParams params_;
    SessionOptions options_;
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = BSSH_INVALID_SOCKET;
    std::mutex io_mutex_;

    std::atomic<bool> usable_{false};
    mutable std::mutex reason_mutex_;
    std::string invalid_reason_;

    std::atomic<int64_t> last_activity_ms_{0};
    std::atomic<int64_t> last_keepalive_ms_{0};
};

// ── Template implementation ────────────────────────────────────

template <typename T>
Result<T> Session::fail(int rc, ErrorKind kind, const std::string& context) {
    std::string msg = error_message(rc, context, last_error_message());
    if (is_transport_error(rc)) invalidate(msg);
    return Result<T>::Err(error_kind_for(rc, kind), msg);
}
