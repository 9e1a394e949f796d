#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace platform {

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

void close_socket(socket_t sock) {
    close(sock);
}

// Non-blocking connect with a deadline. Returns empty string on success.
static std::string try_connect(const struct addrinfo* ai, socket_t& out, int timeout_secs) {
    socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (sock < 0) {
        return std::string("socket: ") + strerror(errno);
    }

    set_nonblocking(sock);

    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret < 0 && errno != EINPROGRESS) {
        std::string err = strerror(errno);
        close_socket(sock);
        return err;
    }

    if (ret < 0) {
        int revents = poll_socket(sock, POLLOUT, timeout_secs * 1000);
        if (revents == 0) {
            close_socket(sock);
            return "connection timed out";
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
        if (sock_err != 0) {
            close_socket(sock);
            return strerror(sock_err);
        }
    }

    out = sock;
    return "";
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        return Result<socket_t>::Err(ErrorKind::Transport,
            "Failed to resolve host " + host + ": " + gai_strerror(rc));
    }

    std::string last_error = "no addresses";
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = BSSH_INVALID_SOCKET;
        last_error = try_connect(ai, sock, timeout_secs);
        if (last_error.empty()) {
            freeaddrinfo(res);
            return Result<socket_t>::Ok(sock);
        }
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(ErrorKind::Transport,
        "Failed to connect to " + host + ":" + port_str + ": " + last_error);
}

void enable_tcp_keepalive(socket_t sock) {
    int tcp_keepalive = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &tcp_keepalive, sizeof(tcp_keepalive));
    int keepidle = 60;
    int keepintvl = 15;
    int keepcnt = 4;
#ifdef TCP_KEEPIDLE
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &keepidle, sizeof(keepidle));
#endif
#ifdef TCP_KEEPINTVL
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &keepintvl, sizeof(keepintvl));
#endif
#ifdef TCP_KEEPCNT
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &keepcnt, sizeof(keepcnt));
#endif
}

} // namespace platform
