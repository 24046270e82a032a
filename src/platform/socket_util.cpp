#include "socket_util.hpp"
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

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

// Non-blocking connect on one resolved address. Returns 0 or an errno value.
static int connect_one(socket_t sock, const struct addrinfo* ai, int timeout_ms) {
    int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
    if (ret == 0) return 0;
    if (errno != EINPROGRESS) return errno;

    int revents = poll_socket(sock, POLLOUT, timeout_ms);
    if (revents == 0) return ETIMEDOUT;

    int sock_err = 0;
    socklen_t err_len = sizeof(sock_err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len) != 0) {
        return errno;
    }
    return sock_err;
}

Result<socket_t> dial_tcp(const std::string& host, int port, int timeout_ms) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string service = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), service.c_str(), &hints, &res);
    if (gai != 0) {
        return Result<socket_t>::Err(
            fmt::format("Failed to resolve host {}: {}", host, gai_strerror(gai)),
            ErrorKind::Connect);
    }

    std::string last_error = "no usable address";
    for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int err = connect_one(sock, ai, timeout_ms);
        if (err == 0) {
            freeaddrinfo(res);
            return Result<socket_t>::Ok(sock);
        }
        last_error = (err == ETIMEDOUT) ? "connection timed out" : std::strerror(err);
        close_socket(sock);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(
        fmt::format("Failed to connect to {}:{}: {}", host, port, last_error),
        ErrorKind::Connect);
}

std::string peer_address(socket_t sock) {
    struct sockaddr_storage addr;
    socklen_t len = sizeof(addr);
    if (getpeername(sock, reinterpret_cast<struct sockaddr*>(&addr), &len) != 0) {
        return "";
    }

    char ip[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        auto* in4 = reinterpret_cast<struct sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in4->sin_addr, ip, sizeof(ip));
        return fmt::format("{}:{}", ip, ntohs(in4->sin_port));
    }
    if (addr.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, ip, sizeof(ip));
        return fmt::format("[{}]:{}", ip, ntohs(in6->sin6_port));
    }
    return "";
}

} // namespace platform
