#pragma once

// POSIX socket helpers used by the SSH session layer.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define HOSTCP_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host (name or IPv4/IPv6 literal) and open a TCP connection,
// trying each resolved address until one connects within timeout_ms.
// The returned socket is non-blocking.
Result<socket_t> dial_tcp(const std::string& host, int port, int timeout_ms);

// Remote address of a connected socket as "ip:port" ("[ip]:port" for IPv6).
std::string peer_address(socket_t sock);

} // namespace platform
