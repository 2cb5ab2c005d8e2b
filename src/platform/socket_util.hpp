#pragma once

// Socket utilities for the SSH transport.

#include <string>
#include <poll.h>

using socket_t = int;
#define PLEXMOVER_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve `address` (IPv4, IPv6 or hostname) and connect with a timeout.
// Returns a connected non-blocking socket, or PLEXMOVER_INVALID_SOCKET with
// `error` set.
socket_t connect_tcp(const std::string& address, int port, int timeout_ms, std::string& error);

// Enable TCP keepalive probes (idle 60s, interval 15s, 4 probes).
void enable_keepalive(socket_t sock);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
