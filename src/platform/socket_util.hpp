#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

using socket_t = int;
#define SHELLPOOL_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host:port and open a non-blocking TCP connection, waiting at most
// timeout_ms for it to complete. Tries every resolved address in order.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms);

// Enable TCP keepalive probes on an established socket.
void enable_keepalive(socket_t sock);

} // namespace platform
