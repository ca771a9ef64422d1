#pragma once

// Cross-platform socket utilities.

#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHDECK_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SSHDECK_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Shut down both directions; wakes any thread blocked in poll/read on it.
void shutdown_socket(socket_t sock);

// Resolve host and connect within timeout_ms. The returned socket is in
// blocking mode. Fails with ErrorKind::Dial.
Result<socket_t> tcp_connect(const std::string& host, int port, int timeout_ms);

// Bind and listen on 127.0.0.1:port. Fails with ErrorKind::Listen.
Result<socket_t> tcp_listen_loopback(int port, int backlog = 16);

// Port a bound socket is listening on (0 on failure).
int local_port(socket_t sock);

// Check if a local TCP port is accepting connections.
bool is_port_open(int port);

// Accept one pending connection (blocking mode). SSHDECK_INVALID_SOCKET on error.
socket_t accept_client(socket_t listen_sock);

// Single recv. Bytes read, 0 on orderly close, negative on error.
long recv_some(socket_t sock, char* buf, size_t len);

// Write the whole buffer. Returns false on error.
bool send_all(socket_t sock, const char* data, size_t len);

} // namespace platform
