#pragma once

#include <string>

namespace billwire {

// Create a UNIX domain socket, bind, and listen.
// Returns listening fd on success, -1 on error.
// Removes existing socket file if present.
int unix_listen(const std::string& path, int backlog = 16);

// Create a TCP socket, bind, and listen.
// addr format: "host:port" or ":port" (bind to all interfaces).
// Returns listening fd on success, -1 on error.
int tcp_listen(const std::string& addr, int backlog = 16);

// Accept a connection from a listening socket.
// Returns connected fd on success, -1 on error.
int accept_connection(int listen_fd);

// Connect to a UNIX domain socket.
// Returns connected fd on success, -1 on error.
int unix_connect(const std::string& path);

// Connect to a TCP address ("host:port"; host may be a name).
// Returns connected fd on success, -1 on error.
int tcp_connect(const std::string& addr);

// "a.b.c.d:port" for a TCP peer, "unix" for a UNIX domain peer, "?" otherwise.
std::string peer_name(int fd);

// Make blocking reads on fd fail with EAGAIN after timeout_ms without data.
bool set_recv_timeout(int fd, int timeout_ms);

// Close a file descriptor, retrying on EINTR.
void close_fd(int fd);

} // namespace billwire
