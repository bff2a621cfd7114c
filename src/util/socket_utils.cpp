#include "util/socket_utils.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace billwire {

// "host:port" or ":port". Port must be 1..65535.
static bool parse_host_port(const std::string& addr, std::string& host, uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos || colon + 1 == addr.size()) return false;

    const char* digits = addr.c_str() + colon + 1;
    char* end = nullptr;
    errno = 0;
    long val = std::strtol(digits, &end, 10);
    if (errno == ERANGE || *end != '\0' || val <= 0 || val > 65535) return false;

    host = addr.substr(0, colon);
    port = static_cast<uint16_t>(val);
    return true;
}

static bool fill_unix_addr(const std::string& path, struct sockaddr_un& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) return false;
    std::memcpy(addr.sun_path, path.c_str(), path.size());
    return true;
}

// Numeric IPv4 first, then a name lookup. An empty host means any_host.
static bool fill_inet_addr(const std::string& host, uint16_t port, in_addr_t any_host,
                           struct sockaddr_in& sa) {
    std::memset(&sa, 0, sizeof(sa));
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);

    if (host.empty()) {
        sa.sin_addr.s_addr = any_host;
        return true;
    }
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) == 1) return true;

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    if (::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || res == nullptr) {
        return false;
    }
    sa.sin_addr = reinterpret_cast<struct sockaddr_in*>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);
    return true;
}

// Takes ownership of fd: returns it listening, or closes it and returns -1.
static int bind_and_listen(int fd, const struct sockaddr* addr, socklen_t len, int backlog) {
    if (::bind(fd, addr, len) < 0 || ::listen(fd, backlog) < 0) {
        close_fd(fd);
        return -1;
    }
    return fd;
}

// Takes ownership of fd: returns it connected, or closes it and returns -1.
static int connect_or_close(int fd, const struct sockaddr* addr, socklen_t len) {
    int ret;
    do {
        ret = ::connect(fd, addr, len);
    } while (ret < 0 && errno == EINTR);
    if (ret < 0) {
        close_fd(fd);
        return -1;
    }
    return fd;
}

int unix_listen(const std::string& path, int backlog) {
    struct sockaddr_un addr;
    if (!fill_unix_addr(path, addr)) return -1;

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    // A stale socket file from an earlier run would make bind() fail
    ::unlink(path.c_str());

    return bind_and_listen(fd, reinterpret_cast<const struct sockaddr*>(&addr),
                           sizeof(addr), backlog);
}

int tcp_listen(const std::string& addr, int backlog) {
    std::string host;
    uint16_t port;
    struct sockaddr_in sa;
    if (!parse_host_port(addr, host, port)) return -1;
    if (!fill_inet_addr(host, port, htonl(INADDR_ANY), sa)) return -1;

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;

    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close_fd(fd);
        return -1;
    }

    return bind_and_listen(fd, reinterpret_cast<const struct sockaddr*>(&sa),
                           sizeof(sa), backlog);
}

int accept_connection(int listen_fd) {
    int fd;
    do {
        fd = ::accept(listen_fd, nullptr, nullptr);
    } while (fd < 0 && errno == EINTR);
    return fd;
}

int unix_connect(const std::string& path) {
    struct sockaddr_un addr;
    if (!fill_unix_addr(path, addr)) return -1;

    int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    return connect_or_close(fd, reinterpret_cast<const struct sockaddr*>(&addr),
                            sizeof(addr));
}

int tcp_connect(const std::string& addr) {
    std::string host;
    uint16_t port;
    struct sockaddr_in sa;
    if (!parse_host_port(addr, host, port)) return -1;
    if (!fill_inet_addr(host, port, htonl(INADDR_LOOPBACK), sa)) return -1;

    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) return -1;
    return connect_or_close(fd, reinterpret_cast<const struct sockaddr*>(&sa), sizeof(sa));
}

bool set_recv_timeout(int fd, int timeout_ms) {
    struct timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
}

std::string peer_name(int fd) {
    struct sockaddr_storage ss;
    socklen_t len = sizeof(ss);
    std::memset(&ss, 0, sizeof(ss));
    if (::getpeername(fd, reinterpret_cast<struct sockaddr*>(&ss), &len) < 0) {
        return "?";
    }

    if (ss.ss_family == AF_UNIX) return "unix";
    if (ss.ss_family != AF_INET) return "?";

    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(&ss);
    char host[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &sin->sin_addr, host, sizeof(host)) == nullptr) {
        return "?";
    }
    return std::string(host) + ":" + std::to_string(ntohs(sin->sin_port));
}

void close_fd(int fd) {
    if (fd < 0) return;
    int ret;
    do {
        ret = ::close(fd);
    } while (ret < 0 && errno == EINTR);
}

} // namespace billwire
