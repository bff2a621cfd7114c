#include "billwireserver/server.hpp"
#include "billwireserver/connection_handler.hpp"
#include "io/catalog_reader.hpp"
#include "util/socket_utils.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>

#include <poll.h>
#include <unistd.h>

namespace billwire {

// Poll and per-read slice. Bounds how long a shutdown request goes unnoticed.
static constexpr int POLL_INTERVAL_MS = 500;

Server::~Server() {
    for (int fd : listen_fds_) {
        close_fd(fd);
    }
}

void Server::load_catalog(const std::string& path, const Logger& logger) {
    catalog_ = read_catalog(path, logger);
    logger.info("Loaded %zu catalog entries from %s", catalog_.size(), path.c_str());
}

void Server::request_shutdown() {
    shutdown_requested_.store(true, std::memory_order_release);
}

void Server::write_pid_file(const std::string& path, const Logger& logger) {
    std::ofstream f(path);
    if (!f.is_open()) {
        logger.warn("Cannot write PID file %s", path.c_str());
        return;
    }
    f << ::getpid() << "\n";
}

void Server::serve_client(int client_fd, int client_timeout, const Logger& logger) {
    if (!set_recv_timeout(client_fd, POLL_INTERVAL_MS)) {
        logger.error("Cannot set receive timeout: %s", std::strerror(errno));
        close_fd(client_fd);
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(client_timeout);
    handle_connection(client_fd, catalog_, logger, [&] {
        if (shutdown_requested()) return false;
        if (std::chrono::steady_clock::now() >= deadline) {
            logger.warn("Client timed out after %d s", client_timeout);
            return false;
        }
        return true;
    });
}

void Server::accept_loop(int client_timeout, const Logger& logger) {
    std::vector<struct pollfd> pfds(listen_fds_.size());
    for (size_t i = 0; i < listen_fds_.size(); i++) {
        pfds[i].fd = listen_fds_[i];
        pfds[i].events = POLLIN;
    }

    while (!shutdown_requested()) {
        // Poll with timeout so a shutdown request is noticed
        for (auto& pfd : pfds) pfd.revents = 0;
        int ret = ::poll(pfds.data(), pfds.size(), POLL_INTERVAL_MS);

        if (ret < 0) {
            if (errno == EINTR) continue;
            logger.error("poll() failed: %s", std::strerror(errno));
            break;
        }

        if (ret == 0) continue; // timeout

        for (const auto& pfd : pfds) {
            if (!(pfd.revents & POLLIN)) continue;

            int client_fd = accept_connection(pfd.fd);
            if (client_fd < 0) {
                if (shutdown_requested()) break;
                logger.error("accept() failed: %s", std::strerror(errno));
                continue;
            }

            // One exchange at a time; the next accept waits for this to finish.
            serve_client(client_fd, client_timeout, logger);
        }
    }
}

int Server::run(const ServerConfig& config) {
    Logger logger(config.log_level);

    if (config.unix_socket_path.empty() && config.tcp_addr.empty()) {
        logger.error("At least one of -socket or -tcp must be specified");
        return 1;
    }

    if (config.client_timeout <= 0) {
        logger.error("Client timeout must be positive (got %d)", config.client_timeout);
        return 1;
    }

    load_catalog(config.catalog_path, logger);

    if (!config.unix_socket_path.empty()) {
        int fd = unix_listen(config.unix_socket_path);
        if (fd < 0) {
            logger.error("Cannot listen on UNIX socket %s", config.unix_socket_path.c_str());
            return 1;
        }
        listen_fds_.push_back(fd);
        logger.info("Listening on UNIX socket: %s", config.unix_socket_path.c_str());
    }

    if (!config.tcp_addr.empty()) {
        int fd = tcp_listen(config.tcp_addr);
        if (fd < 0) {
            logger.error("Cannot listen on TCP %s", config.tcp_addr.c_str());
            return 1;
        }
        listen_fds_.push_back(fd);
        logger.info("Listening on TCP: %s", config.tcp_addr.c_str());
    }

    if (!config.pid_file.empty()) {
        write_pid_file(config.pid_file, logger);
    }

    logger.info("Server ready");

    // Blocks until shutdown
    accept_loop(config.client_timeout, logger);

    // Cleanup
    if (!config.unix_socket_path.empty()) {
        ::unlink(config.unix_socket_path.c_str());
    }
    if (!config.pid_file.empty()) {
        ::unlink(config.pid_file.c_str());
    }

    logger.info("Server shut down");
    return 0;
}

} // namespace billwire
