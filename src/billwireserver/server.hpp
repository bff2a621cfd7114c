#pragma once

#include <atomic>
#include <string>
#include <vector>

#include "billing/catalog.hpp"
#include "util/logger.hpp"

namespace billwire {

struct ServerConfig {
    std::string catalog_path;
    std::string unix_socket_path;
    std::string tcp_addr;           // "host:port"
    std::string pid_file;
    int client_timeout = 30;        // seconds a client may take to send its request
    Logger::Level log_level = Logger::kInfo;
};

// Billing server: one catalog, any number of listeners, one exchange at a time.
class Server {
public:
    Server() = default;
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Load the catalog. A missing file yields an empty catalog.
    void load_catalog(const std::string& path, const Logger& logger);

    const Catalog& catalog() const { return catalog_; }

    // Run the server (blocking). Returns exit code.
    int run(const ServerConfig& config);

    // Request graceful shutdown (called from signal handler).
    void request_shutdown();

    bool shutdown_requested() const {
        return shutdown_requested_.load(std::memory_order_acquire);
    }

private:
    Catalog catalog_;
    std::atomic<bool> shutdown_requested_{false};
    std::vector<int> listen_fds_;

    void accept_loop(int client_timeout, const Logger& logger);
    void serve_client(int client_fd, int client_timeout, const Logger& logger);
    void write_pid_file(const std::string& path, const Logger& logger);
};

} // namespace billwire
