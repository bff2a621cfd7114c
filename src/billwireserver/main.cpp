#include "billwireserver/server.hpp"
#include "core/version.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"

#include <csignal>
#include <cstdio>

using namespace billwire;

static Server* g_server = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_server) {
        g_server->request_shutdown();
    }
}

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -catalog <path>          Item catalog CSV (code,description,cost)\n"
        "\n"
        "Listener (at least one required):\n"
        "  -socket <path>           UNIX domain socket path\n"
        "  -tcp <host>:<port>       TCP listen address\n"
        "\n"
        "Options:\n"
        "  -pid <path>              PID file path\n"
        "  -client_timeout <int>    Seconds a client may take to send its request\n"
        "                           (default: 30)\n"
        "  -log_level <level>       error, warn, info or debug (default: info)\n"
        "  -v, --verbose            Verbose logging (same as -log_level debug)\n"
        "  --version                Print version and exit\n",
        prog);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "billwireserver")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    if (!cli.has("-catalog")) {
        std::fprintf(stderr, "Error: -catalog is required\n");
        print_usage(argv[0]);
        return 1;
    }

    if (!cli.has("-socket") && !cli.has("-tcp")) {
        std::fprintf(stderr, "Error: at least one of -socket or -tcp is required\n");
        print_usage(argv[0]);
        return 1;
    }

    Logger logger;
    if (!make_logger(cli, logger)) return 1;

    ServerConfig config;
    config.catalog_path = cli.get_string("-catalog");
    config.unix_socket_path = cli.get_string("-socket");
    config.tcp_addr = cli.get_string("-tcp");
    config.pid_file = cli.get_string("-pid");
    if (cli.has("-client_timeout")) {
        long v;
        if (!cli.get_int_in_range("-client_timeout", 1, 86400, v)) {
            std::fprintf(stderr, "Error: -client_timeout must be in range 1..86400\n");
            return 1;
        }
        config.client_timeout = static_cast<int>(v);
    }
    config.log_level = logger.level();

    Server server;
    g_server = &server;

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    // A client hanging up mid-reply must not kill the server
    std::signal(SIGPIPE, SIG_IGN);

    int ret = server.run(config);
    g_server = nullptr;
    return ret;
}
