#include "billwireclient/console_input.hpp"
#include "billwireclient/socket_client.hpp"
#include "billing/bill_format.hpp"
#include "billing/billing_engine.hpp"
#include "core/version.hpp"
#include "protocol/hex_format.hpp"
#include "protocol/messages.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/socket_utils.hpp"
#include "util/logger.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>
#include <string>

using namespace billwire;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Connection (one required):\n"
        "  -socket <path>           UNIX domain socket path\n"
        "  -tcp <host>:<port>       TCP server address\n"
        "\n"
        "Options:\n"
        "  -reqnum <int>            Request number 0..65535 (default: clock-derived)\n"
        "  -log_level <level>       error, warn, info or debug (default: info)\n"
        "  -v, --verbose            Verbose logging\n"
        "  --version                Print version and exit\n"
        "\n"
        "Quantity/code pairs are read from standard input; enter -1 as the\n"
        "quantity to finish.\n",
        prog);
}

// Low 15 bits of the wall clock in milliseconds.
static uint16_t default_request_number() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return static_cast<uint16_t>(ms & 0x7FFF);
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (check_version(cli, "billwireclient")) return 0;

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }

    if (!cli.has("-socket") && !cli.has("-tcp")) {
        std::fprintf(stderr, "Error: one of -socket or -tcp is required\n");
        print_usage(argv[0]);
        return 1;
    }

    Logger logger;
    if (!make_logger(cli, logger)) return 1;

    BillingRequest req;
    req.request_number = default_request_number();
    if (cli.has("-reqnum")) {
        long v;
        if (!cli.get_int_in_range("-reqnum", 0, 0xFFFF, v)) {
            std::fprintf(stderr, "Error: -reqnum must be in range 0..65535\n");
            return 1;
        }
        req.request_number = static_cast<uint16_t>(v);
    }

    req.items = collect_line_items(std::cin, std::cout);
    logger.debug("Collected %zu item(s), request number %u",
                 req.items.size(), static_cast<unsigned>(req.request_number));

    BillExchange exchange;
    ProtocolError err = prepare_exchange(req, exchange);
    if (err != ProtocolError::kNone) {
        logger.error("Cannot encode request: %s", protocol_error_name(err));
        return 1;
    }
    std::printf("\nRequest bytes:\n%s\n", format_hex(exchange.request_bytes).c_str());
    std::fflush(stdout);

    int fd = -1;
    if (cli.has("-socket")) {
        std::string path = cli.get_string("-socket");
        fd = unix_connect(path);
        if (fd < 0) {
            logger.error("Cannot connect to UNIX socket %s", path.c_str());
            return 1;
        }
    } else {
        std::string addr = cli.get_string("-tcp");
        fd = tcp_connect(addr);
        if (fd < 0) {
            logger.error("Cannot connect to %s", addr.c_str());
            return 1;
        }
    }

    bool ok = send_exchange(fd, exchange);
    close_fd(fd);

    if (!exchange.response_bytes.empty()) {
        std::printf("\nResponse bytes:\n%s\n", format_hex(exchange.response_bytes).c_str());
    }

    if (!ok) {
        if (exchange.error == ProtocolError::kTotalMismatch) {
            const auto& bill = exchange.response.bill;
            std::printf("\n%s", format_total_mismatch(bill.total_cost,
                                                      aggregate_total(bill.items)).c_str());
        } else if (exchange.error == ProtocolError::kNone) {
            logger.error("Failed to send request");
        } else {
            logger.error("Bad response: %s", protocol_error_name(exchange.error));
        }
        return 1;
    }

    if (exchange.response.kind == ResponseKind::kError) {
        std::printf("Server reported error for request %u.\n",
                    static_cast<unsigned>(exchange.response.error.request_number));
        return 1;
    }

    std::printf("\n%s", format_bill(exchange.response.bill).c_str());
    return 0;
}
