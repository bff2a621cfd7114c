#include "billwireserver/connection_handler.hpp"
#include "billwireserver/request_processor.hpp"
#include "protocol/frame.hpp"
#include "protocol/hex_format.hpp"
#include "protocol/response_codec.hpp"
#include "util/socket_utils.hpp"

namespace billwire {

static void send_error(int fd, uint16_t request_number, const Logger& logger) {
    auto reply = encode_error_response(request_number);
    if (!write_message(fd, reply)) {
        logger.debug("Failed to send error response");
        return;
    }
    logger.info("Sent error response: %s", format_hex(reply).c_str());
}

void handle_connection(int client_fd, const Catalog& catalog, const Logger& logger,
                       const ReadWaitFn& keep_waiting) {
    logger.info("Client connected: %s", peer_name(client_fd).c_str());

    std::vector<uint8_t> message;
    ProtocolError err = read_request_message(client_fd, message, keep_waiting);

    switch (err) {
    case ProtocolError::kNone:
        break;

    case ProtocolError::kTruncatedHeader:
        logger.info("No complete header from client (%zu bytes)", message.size());
        close_fd(client_fd);
        return;

    default:
        logger.warn("Request %u: %s",
                    static_cast<unsigned>(peek_request_number(message)),
                    protocol_error_name(err));
        send_error(client_fd, peek_request_number(message), logger);
        close_fd(client_fd);
        return;
    }

    logger.info("Request bytes: %s", format_hex(message).c_str());

    std::vector<uint8_t> reply;
    err = process_request(message, catalog, reply);
    if (err != ProtocolError::kNone) {
        logger.warn("Request %u: %s",
                    static_cast<unsigned>(peek_request_number(message)),
                    protocol_error_name(err));
    }

    logger.info("Response bytes: %s", format_hex(reply).c_str());
    if (!write_message(client_fd, reply)) {
        logger.debug("Failed to send response");
    }

    close_fd(client_fd);
}

} // namespace billwire
