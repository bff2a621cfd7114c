#pragma once

#include <cstdint>
#include <vector>

#include "protocol/messages.hpp"

namespace billwire {

// Everything one request/reply round trip produced, kept for display.
struct BillExchange {
    std::vector<uint8_t> request_bytes;
    std::vector<uint8_t> response_bytes;
    ResponseMessage response;
    ProtocolError error = ProtocolError::kNone;
};

// Encode req into exchange.request_bytes. Nothing is sent.
ProtocolError prepare_exchange(const BillingRequest& req, BillExchange& exchange);

// Send exchange.request_bytes over a connected socket, then read, decode and
// verify the reply.
// Returns true if a bill with a matching total or an ErrorResponse came back.
// Returns false otherwise; exchange.error then holds the protocol failure
// (kTotalMismatch leaves the decoded bill in exchange.response), or kNone if
// the socket write failed.
bool send_exchange(int fd, BillExchange& exchange);

// prepare_exchange followed by send_exchange.
bool socket_bill(int fd, const BillingRequest& req, BillExchange& exchange);

} // namespace billwire
