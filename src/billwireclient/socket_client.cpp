#include "billwireclient/socket_client.hpp"

#include "billing/billing_engine.hpp"
#include "protocol/frame.hpp"
#include "protocol/request_codec.hpp"
#include "protocol/response_codec.hpp"

namespace billwire {

ProtocolError prepare_exchange(const BillingRequest& req, BillExchange& exchange) {
    exchange.error = encode_request(req, exchange.request_bytes);
    return exchange.error;
}

bool send_exchange(int fd, BillExchange& exchange) {
    exchange.error = ProtocolError::kNone;
    exchange.response_bytes.clear();
    if (!write_message(fd, exchange.request_bytes)) return false;

    exchange.error = read_response_message(fd, exchange.response_bytes);
    if (exchange.error != ProtocolError::kNone) return false;

    exchange.error = decode_response(exchange.response_bytes, exchange.response);
    if (exchange.error != ProtocolError::kNone) return false;

    if (exchange.response.kind == ResponseKind::kError) return true;

    exchange.error = check_total(exchange.response.bill);
    return exchange.error == ProtocolError::kNone;
}

bool socket_bill(int fd, const BillingRequest& req, BillExchange& exchange) {
    if (prepare_exchange(req, exchange) != ProtocolError::kNone) return false;
    return send_exchange(fd, exchange);
}

} // namespace billwire
