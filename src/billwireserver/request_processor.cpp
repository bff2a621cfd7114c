#include "billwireserver/request_processor.hpp"
#include "billing/billing_engine.hpp"
#include "protocol/byte_codec.hpp"
#include "protocol/request_codec.hpp"
#include "protocol/response_codec.hpp"

namespace billwire {

uint16_t peek_request_number(const std::vector<uint8_t>& message) {
    if (message.size() < 2) return 0;
    return load_u16(message.data());
}

ProtocolError process_request(const std::vector<uint8_t>& message,
                              const Catalog& catalog,
                              std::vector<uint8_t>& reply) {
    BillingRequest req;
    ProtocolError err = decode_request(message, req);
    if (err != ProtocolError::kNone) {
        reply = encode_error_response(peek_request_number(message));
        return err;
    }

    BillingResponse resp = build_response(req, catalog);
    err = encode_response(resp, reply);
    if (err != ProtocolError::kNone) {
        reply = encode_error_response(req.request_number);
        return err;
    }
    return ProtocolError::kNone;
}

} // namespace billwire
