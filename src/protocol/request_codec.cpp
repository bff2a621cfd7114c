#include "protocol/request_codec.hpp"
#include "protocol/byte_codec.hpp"
#include "core/config.hpp"

#include <utility>

namespace billwire {

ProtocolError encode_request(uint16_t request_number,
                             const std::vector<LineItem>& items,
                             std::vector<uint8_t>& out) {
    out.clear();

    for (const auto& item : items) {
        if (item.quantity > MAX_FIELD_VALUE || item.code > MAX_FIELD_VALUE) {
            return ProtocolError::kFieldOutOfRange;
        }
    }

    size_t tml = request_length(items.size());
    if (tml > MAX_MESSAGE_LENGTH) return ProtocolError::kMessageTooLarge;

    out.reserve(tml);
    put_u16(out, request_number);
    put_u16(out, static_cast<uint16_t>(tml));
    for (const auto& item : items) {
        put_u16(out, item.quantity);
        put_u16(out, item.code);
    }
    put_u16(out, SENTINEL);

    return ProtocolError::kNone;
}

ProtocolError encode_request(const BillingRequest& req, std::vector<uint8_t>& out) {
    return encode_request(req.request_number, req.items, out);
}

ProtocolError decode_request(const std::vector<uint8_t>& data, BillingRequest& req) {
    ByteReader header(data.data(), data.size());
    uint16_t request_number = 0;
    uint16_t tml = 0;
    if (!header.get_u16(request_number) || !header.get_u16(tml)) {
        return ProtocolError::kTruncatedHeader;
    }
    if (tml < MIN_REQUEST_LENGTH) return ProtocolError::kInvalidLength;
    if (data.size() < tml) return ProtocolError::kTruncatedBody;

    ByteReader body(data.data() + HEADER_SIZE, tml - HEADER_SIZE);
    std::vector<LineItem> items;
    items.reserve((tml - MIN_REQUEST_LENGTH) / REQUEST_PAIR_SIZE);

    for (;;) {
        // Trailer and quantity share a width, so test for the trailer first.
        uint16_t next = 0;
        if (!body.peek_u16(next)) return ProtocolError::kMalformedBody;
        if (next == SENTINEL) break;

        LineItem item;
        if (!body.get_u16(item.quantity) || !body.get_u16(item.code)) {
            return ProtocolError::kMalformedBody;
        }
        items.push_back(item);
    }

    req.request_number = request_number;
    req.total_message_length = tml;
    req.items = std::move(items);
    return ProtocolError::kNone;
}

} // namespace billwire
