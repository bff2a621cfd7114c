#include "protocol/response_codec.hpp"
#include "protocol/byte_codec.hpp"
#include "core/config.hpp"

#include <utility>

namespace billwire {

std::string truncate_description(const std::string& description) {
    if (description.size() <= MAX_DESCRIPTION_LENGTH) return description;
    return description.substr(0, MAX_DESCRIPTION_LENGTH);
}

static size_t encoded_description_size(const std::string& description) {
    return description.size() < MAX_DESCRIPTION_LENGTH
        ? description.size() : MAX_DESCRIPTION_LENGTH;
}

size_t response_length(const std::vector<PricedLineItem>& items) {
    size_t len = MIN_RESPONSE_LENGTH;
    for (const auto& item : items) {
        len += RESPONSE_ITEM_FIXED_SIZE + encoded_description_size(item.description);
    }
    return len;
}

// Len=0xFF followed by a description starting with 0xFF reads back as the trailer.
static bool looks_like_trailer(const std::string& description) {
    return description.size() >= MAX_DESCRIPTION_LENGTH &&
           static_cast<uint8_t>(description[0]) == 0xFF;
}

ProtocolError encode_response(uint16_t request_number,
                              const std::vector<PricedLineItem>& items,
                              uint32_t total_cost,
                              std::vector<uint8_t>& out) {
    out.clear();

    for (const auto& item : items) {
        if (item.unit_cost > MAX_FIELD_VALUE || item.quantity > MAX_FIELD_VALUE) {
            return ProtocolError::kFieldOutOfRange;
        }
        if (looks_like_trailer(item.description)) {
            return ProtocolError::kFieldOutOfRange;
        }
    }

    size_t tml = response_length(items);
    if (tml > MAX_MESSAGE_LENGTH) return ProtocolError::kMessageTooLarge;

    out.reserve(tml);
    put_u16(out, request_number);
    put_u16(out, static_cast<uint16_t>(tml));
    put_u32(out, total_cost);
    for (const auto& item : items) {
        put_str8(out, truncate_description(item.description));
        put_u16(out, item.unit_cost);
        put_u16(out, item.quantity);
    }
    put_u16(out, SENTINEL);

    return ProtocolError::kNone;
}

ProtocolError encode_response(const BillingResponse& resp, std::vector<uint8_t>& out) {
    return encode_response(resp.request_number, resp.items, resp.total_cost, out);
}

std::vector<uint8_t> encode_error_response(uint16_t request_number) {
    std::vector<uint8_t> out;
    out.reserve(ERROR_RESPONSE_SIZE);
    put_u16(out, request_number);
    put_u16(out, SENTINEL);
    return out;
}

bool is_error_response(const uint8_t* data, size_t size) {
    if (size < ERROR_RESPONSE_SIZE) return false;
    return load_u16(data + 2) == SENTINEL;
}

ProtocolError decode_response(const std::vector<uint8_t>& data, ResponseMessage& msg) {
    ByteReader header(data.data(), data.size());
    uint16_t request_number = 0;
    uint16_t tml = 0;
    if (!header.get_u16(request_number) || !header.get_u16(tml)) {
        return ProtocolError::kTruncatedHeader;
    }

    // Bytes 2-3 decide between the two reply shapes before anything else is read.
    if (tml == SENTINEL) {
        msg.kind = ResponseKind::kError;
        msg.error.request_number = request_number;
        msg.bill = BillingResponse();
        return ProtocolError::kNone;
    }

    if (tml < HEADER_SIZE) return ProtocolError::kInvalidLength;
    if (data.size() < tml) return ProtocolError::kTruncatedBody;

    ByteReader body(data.data() + HEADER_SIZE, tml - HEADER_SIZE);
    BillingResponse bill;
    bill.request_number = request_number;
    bill.total_message_length = tml;
    if (!body.get_u32(bill.total_cost)) return ProtocolError::kMalformedBody;

    for (;;) {
        // An item opens with a 1-byte length; only a full FF FF pair is the trailer.
        uint16_t next = 0;
        if (!body.peek_u16(next)) return ProtocolError::kMalformedBody;
        if (next == SENTINEL) break;

        PricedLineItem item;
        if (!body.get_str8(item.description)) return ProtocolError::kMalformedBody;
        if (!body.get_u16(item.unit_cost) || !body.get_u16(item.quantity)) {
            return ProtocolError::kMalformedBody;
        }
        bill.items.push_back(std::move(item));
    }

    msg.kind = ResponseKind::kBill;
    msg.bill = std::move(bill);
    msg.error = ErrorResponse();
    return ProtocolError::kNone;
}

} // namespace billwire
