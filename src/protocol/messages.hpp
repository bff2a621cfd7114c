#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace billwire {

// Failure kinds reported by the codecs and the stream framing.
enum class ProtocolError : uint8_t {
    kNone            = 0,
    kTruncatedHeader = 1,  // fewer than 4 header bytes
    kInvalidLength   = 2,  // TML below the structural minimum
    kTruncatedBody   = 3,  // fewer bytes than TML declares
    kMalformedBody   = 4,  // missing trailer, missing code, description overrun
    kTotalMismatch   = 5,  // declared total != recomputed total
    kFieldOutOfRange = 6,  // encode: value above 0x7FFF or ambiguous item start
    kMessageTooLarge = 7,  // encode: message does not fit a u16 TML
};

// Stable name for logs, e.g. "MalformedBody".
const char* protocol_error_name(ProtocolError err);

// One (quantity, code) pair in a request.
struct LineItem {
    uint16_t quantity = 0;
    uint16_t code = 0;

    bool operator==(const LineItem& o) const {
        return quantity == o.quantity && code == o.code;
    }
    bool operator!=(const LineItem& o) const { return !(*this == o); }
};

// Client -> server
struct BillingRequest {
    uint16_t request_number = 0;
    uint16_t total_message_length = 0;  // filled by decode; encode computes it
    std::vector<LineItem> items;
};

// One priced row in a response. The wire length prefix is description.size().
struct PricedLineItem {
    std::string description;
    uint16_t unit_cost = 0;
    uint16_t quantity = 0;

    bool operator==(const PricedLineItem& o) const {
        return description == o.description && unit_cost == o.unit_cost &&
               quantity == o.quantity;
    }
    bool operator!=(const PricedLineItem& o) const { return !(*this == o); }
};

// Server -> client
struct BillingResponse {
    uint16_t request_number = 0;
    uint16_t total_message_length = 0;  // filled by decode; encode computes it
    uint32_t total_cost = 0;
    std::vector<PricedLineItem> items;
};

// Server -> client when the request could not be served: ReqNum 0xFFFF
struct ErrorResponse {
    uint16_t request_number = 0;
};

enum class ResponseKind : uint8_t {
    kBill  = 0,
    kError = 1,
};

// Result of decoding a server reply; exactly one of bill / error is meaningful.
struct ResponseMessage {
    ResponseKind kind = ResponseKind::kBill;
    BillingResponse bill;
    ErrorResponse error;
};

} // namespace billwire
