#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "protocol/messages.hpp"

namespace billwire {

// Request wire layout (big-endian):
//   ReqNum(2) TML(2) [Qty(2) Code(2)]* 0xFFFF(2)

// Encoded size of a request carrying num_items pairs.
inline size_t request_length(size_t num_items) {
    return 4 + 4 * num_items + 2;
}

// Encode into out (replacing its contents).
// Fails with kFieldOutOfRange if a quantity or code exceeds 0x7FFF,
// or kMessageTooLarge if the message would not fit a u16 TML.
// out is left empty on failure.
ProtocolError encode_request(uint16_t request_number,
                             const std::vector<LineItem>& items,
                             std::vector<uint8_t>& out);

ProtocolError encode_request(const BillingRequest& req, std::vector<uint8_t>& out);

// Decode a complete request buffer. Only the first TML bytes are examined.
// req is untouched unless kNone is returned.
ProtocolError decode_request(const std::vector<uint8_t>& data, BillingRequest& req);

} // namespace billwire
