#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "protocol/messages.hpp"

namespace billwire {

// Response wire layout (big-endian):
//   ReqNum(2) TML(2) TotalCost(4) [Len(1) Desc(Len) UnitCost(2) Qty(2)]* 0xFFFF(2)
// Error response:
//   ReqNum(2) 0xFFFF(2)

// Cut a description to the 255 bytes a u8 length prefix can express.
// Shorter descriptions are returned unchanged.
std::string truncate_description(const std::string& description);

// Encoded size of a bill carrying items, after description truncation.
size_t response_length(const std::vector<PricedLineItem>& items);

// Encode a bill into out (replacing its contents). Descriptions are truncated
// to 255 bytes; TML is computed from the final size.
// Fails with kFieldOutOfRange if a unit cost or quantity exceeds 0x7FFF, or if
// an item would start with the bytes FF FF (a 255-byte description whose first
// byte is 0xFF) and be read back as the trailer.
// Fails with kMessageTooLarge if the bill does not fit a u16 TML.
// out is left empty on failure.
ProtocolError encode_response(uint16_t request_number,
                              const std::vector<PricedLineItem>& items,
                              uint32_t total_cost,
                              std::vector<uint8_t>& out);

ProtocolError encode_response(const BillingResponse& resp, std::vector<uint8_t>& out);

// Always 4 bytes.
std::vector<uint8_t> encode_error_response(uint16_t request_number);

// True if the 4-byte header at data is an error response (bytes 2-3 are FF FF).
bool is_error_response(const uint8_t* data, size_t size);

// Decode a complete server reply. An error response is recognised from its
// first 4 bytes alone; a bill examines only the first TML bytes.
// msg is untouched unless kNone is returned.
ProtocolError decode_response(const std::vector<uint8_t>& data, ResponseMessage& msg);

} // namespace billwire
