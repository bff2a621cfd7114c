#pragma once

#include <cstdint>
#include <vector>

#include "billing/catalog.hpp"
#include "protocol/messages.hpp"

namespace billwire {

// Request number carried in the first two bytes of message, or 0 if absent.
uint16_t peek_request_number(const std::vector<uint8_t>& message);

// Turn one complete request message into the bytes to send back.
// On kNone, reply holds the encoded bill. On any failure (decode error, or a
// bill that cannot be encoded), reply holds a 4-byte ErrorResponse for the
// request number and the failure kind is returned.
ProtocolError process_request(const std::vector<uint8_t>& message,
                              const Catalog& catalog,
                              std::vector<uint8_t>& reply);

} // namespace billwire
