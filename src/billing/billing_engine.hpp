#pragma once

#include <cstdint>
#include <vector>

#include "billing/catalog.hpp"
#include "protocol/messages.hpp"

namespace billwire {

// unit_cost * quantity, computed in 64 bits.
inline uint64_t compute_line_cost(uint16_t unit_cost, uint16_t quantity) {
    return static_cast<uint64_t>(unit_cost) * static_cast<uint64_t>(quantity);
}

// Sum of compute_line_cost over items. 0 for an empty list.
uint64_t aggregate_total(const std::vector<PricedLineItem>& items);

// Placeholder priced row for a code the catalog does not know:
// "Article Not Available", unit cost 0.
PricedLineItem unavailable_item(uint16_t quantity);

// Price each requested item against the catalog, one output row per input row,
// in request order. Duplicate codes are priced independently.
std::vector<PricedLineItem> price_items(const std::vector<LineItem>& requested,
                                        const Catalog& catalog);

// Priced bill for a request. total_cost is aggregate_total truncated to 32 bits.
// total_message_length stays 0 when the bill is too large for a u16 TML;
// encode_response then reports kMessageTooLarge.
BillingResponse build_response(const BillingRequest& req, const Catalog& catalog);

// Compare a declared total against the recomputed sum in 64 bits.
bool verify_total(uint32_t declared_total, const std::vector<PricedLineItem>& items);

// verify_total on a decoded bill: kNone or kTotalMismatch.
ProtocolError check_total(const BillingResponse& bill);

} // namespace billwire
