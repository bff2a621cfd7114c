#pragma once

#include <cstdint>
#include <string>

#include "protocol/messages.hpp"

namespace billwire {

// Tab-separated bill table: one row per item (number, description, unit cost,
// quantity, cost per item), a rule, then the total.
std::string format_bill(const BillingResponse& bill);

// Message shown when the declared total disagrees with the recomputed one.
std::string format_total_mismatch(uint32_t declared_total, uint64_t computed_total);

} // namespace billwire
