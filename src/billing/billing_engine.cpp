#include "billing/billing_engine.hpp"
#include "protocol/response_codec.hpp"
#include "core/config.hpp"

#include <utility>

namespace billwire {

uint64_t aggregate_total(const std::vector<PricedLineItem>& items) {
    uint64_t total = 0;
    for (const auto& item : items) {
        total += compute_line_cost(item.unit_cost, item.quantity);
    }
    return total;
}

PricedLineItem unavailable_item(uint16_t quantity) {
    PricedLineItem item;
    item.description = truncate_description(ARTICLE_NOT_AVAILABLE);
    item.unit_cost = 0;
    item.quantity = quantity;
    return item;
}

std::vector<PricedLineItem> price_items(const std::vector<LineItem>& requested,
                                        const Catalog& catalog) {
    std::vector<PricedLineItem> priced;
    priced.reserve(requested.size());

    for (const auto& req : requested) {
        auto entry = catalog.lookup(req.code);
        if (!entry) {
            priced.push_back(unavailable_item(req.quantity));
            continue;
        }
        PricedLineItem item;
        item.description = truncate_description(entry->description);
        item.unit_cost = entry->unit_cost;
        item.quantity = req.quantity;
        priced.push_back(std::move(item));
    }
    return priced;
}

BillingResponse build_response(const BillingRequest& req, const Catalog& catalog) {
    BillingResponse resp;
    resp.request_number = req.request_number;
    resp.items = price_items(req.items, catalog);
    resp.total_cost = static_cast<uint32_t>(aggregate_total(resp.items));
    size_t length = response_length(resp.items);
    if (length <= MAX_MESSAGE_LENGTH) {
        resp.total_message_length = static_cast<uint16_t>(length);
    }
    return resp;
}

bool verify_total(uint32_t declared_total, const std::vector<PricedLineItem>& items) {
    return aggregate_total(items) == static_cast<uint64_t>(declared_total);
}

ProtocolError check_total(const BillingResponse& bill) {
    if (!verify_total(bill.total_cost, bill.items)) return ProtocolError::kTotalMismatch;
    return ProtocolError::kNone;
}

} // namespace billwire
