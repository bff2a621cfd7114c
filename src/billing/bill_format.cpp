#include "billing/bill_format.hpp"
#include "billing/billing_engine.hpp"

#include <cstdio>

namespace billwire {

std::string format_bill(const BillingResponse& bill) {
    std::string result = "Item #\tDescription\t\tUnit Cost\tQuantity\tCost Per Item\n";

    char row[64];
    for (size_t i = 0; i < bill.items.size(); i++) {
        const auto& item = bill.items[i];
        uint64_t line = compute_line_cost(item.unit_cost, item.quantity);

        result += std::to_string(i + 1) + "\t" + item.description;
        std::snprintf(row, sizeof(row), "\t\t$%u\t\t%u\t\t$%llu\n",
                      static_cast<unsigned>(item.unit_cost),
                      static_cast<unsigned>(item.quantity),
                      static_cast<unsigned long long>(line));
        result += row;
    }

    result += "-----------------------------------------------\n";
    result += "Total\t" + std::to_string(bill.total_cost) + "\n";
    return result;
}

std::string format_total_mismatch(uint32_t declared_total, uint64_t computed_total) {
    return "Error: the total cost in the response does not match the total "
           "computed by the client.\n"
           "Server TC = " + std::to_string(declared_total)
         + ", Client computed = " + std::to_string(computed_total) + "\n";
}

} // namespace billwire
