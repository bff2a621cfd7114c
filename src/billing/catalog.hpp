#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace billwire {

struct CatalogEntry {
    std::string description;  // at most 255 bytes once loaded
    uint16_t unit_cost = 0;
};

// Read-only code -> entry table. Built once, then shared by reference with
// every response-building call for the lifetime of a server run.
class Catalog {
public:
    Catalog() = default;
    explicit Catalog(std::unordered_map<uint16_t, CatalogEntry> entries)
        : entries_(std::move(entries)) {}

    // Absent codes are a normal outcome, not an error.
    std::optional<CatalogEntry> lookup(uint16_t code) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::unordered_map<uint16_t, CatalogEntry> entries_;
};

} // namespace billwire
