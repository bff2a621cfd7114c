#include "billing/catalog.hpp"

namespace billwire {

std::optional<CatalogEntry> Catalog::lookup(uint16_t code) const {
    auto it = entries_.find(code);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

} // namespace billwire
