#pragma once

#include <istream>
#include <string>

#include "billing/catalog.hpp"
#include "util/logger.hpp"

namespace billwire {

// Load an item catalog from a CSV file with lines "code,description,cost".
//   - blank lines and header lines (first field starting with "ci" or "code",
//     any case) are skipped; a UTF-8 BOM and trailing '\r' are removed
//   - code is the text before the first comma, cost the text after the last
//     comma, description everything in between (so it may contain commas)
//   - surrounding double quotes on the description and '$' in the cost are removed
//   - malformed lines are skipped with a warning; codes outside 0..32767 are
//     skipped; costs outside 0..32767 become 0; descriptions are cut to 255 bytes
//   - a later line replaces an earlier one with the same code
// If the file cannot be opened, a warning is logged and an empty catalog is
// returned, so every code prices as "Article Not Available".
Catalog read_catalog(const std::string& path, const Logger& logger);

// Same rules, reading from an already-open stream. source names it in warnings.
Catalog read_catalog(std::istream& in, const std::string& source, const Logger& logger);

} // namespace billwire
