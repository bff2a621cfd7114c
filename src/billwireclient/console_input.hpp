#pragma once

#include <istream>
#include <ostream>
#include <vector>

#include "protocol/messages.hpp"

namespace billwire {

// Prompt on out for quantity/code pairs, reading one value per line from in.
// A quantity of -1 or end of input ends collection. Values outside 0..32767
// or non-numeric input are reported on out and the pair is asked for again.
std::vector<LineItem> collect_line_items(std::istream& in, std::ostream& out);

} // namespace billwire
