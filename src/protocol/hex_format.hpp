#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace billwire {

// "0x00 0x01 0xFF": one token per byte, single-space separated.
std::string format_hex(const std::vector<uint8_t>& bytes);

} // namespace billwire
