#include "protocol/hex_format.hpp"

#include <cstdio>

namespace billwire {

std::string format_hex(const std::vector<uint8_t>& bytes) {
    std::string result;
    result.reserve(bytes.size() * 5);
    char tok[8];
    for (size_t i = 0; i < bytes.size(); i++) {
        if (i > 0) result += ' ';
        std::snprintf(tok, sizeof(tok), "0x%02X", bytes[i]);
        result += tok;
    }
    return result;
}

} // namespace billwire
