#pragma once

#include <cstddef>
#include <cstdint>

namespace billwire {

// List terminator for both request pairs and response items.
inline constexpr uint16_t SENTINEL = 0xFFFF;

// Largest quantity, item code, or unit cost a producer may put on the wire.
// The high bit stays clear so no field can collide with SENTINEL.
inline constexpr uint16_t MAX_FIELD_VALUE = 0x7FFF;

// Description length prefix is a single byte.
inline constexpr size_t MAX_DESCRIPTION_LENGTH = 255;

// TML is a u16 and counts the whole message.
inline constexpr size_t MAX_MESSAGE_LENGTH = 0xFFFF;

// ReqNum(2) + TML(2)
inline constexpr size_t HEADER_SIZE = 4;
inline constexpr size_t TRAILER_SIZE = 2;

// Request: header + trailer, zero pairs
inline constexpr size_t MIN_REQUEST_LENGTH = HEADER_SIZE + TRAILER_SIZE;
inline constexpr size_t REQUEST_PAIR_SIZE = 4;

// Response: header + TotalCost(4) + trailer, zero items
inline constexpr size_t TOTAL_COST_SIZE = 4;
inline constexpr size_t MIN_RESPONSE_LENGTH = HEADER_SIZE + TOTAL_COST_SIZE + TRAILER_SIZE;

// Fixed part of a response item: Len(1) + UnitCost(2) + Qty(2)
inline constexpr size_t RESPONSE_ITEM_FIXED_SIZE = 5;

// ReqNum(2) + SENTINEL(2)
inline constexpr size_t ERROR_RESPONSE_SIZE = 4;

// Substituted for codes missing from the catalog.
inline constexpr const char* ARTICLE_NOT_AVAILABLE = "Article Not Available";

} // namespace billwire
