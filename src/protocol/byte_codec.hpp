#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace billwire {

// Big-endian writers appending to the end of buf.

void put_u8(std::vector<uint8_t>& buf, uint8_t v);
void put_u16(std::vector<uint8_t>& buf, uint16_t v);
void put_u32(std::vector<uint8_t>& buf, uint32_t v);

// u8 length prefix followed by the bytes. Caller guarantees s.size() <= 255.
void put_str8(std::vector<uint8_t>& buf, const std::string& s);

// Decode a big-endian u16 from two raw bytes.
inline uint16_t load_u16(const uint8_t* p) {
    return static_cast<uint16_t>((static_cast<uint16_t>(p[0]) << 8) | p[1]);
}

// Bounds-checked big-endian cursor over a byte range.
// Every get_* returns false without moving the cursor if the field does not fit.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size), pos_(0) {}

    bool has(size_t n) const { return n <= size_ - pos_; }
    size_t remaining() const { return size_ - pos_; }
    size_t position() const { return pos_; }

    bool get_u8(uint8_t& v);
    bool get_u16(uint16_t& v);
    bool get_u32(uint32_t& v);
    bool get_str8(std::string& s);

    // Look at the next u16 without consuming it.
    bool peek_u16(uint16_t& v) const;

    bool skip(size_t n);

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_;
};

} // namespace billwire
