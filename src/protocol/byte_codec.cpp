#include "protocol/byte_codec.hpp"

namespace billwire {

void put_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

void put_u16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(static_cast<uint8_t>(v >> 8));
    buf.push_back(static_cast<uint8_t>(v));
}

void put_u32(std::vector<uint8_t>& buf, uint32_t v) {
    buf.push_back(static_cast<uint8_t>(v >> 24));
    buf.push_back(static_cast<uint8_t>(v >> 16));
    buf.push_back(static_cast<uint8_t>(v >> 8));
    buf.push_back(static_cast<uint8_t>(v));
}

void put_str8(std::vector<uint8_t>& buf, const std::string& s) {
    put_u8(buf, static_cast<uint8_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

bool ByteReader::get_u8(uint8_t& v) {
    if (!has(1)) return false;
    v = data_[pos_++];
    return true;
}

bool ByteReader::get_u16(uint16_t& v) {
    if (!has(2)) return false;
    v = load_u16(data_ + pos_);
    pos_ += 2;
    return true;
}

bool ByteReader::get_u32(uint32_t& v) {
    if (!has(4)) return false;
    v = (static_cast<uint32_t>(data_[pos_]) << 24) |
        (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
        (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
        static_cast<uint32_t>(data_[pos_ + 3]);
    pos_ += 4;
    return true;
}

bool ByteReader::get_str8(std::string& s) {
    if (!has(1)) return false;
    size_t len = data_[pos_];
    if (!has(1 + len)) return false;
    s.assign(reinterpret_cast<const char*>(data_ + pos_ + 1), len);
    pos_ += 1 + len;
    return true;
}

bool ByteReader::peek_u16(uint16_t& v) const {
    if (!has(2)) return false;
    v = load_u16(data_ + pos_);
    return true;
}

bool ByteReader::skip(size_t n) {
    if (!has(n)) return false;
    pos_ += n;
    return true;
}

} // namespace billwire
