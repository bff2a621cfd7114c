#include "test_util.hpp"
#include "protocol/byte_codec.hpp"

#include <string>
#include <vector>

using namespace billwire;

static void test_put_big_endian() {
    std::fprintf(stderr, "-- test_put_big_endian\n");

    std::vector<uint8_t> buf;
    put_u8(buf, 0xAB);
    put_u16(buf, 0x0102);
    put_u32(buf, 0x0A0B0C0D);

    std::vector<uint8_t> expected = {0xAB, 0x01, 0x02, 0x0A, 0x0B, 0x0C, 0x0D};
    CHECK(buf == expected);
}

static void test_put_str8() {
    std::fprintf(stderr, "-- test_put_str8\n");

    std::vector<uint8_t> buf;
    put_str8(buf, "abc");
    put_str8(buf, "");

    std::vector<uint8_t> expected = {0x03, 'a', 'b', 'c', 0x00};
    CHECK(buf == expected);
}

static void test_reader_fields() {
    std::fprintf(stderr, "-- test_reader_fields\n");

    std::vector<uint8_t> data = {0x7F, 0x12, 0x34, 0xDE, 0xAD, 0xBE, 0xEF,
                                 0x02, 'h', 'i'};
    ByteReader r(data.data(), data.size());

    uint8_t a = 0;
    uint16_t b = 0;
    uint32_t c = 0;
    std::string s;
    CHECK(r.get_u8(a));
    CHECK(r.get_u16(b));
    CHECK(r.get_u32(c));
    CHECK(r.get_str8(s));
    CHECK_EQ(a, 0x7Fu);
    CHECK_EQ(b, 0x1234u);
    CHECK_EQ(c, 0xDEADBEEFu);
    CHECK_STR_EQ(s, "hi");
    CHECK_EQ(r.remaining(), 0u);
}

static void test_reader_bounds() {
    std::fprintf(stderr, "-- test_reader_bounds\n");

    std::vector<uint8_t> data = {0x01, 0x02, 0x03};
    ByteReader r(data.data(), data.size());

    uint32_t v32 = 0;
    CHECK(!r.get_u32(v32));
    CHECK_EQ(r.position(), 0u);  // failed read leaves the cursor

    uint16_t v16 = 0;
    CHECK(r.get_u16(v16));
    CHECK_EQ(v16, 0x0102u);
    CHECK(!r.get_u16(v16));
    CHECK_EQ(r.position(), 2u);
    CHECK(!r.skip(2));
    CHECK(r.skip(1));
    CHECK(!r.has(1));

    uint8_t v8 = 0;
    CHECK(!r.get_u8(v8));
}

static void test_str8_overrun() {
    std::fprintf(stderr, "-- test_str8_overrun\n");

    // Length byte declares 10 but only 3 follow
    std::vector<uint8_t> data = {0x0A, 'a', 'b', 'c'};
    ByteReader r(data.data(), data.size());
    std::string s = "unchanged";
    CHECK(!r.get_str8(s));
    CHECK_STR_EQ(s, "unchanged");
    CHECK_EQ(r.position(), 0u);
}

static void test_peek() {
    std::fprintf(stderr, "-- test_peek\n");

    std::vector<uint8_t> data = {0xFF, 0xFF, 0x00};
    ByteReader r(data.data(), data.size());
    uint16_t v = 0;
    CHECK(r.peek_u16(v));
    CHECK_EQ(v, 0xFFFFu);
    CHECK_EQ(r.position(), 0u);

    CHECK(r.skip(2));
    CHECK(!r.peek_u16(v));  // one byte left
    CHECK_EQ(load_u16(data.data()), 0xFFFFu);
}

int main() {
    test_put_big_endian();
    test_put_str8();
    test_reader_fields();
    test_reader_bounds();
    test_str8_overrun();
    test_peek();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
