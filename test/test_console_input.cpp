#include "test_util.hpp"
#include "billwireclient/console_input.hpp"

#include <sstream>
#include <string>

using namespace billwire;

static void test_pairs_until_minus_one() {
    std::fprintf(stderr, "-- test_pairs_until_minus_one\n");

    std::istringstream in("2\n3\n10\n7\n-1\n");
    std::ostringstream out;
    auto items = collect_line_items(in, out);

    CHECK_EQ(items.size(), 2u);
    if (items.size() == 2) {
        CHECK_EQ(items[0].quantity, 2u);
        CHECK_EQ(items[0].code, 3u);
        CHECK_EQ(items[1].quantity, 10u);
        CHECK_EQ(items[1].code, 7u);
    }
    CHECK(out.str().find("Enter quantity Qi (or -1 to finish): ") == 0);
    CHECK(out.str().find("Enter code Ci: ") != std::string::npos);
}

static void test_immediate_finish() {
    std::fprintf(stderr, "-- test_immediate_finish\n");

    std::istringstream in("-1\n");
    std::ostringstream out;
    CHECK(collect_line_items(in, out).empty());

    std::istringstream empty("");
    CHECK(collect_line_items(empty, out).empty());
}

static void test_end_of_input() {
    std::fprintf(stderr, "-- test_end_of_input\n");

    // A quantity with no code after it is dropped
    std::istringstream in("1\n2\n5\n");
    std::ostringstream out;
    auto items = collect_line_items(in, out);
    CHECK_EQ(items.size(), 1u);
}

static void test_rejects_bad_values() {
    std::fprintf(stderr, "-- test_rejects_bad_values\n");

    std::istringstream in("abc\n40000\n4\n-1\n4\n 9 \r\n-1\n");
    std::ostringstream out;
    auto items = collect_line_items(in, out);

    // abc: not a number; 40000: out of range; 4 then code -1: out of range;
    // 4 then 9 accepted
    CHECK_EQ(items.size(), 1u);
    if (items.size() == 1) {
        CHECK_EQ(items[0].quantity, 4u);
        CHECK_EQ(items[0].code, 9u);
    }
    CHECK(out.str().find("Qi must be a number") != std::string::npos);
    CHECK(out.str().find("Qi must be in range 0..32767") != std::string::npos);
    CHECK(out.str().find("Ci must be in range 0..32767") != std::string::npos);
}

static void test_boundaries() {
    std::fprintf(stderr, "-- test_boundaries\n");

    std::istringstream in("0\n0\n32767\n32767\n-1\n");
    std::ostringstream out;
    auto items = collect_line_items(in, out);
    CHECK_EQ(items.size(), 2u);
    if (items.size() == 2) {
        CHECK_EQ(items[0].quantity, 0u);
        CHECK_EQ(items[1].code, 32767u);
    }
}

int main() {
    test_pairs_until_minus_one();
    test_immediate_finish();
    test_end_of_input();
    test_rejects_bad_values();
    test_boundaries();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
