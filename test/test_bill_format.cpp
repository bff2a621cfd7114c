#include "test_util.hpp"
#include "billing/bill_format.hpp"
#include "protocol/hex_format.hpp"

#include <string>
#include <vector>

using namespace billwire;

static void test_pencil_bill() {
    std::fprintf(stderr, "-- test_pencil_bill\n");

    BillingResponse bill;
    bill.request_number = 1;
    bill.total_cost = 2;
    bill.items = {{"Pencil #HB", 1, 2}};

    std::string expected =
        "Item #\tDescription\t\tUnit Cost\tQuantity\tCost Per Item\n"
        "1\tPencil #HB\t\t$1\t\t2\t\t$2\n"
        "-----------------------------------------------\n"
        "Total\t2\n";
    CHECK_STR_EQ(format_bill(bill), expected);
}

static void test_rows_numbered() {
    std::fprintf(stderr, "-- test_rows_numbered\n");

    BillingResponse bill;
    bill.total_cost = 1073676289u;
    bill.items = {{"Article Not Available", 0, 5}, {"Max", 32767, 32767}};

    std::string text = format_bill(bill);
    CHECK(text.find("1\tArticle Not Available\t\t$0\t\t5\t\t$0\n") != std::string::npos);
    CHECK(text.find("2\tMax\t\t$32767\t\t32767\t\t$1073676289\n") != std::string::npos);
    CHECK(text.find("Total\t1073676289\n") != std::string::npos);
}

static void test_empty_bill() {
    std::fprintf(stderr, "-- test_empty_bill\n");

    BillingResponse bill;
    std::string expected =
        "Item #\tDescription\t\tUnit Cost\tQuantity\tCost Per Item\n"
        "-----------------------------------------------\n"
        "Total\t0\n";
    CHECK_STR_EQ(format_bill(bill), expected);
}

static void test_total_mismatch() {
    std::fprintf(stderr, "-- test_total_mismatch\n");

    CHECK_STR_EQ(format_total_mismatch(100, 90),
                 "Error: the total cost in the response does not match the total "
                 "computed by the client.\nServer TC = 100, Client computed = 90\n");
}

static void test_hex() {
    std::fprintf(stderr, "-- test_hex\n");

    std::vector<uint8_t> bytes = {0x00, 0x01, 0x00, 0x0A, 0xFF};
    CHECK_STR_EQ(format_hex(bytes), "0x00 0x01 0x00 0x0A 0xFF");
    CHECK_STR_EQ(format_hex({}), "");
}

int main() {
    test_pencil_bill();
    test_rows_numbered();
    test_empty_bill();
    test_total_mismatch();
    test_hex();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
