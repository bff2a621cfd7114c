#include "test_util.hpp"
#include "billing/billing_engine.hpp"
#include "protocol/response_codec.hpp"
#include "core/config.hpp"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace billwire;

static Catalog make_catalog() {
    std::unordered_map<uint16_t, CatalogEntry> entries;
    entries[3] = CatalogEntry{"Pencil #HB", 1};
    entries[7] = CatalogEntry{"Eraser", 25};
    entries[100] = CatalogEntry{std::string(400, 'n'), 2};
    entries[32767] = CatalogEntry{"Max", 32767};
    return Catalog(std::move(entries));
}

static void test_line_cost() {
    std::fprintf(stderr, "-- test_line_cost\n");

    CHECK_EQ(compute_line_cost(0, 100), 0u);
    CHECK_EQ(compute_line_cost(1, 2), 2u);
    // 32767 * 32767 needs 30 bits; 65535 * 65535 needs 32
    CHECK_EQ(compute_line_cost(32767, 32767), 1073676289ull);
    CHECK_EQ(compute_line_cost(65535, 65535), 4294836225ull);
}

static void test_aggregate_total() {
    std::fprintf(stderr, "-- test_aggregate_total\n");

    CHECK_EQ(aggregate_total({}), 0u);

    std::vector<PricedLineItem> items = {
        {"a", 10, 3}, {"b", 7, 10}, {"c", 0, 5},
    };
    CHECK_EQ(aggregate_total(items), 100u);

    // Sum past 32 bits stays exact
    std::vector<PricedLineItem> big(8, PricedLineItem{"x", 32767, 32767});
    CHECK_EQ(aggregate_total(big), 8ull * 1073676289ull);
}

static void test_lookup() {
    std::fprintf(stderr, "-- test_lookup\n");

    Catalog catalog = make_catalog();
    CHECK_EQ(catalog.size(), 4u);
    CHECK(!catalog.empty());

    auto pencil = catalog.lookup(3);
    CHECK(pencil.has_value());
    if (pencil) {
        CHECK_STR_EQ(pencil->description, "Pencil #HB");
        CHECK_EQ(pencil->unit_cost, 1u);
    }
    CHECK(!catalog.lookup(999).has_value());
    CHECK(!Catalog().lookup(3).has_value());
    CHECK(Catalog().empty());
}

static void test_pencil_bill() {
    std::fprintf(stderr, "-- test_pencil_bill\n");

    BillingRequest req;
    req.request_number = 1;
    req.items = {{2, 3}};

    BillingResponse resp = build_response(req, make_catalog());
    CHECK_EQ(resp.request_number, 1u);
    CHECK_EQ(resp.total_cost, 2u);
    CHECK_EQ(resp.total_message_length, 25u);
    CHECK_EQ(resp.items.size(), 1u);
    if (resp.items.size() == 1) {
        CHECK_STR_EQ(resp.items[0].description, "Pencil #HB");
        CHECK_EQ(resp.items[0].unit_cost, 1u);
        CHECK_EQ(resp.items[0].quantity, 2u);
    }

    std::vector<uint8_t> out;
    CHECK_EQ(encode_response(resp, out), ProtocolError::kNone);
    CHECK_EQ(out.size(), 25u);
}

static void test_unknown_code() {
    std::fprintf(stderr, "-- test_unknown_code\n");

    BillingRequest req;
    req.request_number = 2;
    req.items = {{5, 999}};

    BillingResponse resp = build_response(req, make_catalog());
    CHECK_EQ(resp.items.size(), 1u);
    if (resp.items.size() == 1) {
        CHECK_STR_EQ(resp.items[0].description, ARTICLE_NOT_AVAILABLE);
        CHECK_EQ(resp.items[0].unit_cost, 0u);
        CHECK_EQ(resp.items[0].quantity, 5u);
    }
    CHECK_EQ(resp.total_cost, 0u);

    PricedLineItem placeholder = unavailable_item(9);
    CHECK_STR_EQ(placeholder.description, "Article Not Available");
    CHECK_EQ(placeholder.quantity, 9u);
}

static void test_order_and_duplicates() {
    std::fprintf(stderr, "-- test_order_and_duplicates\n");

    std::vector<LineItem> requested = {{1, 7}, {2, 3}, {4, 7}, {1, 555}, {0, 3}};
    auto priced = price_items(requested, make_catalog());

    CHECK_EQ(priced.size(), requested.size());
    if (priced.size() == 5) {
        CHECK_STR_EQ(priced[0].description, "Eraser");
        CHECK_EQ(priced[0].quantity, 1u);
        CHECK_STR_EQ(priced[1].description, "Pencil #HB");
        CHECK_STR_EQ(priced[2].description, "Eraser");
        CHECK_EQ(priced[2].quantity, 4u);
        CHECK_STR_EQ(priced[3].description, ARTICLE_NOT_AVAILABLE);
        CHECK_EQ(priced[4].quantity, 0u);
    }
    // 25 + 2 + 100 + 0 + 0
    CHECK_EQ(aggregate_total(priced), 127u);
}

static void test_long_description_truncated() {
    std::fprintf(stderr, "-- test_long_description_truncated\n");

    auto priced = price_items({{1, 100}}, make_catalog());
    CHECK_EQ(priced.size(), 1u);
    if (priced.size() == 1) {
        CHECK_EQ(priced[0].description.size(), MAX_DESCRIPTION_LENGTH);
    }
}

static void test_empty_request() {
    std::fprintf(stderr, "-- test_empty_request\n");

    BillingRequest req;
    req.request_number = 11;
    BillingResponse resp = build_response(req, make_catalog());
    CHECK(resp.items.empty());
    CHECK_EQ(resp.total_cost, 0u);
    CHECK_EQ(resp.total_message_length, MIN_RESPONSE_LENGTH);
}

static void test_oversized_bill() {
    std::fprintf(stderr, "-- test_oversized_bill\n");

    // 253 items of 5 + 255 bytes push the bill past a u16 TML
    BillingRequest req;
    req.request_number = 4;
    req.items.assign(253, LineItem{1, 100});

    BillingResponse resp = build_response(req, make_catalog());
    CHECK_EQ(resp.items.size(), 253u);
    CHECK_EQ(resp.total_message_length, 0u);
    CHECK_EQ(resp.total_cost, 506u);

    std::vector<uint8_t> out;
    CHECK_EQ(encode_response(resp, out), ProtocolError::kMessageTooLarge);

    // One item fewer fits and carries its real length
    req.items.pop_back();
    resp = build_response(req, make_catalog());
    CHECK_EQ(resp.total_message_length, 10u + 252u * 260u);
}

static void test_verify_total() {
    std::fprintf(stderr, "-- test_verify_total\n");

    std::vector<PricedLineItem> items = {{"a", 10, 3}, {"b", 6, 10}};  // 90
    CHECK(verify_total(90, items));
    CHECK(!verify_total(100, items));
    CHECK(verify_total(0, {}));

    BillingResponse bill;
    bill.total_cost = 100;
    bill.items = items;
    CHECK_EQ(check_total(bill), ProtocolError::kTotalMismatch);
    bill.total_cost = 90;
    CHECK_EQ(check_total(bill), ProtocolError::kNone);

    // A declared total that only matches modulo 2^32 is a mismatch
    std::vector<PricedLineItem> big(8, PricedLineItem{"x", 32767, 32767});
    uint32_t wrapped = static_cast<uint32_t>(aggregate_total(big));
    CHECK(!verify_total(wrapped, big));
}

int main() {
    test_line_cost();
    test_aggregate_total();
    test_lookup();
    test_pencil_bill();
    test_unknown_code();
    test_order_and_duplicates();
    test_long_description_truncated();
    test_empty_request();
    test_oversized_bill();
    test_verify_total();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
