#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

#include "tradebook/order_parser.hpp"
#include "tradebook/stock_code_set.hpp"
#include "tradebook/validator.hpp"

#include "common/test_check.hpp"

using namespace tradebook;

namespace {

const StockCodeSet codes{"AAPL", "MSFT", "GOOG"};

OrderRequest request(std::string action, std::string code, std::string_view price, std::int64_t volume) {
    OrderRequest r;
    r.action     = std::move(action);
    r.stock_code = std::move(code);
    r.price      = parse_decimal(price).value();
    r.volume     = volume;
    return r;
}

Error check(const OrderRequest& r) {
    Validator v{codes};
    Order out;
    return v.validate(r, out);
}

} // namespace

// ============================================================================
// ACTION
// ============================================================================

void test_action() {
    std::cout << "[TEST] Validator action rule..." << std::endl;

    TEST_CHECK(check(request("buy", "AAPL", "1.00", 1)) == Error::None);
    TEST_CHECK(check(request("sell", "AAPL", "1.00", 1)) == Error::None);
    TEST_CHECK(check(request("hold", "AAPL", "1.00", 1)) == Error::InvalidAction);
    TEST_CHECK(check(request("", "AAPL", "1.00", 1)) == Error::InvalidAction);
    // Canonicalization happens in the parser, not here
    TEST_CHECK(check(request("BUY", "AAPL", "1.00", 1)) == Error::InvalidAction);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// STOCK CODE
// ============================================================================

void test_stock_code() {
    std::cout << "[TEST] Validator stock code rules..." << std::endl;

    TEST_CHECK(check(request("buy", "MSFT", "1.00", 1)) == Error::None);
    TEST_CHECK(check(request("buy", "AAP", "1.00", 1)) == Error::InvalidStockCodeFormat);
    TEST_CHECK(check(request("buy", "AAPPL", "1.00", 1)) == Error::InvalidStockCodeFormat);
    TEST_CHECK(check(request("buy", "aapl", "1.00", 1)) == Error::InvalidStockCodeFormat);
    TEST_CHECK(check(request("buy", "AAP1", "1.00", 1)) == Error::InvalidStockCodeFormat);
    TEST_CHECK(check(request("buy", "", "1.00", 1)) == Error::InvalidStockCodeFormat);
    TEST_CHECK(check(request("buy", "AMZN", "1.00", 1)) == Error::UnknownStockCode);
    TEST_CHECK(check(request("buy", "WXYZ", "5.00", 10)) == Error::UnknownStockCode);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// PRICE
// ============================================================================

void test_price() {
    std::cout << "[TEST] Validator price rules..." << std::endl;

    TEST_CHECK(check(request("buy", "AAPL", "0.50", 1)) == Error::None);      // boundary
    TEST_CHECK(check(request("buy", "AAPL", "1000.25", 1)) == Error::None);
    TEST_CHECK(check(request("buy", "AAPL", "0.49", 1)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "-1.00", 1)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "999.999", 1)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "100.1", 1)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "100", 1)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "1.500", 1)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "99999999999999999999.00", 1)) == Error::InvalidPrice);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// VOLUME
// ============================================================================

void test_volume() {
    std::cout << "[TEST] Validator volume rules..." << std::endl;

    TEST_CHECK(check(request("buy", "AAPL", "1.00", 1)) == Error::None);
    TEST_CHECK(check(request("buy", "AAPL", "1.00", 1'000'000)) == Error::None);
    TEST_CHECK(check(request("buy", "AAPL", "1.00", 0)) == Error::InvalidVolume);
    TEST_CHECK(check(request("buy", "AAPL", "1.00", -1)) == Error::InvalidVolume);
    TEST_CHECK(check(request("buy", "AAPL", "1.00", 1'000'001)) == Error::InvalidVolume);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// ORDERING / OUTPUT
// ============================================================================

void test_fail_fast_order() {
    std::cout << "[TEST] Validator reports the first violated rule..." << std::endl;

    // Everything wrong: action wins
    TEST_CHECK(check(request("hold", "aa", "0.1", 0)) == Error::InvalidAction);
    // Code shape before membership before price before volume
    TEST_CHECK(check(request("buy", "aa", "0.1", 0)) == Error::InvalidStockCodeFormat);
    TEST_CHECK(check(request("buy", "ZZZZ", "0.1", 0)) == Error::UnknownStockCode);
    TEST_CHECK(check(request("buy", "AAPL", "0.1", 0)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "0.10", 0)) == Error::InvalidPrice);
    TEST_CHECK(check(request("buy", "AAPL", "0.50", 0)) == Error::InvalidVolume);

    std::cout << "[TEST] OK\n";
}

void test_typed_output() {
    std::cout << "[TEST] Validator fills the typed order only on success..." << std::endl;

    Validator v{codes};
    Order out;
    TEST_CHECK(v.validate(request("sell", "GOOG", "1234.56", 77), out) == Error::None);
    TEST_CHECK(out.action == Action::Sell);
    TEST_CHECK_EQ(out.stock_code, std::string("GOOG"));
    TEST_CHECK_EQ(out.price, 123456);
    TEST_CHECK_EQ(out.volume, 77);

    Order untouched;
    TEST_CHECK(v.validate(request("buy", "GOOG", "1.0", 1), untouched) == Error::InvalidPrice);
    TEST_CHECK(untouched.stock_code.empty());
    TEST_CHECK_EQ(untouched.volume, 0);

    std::cout << "[TEST] OK\n";
}

// ============================================================================
// PARSER
// ============================================================================

void test_parse_order() {
    std::cout << "[TEST] parse_order canonicalization and shape..." << std::endl;

    OrderRequest r;
    TEST_CHECK(parse_order("BUY aapl 1000.00 100", r) == ParseStatus::Ok);
    TEST_CHECK_EQ(r.action, std::string("buy"));
    TEST_CHECK_EQ(r.stock_code, std::string("AAPL"));
    TEST_CHECK_EQ(r.price.units, 100000);
    TEST_CHECK_EQ(r.volume, 100);

    TEST_CHECK(parse_order("  sell\tMSFT   50.00  20  ", r) == ParseStatus::Ok);
    TEST_CHECK_EQ(r.action, std::string("sell"));

    TEST_CHECK(parse_order("buy AAPL 100.00", r) == ParseStatus::WrongFieldCount);
    TEST_CHECK(parse_order("buy AAPL 100.00 10 extra", r) == ParseStatus::WrongFieldCount);
    TEST_CHECK(parse_order("", r) == ParseStatus::WrongFieldCount);
    TEST_CHECK(parse_order("buy AAPL abc 10", r) == ParseStatus::BadNumber);
    TEST_CHECK(parse_order("buy AAPL 100.00 ten", r) == ParseStatus::BadNumber);
    TEST_CHECK(parse_order("buy AAPL 100.00 1.5", r) == ParseStatus::BadNumber);

    TEST_CHECK(parse_order("buy AAPL 1.00 99999999999999999999", r) == ParseStatus::Ok);
    TEST_CHECK_EQ(r.volume, std::numeric_limits<std::int64_t>::max());

    std::cout << "[TEST] OK\n";
}

int main() {
    test_action();
    test_stock_code();
    test_price();
    test_volume();
    test_fail_fast_order();
    test_typed_output();
    test_parse_order();

    std::cout << "\n[ALL VALIDATOR TESTS PASSED]\n";
    return 0;
}
