#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "tradebook/storage/csv_book_store.hpp"

#include "common/temp_dir.hpp"
#include "common/test_check.hpp"

using namespace tradebook;
using storage::CsvBookStore;
using storage::Status;

/*
================================================================================
CSV Ledger Store: Unit Tests
================================================================================

File format: action,stockCode,price,volume with 2-decimal prices.

Covered:
  • record parsing accepts the written shape and rejects everything else
  • a missing file is an empty ledger (first run)
  • a malformed line fails the whole load and reports its line
  • save writes in ledger order, replaces previous content, creates folders
================================================================================
*/

void test_parse_record() {
    std::cout << "[TEST] parse_csv_record..." << std::endl;

    auto b = storage::parse_csv_record("buy,AAPL,1000.00,150");
    TEST_CHECK(b.has_value());
    TEST_CHECK(b->action == Action::Buy);
    TEST_CHECK_EQ(b->stock_code, std::string("AAPL"));
    TEST_CHECK_EQ(b->price, 100000);
    TEST_CHECK_EQ(b->volume, 150);

    b = storage::parse_csv_record(" sell , MSFT , 0.50 , 2000000 ");
    TEST_CHECK(b.has_value());
    TEST_CHECK(b->action == Action::Sell);
    TEST_CHECK_EQ(b->volume, 2000000);   // cumulative volume is not capped

    TEST_CHECK(storage::parse_csv_record("buy,AAPL,1000.00,0").has_value());

    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,1000.00"));
    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,1000.00,1,extra"));
    TEST_CHECK(!storage::parse_csv_record("hold,AAPL,1000.00,1"));
    TEST_CHECK(!storage::parse_csv_record("BUY,AAPL,1000.00,1"));
    TEST_CHECK(!storage::parse_csv_record("buy,aapl,1000.00,1"));
    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,1000.0,1"));
    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,-1.00,1"));
    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,1000.00,-1"));
    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,1000.00,x"));
    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,99999999999999999999.00,1"));
    TEST_CHECK(!storage::parse_csv_record("buy,AAPL,1000.00,99999999999999999999"));

    std::cout << "[TEST] OK\n";
}

void test_missing_file_is_empty() {
    std::cout << "[TEST] CsvBookStore::load on missing file..." << std::endl;

    test::TempDir dir;
    CsvBookStore store{dir.file("orders.csv")};
    std::vector<TradeBook> books{{Action::Buy, "AAPL", 100, 1}};
    TEST_CHECK(store.load(books) == Status::Ok);
    TEST_CHECK(books.empty());

    std::cout << "[TEST] OK\n";
}

void test_load_file() {
    std::cout << "[TEST] CsvBookStore::load valid file..." << std::endl;

    test::TempDir dir;
    const auto path = dir.write("orders.csv", "buy,AAPL,100.00,10\r\n\nsell,MSFT,50.00,20\n");
    CsvBookStore store{path};
    std::vector<TradeBook> books;
    TEST_CHECK(store.load(books) == Status::Ok);
    TEST_CHECK_EQ(books.size(), 2u);
    TEST_CHECK_EQ(books[0], (TradeBook{Action::Buy, "AAPL", 10000, 10}));
    TEST_CHECK_EQ(books[1], (TradeBook{Action::Sell, "MSFT", 5000, 20}));

    std::cout << "[TEST] OK\n";
}

void test_load_malformed() {
    std::cout << "[TEST] CsvBookStore::load malformed line..." << std::endl;

    test::TempDir dir;
    const auto path = dir.write("orders.csv", "buy,AAPL,100.00,10\nbuy AAPL 100.00 10\n");
    CsvBookStore store{path};
    std::vector<TradeBook> books{{Action::Buy, "KEEP", 100, 1}};
    TEST_CHECK(store.load(books) == Status::MalformedRecord);
    TEST_CHECK_EQ(store.error_line(), 2u);
    TEST_CHECK_EQ(books.size(), 1u);   // untouched

    std::cout << "[TEST] OK\n";
}

void test_save_and_reload() {
    std::cout << "[TEST] CsvBookStore::save then load..." << std::endl;

    test::TempDir dir;
    const auto path = dir.path() / "nested" / "data" / "orders.csv";
    CsvBookStore store{path};

    const std::vector<TradeBook> first = {
        {Action::Buy,  "AAPL", 100000, 150},
        {Action::Sell, "AAPL", 100000, 10},
    };
    TEST_CHECK(store.save(first) == Status::Ok);
    TEST_CHECK(std::filesystem::exists(path));
    TEST_CHECK_EQ(test::read_file(path), std::string("buy,AAPL,1000.00,150\nsell,AAPL,1000.00,10\n"));

    // Full rewrite, no stale lines
    const std::vector<TradeBook> second = {{Action::Sell, "GOOG", 50, 3}};
    TEST_CHECK(store.save(second) == Status::Ok);
    TEST_CHECK_EQ(test::read_file(path), std::string("sell,GOOG,0.50,3\n"));

    auto tmp = path;
    tmp += ".tmp";
    TEST_CHECK(!std::filesystem::exists(tmp));

    CsvBookStore reopened{path};
    std::vector<TradeBook> loaded;
    TEST_CHECK(reopened.load(loaded) == Status::Ok);
    TEST_CHECK(loaded == second);

    std::cout << "[TEST] OK\n";
}

void test_save_into_unwritable_location() {
    std::cout << "[TEST] CsvBookStore::save fails when target is a directory..." << std::endl;

    test::TempDir dir;
    const auto path = dir.path() / "orders.csv";
    std::filesystem::create_directories(path);   // a directory squats on the file name

    CsvBookStore store{path};
    const std::vector<TradeBook> books = {{Action::Buy, "AAPL", 100, 1}};
    TEST_CHECK(store.save(books) != Status::Ok);
    TEST_CHECK(std::filesystem::is_directory(path));

    std::cout << "[TEST] OK\n";
}

int main() {
    test_parse_record();
    test_missing_file_is_empty();
    test_load_file();
    test_load_malformed();
    test_save_and_reload();
    test_save_into_unwritable_location();

    std::cout << "\n[ALL CSV STORE TESTS PASSED]\n";
    return 0;
}
