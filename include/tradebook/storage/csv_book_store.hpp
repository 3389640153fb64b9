#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include "tradebook/storage/book_store.hpp"
#include "tradebook/storage/status.hpp"
#include "tradebook/trade_book.hpp"


namespace tradebook::storage {

// Parses one "action,stockCode,price,volume" record. Fields may carry
// surrounding whitespace. Price must have exactly 2 fractional digits and
// volume must be non-negative.
[[nodiscard]] std::optional<TradeBook> parse_csv_record(std::string_view line);

// ============================================================================
//  class CsvBookStore
//  ----------------------------------------------------------------------------
//  Ledger persistence as a comma-separated text file, one book per line.
//
//  File Layout:
//  ------------
//      buy,AAPL,1000.00,150
//      sell,AAPL,1000.00,10
//
//  Writes go to "<file>.tmp" which is then renamed over "<file>", so a crash
//  mid-write leaves the previous state intact. Missing parent directories
//  are created on save.
// ============================================================================
class CsvBookStore {
public:
    explicit CsvBookStore(std::filesystem::path path)
        : path_(std::move(path))
    {}

    [[nodiscard]] Status load(std::vector<TradeBook>& out);
    [[nodiscard]] Status save(const std::vector<TradeBook>& books);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // 1-based line of the last MalformedRecord reported by load(), else 0
    [[nodiscard]] std::size_t error_line() const noexcept { return error_line_; }

private:
    std::filesystem::path path_;
    std::size_t error_line_{0};
};

static_assert(BookStore<CsvBookStore>);

} // namespace tradebook::storage
