#include "tradebook/storage/csv_book_store.hpp"

#include <fstream>
#include <string>
#include <system_error>

#include "tradebook/decimal.hpp"
#include "tradebook/stock_code_set.hpp"
#include "tradebook/text.hpp"
#include "lcr/log/logger.hpp"


namespace tradebook::storage {

std::optional<TradeBook> parse_csv_record(std::string_view line) {
    const auto fields = text::split(line, ',');
    if (fields.size() != 4) return std::nullopt;

    const auto action = parse_action(text::trim(fields[0]));
    if (!action) return std::nullopt;

    const auto code = text::trim(fields[1]);
    if (!is_stock_code_format(code)) return std::nullopt;

    const auto price = parse_decimal(text::trim(fields[2]));
    if (!price || price->clamped || price->fraction_digits != PRICE_DECIMALS || price->units < 0) return std::nullopt;

    bool clamped = false;
    const auto volume = parse_integer(text::trim(fields[3]), &clamped);
    if (!volume || clamped || *volume < 0) return std::nullopt;

    return TradeBook{*action, StockCode(code), price->hundredths(), *volume};
}

Status CsvBookStore::load(std::vector<TradeBook>& out) {
    error_line_ = 0;

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        // First run: nothing persisted yet
        TB_INFO("[STORE] No ledger file at " << path_.string() << ", starting empty");
        out.clear();
        return Status::Ok;
    }

    std::ifstream in(path_);
    if (!in.is_open()) {
        TB_ERROR("[STORE] Failed to open ledger file: " << path_.string());
        return Status::OpenFailed;
    }

    std::vector<TradeBook> loaded;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto record = text::trim(line);
        if (record.empty()) continue;
        auto book = parse_csv_record(record);
        if (!book) {
            TB_ERROR("[STORE] Malformed ledger record '" << record << "' at " << path_.string() << ":" << line_no);
            error_line_ = line_no;
            return Status::MalformedRecord;
        }
        loaded.push_back(std::move(*book));
    }
    if (in.bad()) {
        TB_ERROR("[STORE] Read error on ledger file: " << path_.string());
        return Status::ReadFailed;
    }

    TB_INFO("[STORE] Loaded " << loaded.size() << " trade books from " << path_.string());
    out = std::move(loaded);
    return Status::Ok;
}

Status CsvBookStore::save(const std::vector<TradeBook>& books) {
    std::error_code ec;
    const auto parent = path_.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            TB_ERROR("[STORE] Cannot create directory " << parent.string() << ": " << ec.message());
            return Status::WriteFailed;
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream os(tmp, std::ios::out | std::ios::trunc);
        if (!os.is_open()) {
            TB_ERROR("[STORE] Failed to open " << tmp.string() << " for writing");
            return Status::OpenFailed;
        }
        for (const auto& book : books) {
            os << to_csv_line(book) << '\n';
        }
        os.flush();
        if (!os) {
            TB_ERROR("[STORE] Write failed on " << tmp.string());
            os.close();
            std::error_code ignored;
            (void)std::filesystem::remove(tmp, ignored); // best-effort cleanup
            return Status::WriteFailed;
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        TB_ERROR("[STORE] Cannot replace " << path_.string() << ": " << ec.message());
        std::error_code ignored;
        (void)std::filesystem::remove(tmp, ignored); // best-effort cleanup
        return Status::RenameFailed;
    }

    TB_TRACE("[STORE] Saved " << books.size() << " trade books to " << path_.string());
    return Status::Ok;
}

} // namespace tradebook::storage
