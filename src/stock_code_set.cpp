#include "tradebook/stock_code_set.hpp"

#include <fstream>
#include <system_error>

#include "tradebook/text.hpp"
#include "lcr/log/logger.hpp"


namespace tradebook {

bool is_stock_code_format(std::string_view code) noexcept {
    if (code.size() != STOCK_CODE_LENGTH) return false;
    for (char c : code) {
        if (c < 'A' || c > 'Z') return false;
    }
    return true;
}

StockCodeSet::StockCodeSet(std::initializer_list<std::string_view> codes) {
    for (auto code : codes) {
        if (is_stock_code_format(code)) {
            codes_.emplace(code);
        }
    }
}

bool StockCodeSet::contains(std::string_view code) const {
    return codes_.find(code) != codes_.end();
}

storage::Status StockCodeSet::load(const std::filesystem::path& path, StockCodeSet& out, std::size_t& error_line) {
    error_line = 0;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        TB_ERROR("[STOCK] Stock code file not found: " << path.string());
        return storage::Status::NotFound;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        TB_ERROR("[STOCK] Failed to open stock code file: " << path.string());
        return storage::Status::OpenFailed;
    }

    StockCodeSet loaded;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto code = text::trim(line);
        if (code.empty()) continue;
        if (!is_stock_code_format(code)) {
            TB_ERROR("[STOCK] Malformed stock code '" << code << "' at " << path.string() << ":" << line_no);
            error_line = line_no;
            return storage::Status::MalformedRecord;
        }
        loaded.codes_.emplace(code);
    }
    if (in.bad()) {
        TB_ERROR("[STOCK] Read error on stock code file: " << path.string());
        return storage::Status::ReadFailed;
    }

    TB_INFO("[STOCK] Loaded " << loaded.size() << " stock codes from " << path.string());
    out = std::move(loaded);
    return storage::Status::Ok;
}

} // namespace tradebook
