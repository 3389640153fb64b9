#pragma once

#include <cstdint>
#include <iosfwd>
#include <string>

#include "tradebook/decimal.hpp"
#include "tradebook/trade_book.hpp"
#include "tradebook/types.hpp"


namespace tradebook {

// -----------------------------
// Parsed but unvalidated order
// -----------------------------
// Action is lowercased and stock code uppercased by the parser.
// Numbers keep their textual shape so the validator can judge them.
struct OrderRequest {
    std::string  action;
    std::string  stock_code;
    Decimal      price;
    std::int64_t volume{0};
};

// -----------------------------
// Validated order
// -----------------------------
struct Order {
    Action    action{Action::Buy};
    StockCode stock_code;
    Price     price{0};
    Volume    volume{0};

    [[nodiscard]] BookKey key() const {
        return BookKey{action, stock_code, price};
    }
};

std::ostream& operator<<(std::ostream&, const Order&);

} // namespace tradebook
