#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

#include "tradebook/types.hpp"


namespace tradebook {

// -----------------------------
// Book key: (action, stock code, price)
// -----------------------------
struct BookKey {
    Action    action{Action::Buy};
    StockCode stock_code;
    Price     price{0};

    bool operator==(const BookKey&) const = default;
};

struct BookKeyHash {
    std::size_t operator()(const BookKey& k) const noexcept {
        std::size_t h = std::hash<std::string>{}(k.stock_code);
        h ^= std::hash<Price>{}(k.price) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        h ^= static_cast<std::size_t>(k.action) + 0x9e3779b97f4a7c15ull + (h << 6) + (h >> 2);
        return h;
    }
};

// -----------------------------
// Trade book (unit of persisted state)
// -----------------------------
struct TradeBook {
    Action    action{Action::Buy};
    StockCode stock_code;
    Price     price{0};
    Volume    volume{0};

    [[nodiscard]] BookKey key() const {
        return BookKey{action, stock_code, price};
    }

    bool operator==(const TradeBook&) const = default;
};

// "buy,AAPL,1000.00,150"
[[nodiscard]] std::string to_csv_line(const TradeBook& book);

std::ostream& operator<<(std::ostream&, const BookKey&);
std::ostream& operator<<(std::ostream&, const TradeBook&);

} // namespace tradebook
