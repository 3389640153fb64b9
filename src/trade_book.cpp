#include "tradebook/trade_book.hpp"

#include <ostream>

#include "tradebook/decimal.hpp"


namespace tradebook {

std::string to_csv_line(const TradeBook& book) {
    std::string line;
    line.reserve(32);
    line += to_string(book.action);
    line += ',';
    line += book.stock_code;
    line += ',';
    line += format_price(book.price);
    line += ',';
    line += std::to_string(book.volume);
    return line;
}

// ---------------------------------
// Debug / logging helpers
// ---------------------------------

std::ostream& operator<<(std::ostream& os, const BookKey& k) {
    os << "{" << to_string(k.action)
       << " " << k.stock_code
       << " @ " << format_price(k.price)
       << "}";
    return os;
}

std::ostream& operator<<(std::ostream& os, const TradeBook& b) {
    os << "[TradeBook] {"
       << "action=" << to_string(b.action)
       << ", code=" << b.stock_code
       << ", price=" << format_price(b.price)
       << ", volume=" << b.volume
       << "}";
    return os;
}

} // namespace tradebook
