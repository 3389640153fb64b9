#include "tradebook/order.hpp"

#include <ostream>


namespace tradebook {

std::ostream& operator<<(std::ostream& os, const Order& o) {
    os << "[Order] {"
       << "action=" << to_string(o.action)
       << ", code=" << o.stock_code
       << ", price=" << format_price(o.price)
       << ", volume=" << o.volume
       << "}";
    return os;
}

} // namespace tradebook
