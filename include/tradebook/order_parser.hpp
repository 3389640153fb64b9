#pragma once

#include <cstdint>
#include <string_view>

#include "tradebook/order.hpp"


namespace tradebook {

// ===============================================
// ORDER PARSE STATUS
// ===============================================
enum class ParseStatus : std::uint8_t {
    Ok,
    WrongFieldCount,   // Not exactly "action code price volume"
    BadNumber          // Price not a decimal or volume not an integer
};

[[nodiscard]]
inline constexpr std::string_view to_string(ParseStatus s) noexcept {
    switch (s) {
        case ParseStatus::Ok:              return "Ok";
        case ParseStatus::WrongFieldCount: return "WrongFieldCount";
        case ParseStatus::BadNumber:       return "BadNumber";
        default:                           return "unknown";
    }
}

// Splits a command line such as "buy AAPL 1000.00 100" on whitespace.
// Action is lowercased and stock code uppercased; price and volume are parsed
// exactly (see parse_decimal / parse_integer). Range checks are left to the
// Validator, so an all-digit value too large for 64 bits still parses. `out` is only written on Ok.
[[nodiscard]] ParseStatus parse_order(std::string_view line, OrderRequest& out);

} // namespace tradebook
