#pragma once

#include "tradebook/error.hpp"
#include "tradebook/order.hpp"
#include "tradebook/stock_code_set.hpp"


namespace tradebook {

// ============================================================================
//  Validator
//  ----------------------------------------------------------------------------
//  Gatekeeper between a parsed OrderRequest and the ledger. Checks run in a
//  fixed order and stop at the first violation:
//
//      1. action      "buy" | "sell"                    -> InvalidAction
//      2. code shape  exactly 4 uppercase letters       -> InvalidStockCodeFormat
//      3. code known  member of the StockCodeSet        -> UnknownStockCode
//      4. price       exactly 2 decimals, >= 0.50       -> InvalidPrice
//      5. volume      1 <= volume <= 1'000'000          -> InvalidVolume
//
//  Pure: the only state is a reference to the (immutable) stock code set.
// ============================================================================
class Validator {
public:
    explicit Validator(const StockCodeSet& codes) noexcept
        : codes_(codes)
    {}

    // On Error::None, `out` holds the typed order. Otherwise `out` is untouched.
    [[nodiscard]] Error validate(const OrderRequest& req, Order& out) const;

    [[nodiscard]] static bool valid_price(const Decimal& price) noexcept;
    [[nodiscard]] static bool valid_volume(std::int64_t volume) noexcept;

private:
    const StockCodeSet& codes_;
};

} // namespace tradebook
