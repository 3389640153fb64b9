#include "tradebook/validator.hpp"


namespace tradebook {

bool Validator::valid_price(const Decimal& price) noexcept {
    return !price.clamped && price.fraction_digits == PRICE_DECIMALS && price.hundredths() >= MIN_PRICE;
}

bool Validator::valid_volume(std::int64_t volume) noexcept {
    return volume >= MIN_VOLUME && volume <= MAX_VOLUME;
}

Error Validator::validate(const OrderRequest& req, Order& out) const {
    const auto action = parse_action(req.action);
    if (!action) {
        return Error::InvalidAction;
    }
    if (!is_stock_code_format(req.stock_code)) {
        return Error::InvalidStockCodeFormat;
    }
    if (!codes_.contains(req.stock_code)) {
        return Error::UnknownStockCode;
    }
    if (!valid_price(req.price)) {
        return Error::InvalidPrice;
    }
    if (!valid_volume(req.volume)) {
        return Error::InvalidVolume;
    }

    out.action     = *action;
    out.stock_code = req.stock_code;
    out.price      = req.price.hundredths();
    out.volume     = req.volume;
    return Error::None;
}

} // namespace tradebook
