#include "tradebook/order_parser.hpp"

#include "tradebook/decimal.hpp"
#include "tradebook/text.hpp"


namespace tradebook {

ParseStatus parse_order(std::string_view line, OrderRequest& out) {
    const auto fields = text::split_ws(line);
    if (fields.size() != 4) {
        return ParseStatus::WrongFieldCount;
    }

    const auto price  = parse_decimal(fields[2]);
    const auto volume = parse_integer(fields[3]);
    if (!price || !volume) {
        return ParseStatus::BadNumber;
    }

    out.action     = text::to_lower(fields[0]);
    out.stock_code = text::to_upper(fields[1]);
    out.price      = *price;
    out.volume     = *volume;
    return ParseStatus::Ok;
}

} // namespace tradebook
