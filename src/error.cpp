#include "tradebook/error.hpp"


namespace tradebook {

std::string_view message(Error err) noexcept {
    switch (err) {
    case Error::None:
        return {};
    case Error::MalformedOrder:
        return "Invalid command. Format: [buy|sell] [STOCKCODE] [PRICE] [VOLUME]";
    case Error::InvalidAction:
        return "Invalid action. Must be 'buy' or 'sell'.";
    case Error::InvalidStockCodeFormat:
        return "Invalid stock code. Must be 4 uppercase letters.";
    case Error::UnknownStockCode:
        return "Invalid stock code. Must exist in stockcode.csv.";
    case Error::InvalidPrice:
        return "Invalid price. Must be a number with 2 decimal places and >= 0.50.";
    case Error::InvalidVolume:
        return "Invalid volume. Must be between 1 and 1,000,000.";
    case Error::VolumeOverflow:
        return "Invalid volume. Trade book volume would overflow.";
    case Error::StorageUnavailable:
        return "Storage unavailable. Trade book was not recorded.";
    }
    return "Unknown error.";
}

} // namespace tradebook
