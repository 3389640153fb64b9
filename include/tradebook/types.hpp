#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


namespace tradebook {

// Prices are fixed-point with 2 implied decimals.
// We store them as integer hundredths (e.g. 1000.25 => 100025).
using Price = std::int64_t;

// Cumulative book volume. Single orders are bounded, books are not.
using Volume = std::int64_t;

using StockCode = std::string;

inline constexpr int           PRICE_DECIMALS = 2;
inline constexpr Price         PRICE_SCALE    = 100;
inline constexpr Price         MIN_PRICE      = 50;          // 0.50
inline constexpr Volume        MIN_VOLUME     = 1;
inline constexpr Volume        MAX_VOLUME     = 1'000'000;
inline constexpr std::size_t   STOCK_CODE_LENGTH = 4;

// -----------------------------
// Trade action
// -----------------------------
enum class Action : std::uint8_t {
    Buy,
    Sell
};

[[nodiscard]]
constexpr std::string_view to_string(Action a) noexcept {
    switch (a) {
        case Action::Buy:  return "buy";
        case Action::Sell: return "sell";
    }
    return "unknown";
}

// Accepts the canonical lowercase spelling only.
[[nodiscard]]
constexpr std::optional<Action> parse_action(std::string_view s) noexcept {
    if (s == "buy")  return Action::Buy;
    if (s == "sell") return Action::Sell;
    return std::nullopt;
}

[[nodiscard]]
constexpr Action opposite(Action a) noexcept {
    return (a == Action::Buy) ? Action::Sell : Action::Buy;
}

} // namespace tradebook
