#include "tradebook/decimal.hpp"

#include <charconv>
#include <cstddef>
#include <limits>
#include <system_error>


namespace tradebook {

namespace {

constexpr bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

// Appends digits to an accumulator. Returns false on a non-digit. Once the
// accumulator would pass int64 max it stops growing and `overflow` is set.
bool accumulate_digits(std::string_view digits, std::uint64_t& acc, bool& overflow) noexcept {
    constexpr std::uint64_t limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    for (char c : digits) {
        if (!is_digit(c)) return false;
        if (overflow) continue;
        const auto d = static_cast<std::uint64_t>(c - '0');
        if (acc > (limit - d) / 10) {
            overflow = true;
            continue;
        }
        acc = acc * 10 + d;
    }
    return true;
}

} // namespace

std::optional<Decimal> parse_decimal(std::string_view text) noexcept {
    if (text.empty()) return std::nullopt;

    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = (text.front() == '-');
        text.remove_prefix(1);
    }

    const auto dot = text.find('.');
    const std::string_view whole = text.substr(0, dot);
    const std::string_view frac  = (dot == std::string_view::npos) ? std::string_view{} : text.substr(dot + 1);

    // At least one digit on either side of the point
    if (whole.empty() && frac.empty()) return std::nullopt;

    std::uint64_t acc = 0;
    bool overflow = false;
    if (!accumulate_digits(whole, acc, overflow)) return std::nullopt;
    if (!accumulate_digits(frac, acc, overflow)) return std::nullopt;

    Decimal out;
    if (overflow) {
        out.units   = negative ? std::numeric_limits<std::int64_t>::min() : std::numeric_limits<std::int64_t>::max();
        out.clamped = true;
    }
    else {
        out.units = negative ? -static_cast<std::int64_t>(acc) : static_cast<std::int64_t>(acc);
    }
    constexpr std::size_t max_digits = std::numeric_limits<std::uint8_t>::max();
    out.fraction_digits = static_cast<std::uint8_t>(frac.size() < max_digits ? frac.size() : max_digits);
    return out;
}

std::optional<std::int64_t> parse_integer(std::string_view text, bool* clamped) noexcept {
    if (clamped) *clamped = false;
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        // "+-5" is not an integer
        if (!text.empty() && text.front() == '-') return std::nullopt;
    }
    if (text.empty()) return std::nullopt;

    std::int64_t value = 0;
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ptr != last) return std::nullopt;
    if (ec == std::errc::result_out_of_range) {
        if (clamped) *clamped = true;
        return (text.front() == '-') ? std::numeric_limits<std::int64_t>::min()
                                     : std::numeric_limits<std::int64_t>::max();
    }
    if (ec != std::errc{}) return std::nullopt;
    return value;
}

std::string format_price(Price p) {
    const bool neg = p < 0;
    // Widen before negating so the minimum value does not overflow
    const auto abs = neg ? static_cast<std::uint64_t>(-(p + 1)) + 1 : static_cast<std::uint64_t>(p);
    const auto whole = abs / static_cast<std::uint64_t>(PRICE_SCALE);
    const auto frac  = abs % static_cast<std::uint64_t>(PRICE_SCALE);

    std::string out;
    if (neg) out += '-';
    out += std::to_string(whole);
    out += '.';
    if (frac < 10) out += '0';
    out += std::to_string(frac);
    return out;
}

} // namespace tradebook
