#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tradebook/types.hpp"


namespace tradebook {

// ============================================================================
//  Decimal
//  ----------------------------------------------------------------------------
//  Exact representation of a decimal literal as typed by the operator:
//  `units` is the value with the decimal point removed and `fraction_digits`
//  counts the digits after the point.
//
//      "1000.00" -> { 100000, 2 }
//      "999.999" -> { 999999, 3 }
//      "-1.5"    -> { -15,    1 }
//      "42"      -> { 42,     0 }
//
//  No floating point is involved, so "exactly 2 fractional digits" is a
//  property of the text and never of a rounding step.
//
//  A well-formed literal whose digits do not fit in 64 bits is still a
//  number: `units` is clamped to the nearest bound and `clamped` is set.
// ============================================================================
struct Decimal {
    std::int64_t units{0};
    std::uint8_t fraction_digits{0};
    bool         clamped{false};

    // Value in hundredths. Only meaningful when fraction_digits == 2.
    [[nodiscard]] constexpr Price hundredths() const noexcept { return units; }

    constexpr bool operator==(const Decimal&) const noexcept = default;
};

// Parses [+-]digits[.digits]. Rejects empty input, exponents, a bare sign
// and a lone '.'. Out-of-range values are clamped (see Decimal::clamped).
[[nodiscard]] std::optional<Decimal> parse_decimal(std::string_view text) noexcept;

// Parses [+-]digits into a 64-bit integer. Rejects anything else. A value
// outside the 64-bit range is clamped to the nearest bound, and `*clamped`
// (when given) reports it.
[[nodiscard]] std::optional<std::int64_t> parse_integer(std::string_view text, bool* clamped = nullptr) noexcept;

// Renders hundredths with exactly 2 fractional digits ("1000.00", "0.50").
[[nodiscard]] std::string format_price(Price p);

} // namespace tradebook
