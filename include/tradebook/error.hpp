#pragma once

#include <cstdint>
#include <string_view>


namespace tradebook {

/*
===============================================================================
 tradebook::Error
===============================================================================

Per-order failure classification.

Every value except StorageUnavailable describes a property of the order
itself and is decided before the ledger is touched. StorageUnavailable is
raised when the ledger file cannot be written after reconciliation; the
reconciliation is then rolled back so the order leaves no trace.

Errors reject a single order. The order source keeps going with the next
line. Startup storage failures are reported through storage::Status instead.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Parse stage --------------------------------------------------------
    MalformedOrder,          // Wrong field count or unparsable price / volume

    // --- Validation stage (checked in this order) ---------------------------
    InvalidAction,           // Not "buy" or "sell"
    InvalidStockCodeFormat,  // Not exactly 4 uppercase letters
    UnknownStockCode,        // Well-formed but not in the stock code set
    InvalidPrice,            // Not exactly 2 fractional digits, or below 0.50
    InvalidVolume,           // Outside [1, 1'000'000]

    // --- Reconciliation stage -----------------------------------------------
    VolumeOverflow,          // Cumulative book volume would not fit in Volume

    // --- Persistence stage --------------------------------------------------
    StorageUnavailable       // Ledger could not be written; order rolled back
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                   return "None";
    case Error::MalformedOrder:         return "MalformedOrder";
    case Error::InvalidAction:          return "InvalidAction";
    case Error::InvalidStockCodeFormat: return "InvalidStockCodeFormat";
    case Error::UnknownStockCode:       return "UnknownStockCode";
    case Error::InvalidPrice:           return "InvalidPrice";
    case Error::InvalidVolume:          return "InvalidVolume";
    case Error::VolumeOverflow:         return "VolumeOverflow";
    case Error::StorageUnavailable:     return "StorageUnavailable";
    default:                            return "Unknown";
    }
}

// Operator-facing rejection text. Empty for Error::None.
[[nodiscard]] std::string_view message(Error err) noexcept;

} // namespace tradebook
