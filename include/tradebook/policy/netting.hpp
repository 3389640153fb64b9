#pragma once

#include <concepts>
#include <limits>
#include <string_view>

#include "tradebook/order.hpp"
#include "tradebook/trade_book.hpp"


namespace tradebook::policy {

// ============================================================================
// Netting Policy
// ============================================================================
//
// Decides how an accepted order adjusts the book it resolves to.
//
// The Ledger owns lookup, creation and ordering of books. A policy only
// contributes two pure functions:
//
//   match_key(key)       Projection of a book key onto the lookup index.
//                        Two keys with the same projection share one book.
//
//   apply(book, order)   Adjusts a matched book in place. Returns false if the
//                        adjustment cannot be represented; the book is then
//                        left untouched.
//
// Design goals:
//   • Compile-time injectable
//   • No state
//   • Deterministic, order-dependent accumulation
//
// ============================================================================

template<typename P>
concept NettingPolicy =
requires(const BookKey& key, TradeBook& book, const Order& order) {
    { P::name } -> std::convertible_to<std::string_view>;
    { P::match_key(key) } -> std::same_as<BookKey>;
    { P::apply(book, order) } -> std::same_as<bool>;
};

namespace netting {

namespace detail {

[[nodiscard]]
inline constexpr bool add_volume(Volume& target, Volume delta) noexcept {
    if (target > std::numeric_limits<Volume>::max() - delta) return false;
    target += delta;
    return true;
}

} // namespace detail

// ------------------------------------------------------------
// SameAction
// ------------------------------------------------------------
// The book key includes the action, so a buy book only ever meets further
// buys at its price and a sell book only further sells. Every match
// increases the volume.

struct SameAction {

    static constexpr std::string_view name = "same-action";

    [[nodiscard]]
    static BookKey match_key(const BookKey& key) {
        return key;
    }

    [[nodiscard]]
    static bool apply(TradeBook& book, const Order& order) noexcept {
        return detail::add_volume(book.volume, order.volume);
    }
};


// ------------------------------------------------------------
// CrossAction
// ------------------------------------------------------------
// Buy and sell at the same code and price share one book holding the net
// position. buy 100 then sell 30 leaves buy 70; a further sell 100 flips the
// book to sell 30; an exact offset leaves a zero-volume book in place.

struct CrossAction {

    static constexpr std::string_view name = "cross-action";

    [[nodiscard]]
    static BookKey match_key(const BookKey& key) {
        BookKey k = key;
        k.action = Action::Buy; // action does not take part in matching
        return k;
    }

    [[nodiscard]]
    static bool apply(TradeBook& book, const Order& order) noexcept {
        if (book.action == order.action) {
            return detail::add_volume(book.volume, order.volume);
        }
        if (order.volume <= book.volume) {
            book.volume -= order.volume;
        }
        else {
            book.volume = order.volume - book.volume;
            book.action = opposite(book.action);
        }
        return true;
    }
};

} // namespace netting

static_assert(NettingPolicy<netting::SameAction>);
static_assert(NettingPolicy<netting::CrossAction>);

} // namespace tradebook::policy
