#pragma once

#include <concepts>
#include <vector>

#include "tradebook/storage/status.hpp"
#include "tradebook/trade_book.hpp"


namespace tradebook::storage {

// ============================================================================
// Book Store Concept
// ============================================================================
//
// Durable home of the ledger's books.
//
//   load(out)    Replaces `out` with the persisted books in stored order.
//                A store that has never been written yields an empty list.
//
//   save(books)  Replaces the persisted state with `books`. Either the full
//                new state is durable on Ok, or the previous state remains.
//
// ============================================================================

template<typename S>
concept BookStore =
requires(S& store, const std::vector<TradeBook>& books, std::vector<TradeBook>& out) {
    { store.load(out) } -> std::same_as<Status>;
    { store.save(books) } -> std::same_as<Status>;
};

} // namespace tradebook::storage
