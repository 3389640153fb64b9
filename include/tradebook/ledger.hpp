#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "tradebook/error.hpp"
#include "tradebook/order.hpp"
#include "tradebook/trade_book.hpp"
#include "tradebook/policy/netting.hpp"
#include "lcr/log/logger.hpp"


namespace tradebook {

enum class Outcome : std::uint8_t {
    Created,
    Adjusted
};

[[nodiscard]]
inline constexpr std::string_view to_string(Outcome o) noexcept {
    switch (o) {
        case Outcome::Created:  return "Created";
        case Outcome::Adjusted: return "Adjusted";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------
// Result of Ledger::reconcile()
// -----------------------------------------------------------------------------
// `book` is the state after the order, `previous` the state before it
// (meaningful for Adjusted only). Both are copies; they stay valid after
// further ledger mutations.
struct Reconciliation {
    Error       error{Error::None};
    Outcome     outcome{Outcome::Created};
    std::size_t index{0};
    TradeBook   book;
    TradeBook   previous;

    [[nodiscard]] bool ok() const noexcept { return error == Error::None; }
    [[nodiscard]] Volume volume() const noexcept { return book.volume; }
};

// ============================================================================
//  class Ledger
//  ----------------------------------------------------------------------------
//  In-memory collection of trade books with at most one book per match key.
//
//  Responsibilities:
//  -----------------
//      • Resolve an order to its book through Policy::match_key().
//      • Create a book on first sight of a key (volume = order volume).
//      • Delegate the volume adjustment of an existing book to Policy::apply().
//      • Undo the most recent reconciliation when persistence fails.
//
//  Invariants:
//  -----------
//      • index_ maps every match key to exactly one position in books_.
//      • books_ keeps first-insertion order. Books are never deleted, except
//        by rolling back the reconciliation that created them.
//      • Cumulative volume is not capped by the per-order volume bound.
//
//  Thread Safety:
//  --------------
//      Not internally synchronized. Callers that add concurrency must
//      serialize every mutation.
// ============================================================================
template<policy::NettingPolicy Policy = policy::netting::SameAction>
class Ledger {
public:
    using policy_type = Policy;

    Ledger() = default;

    // Non-copyable: a ledger is an owned, identity-bearing resource.
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;
    Ledger(Ledger&&) noexcept = default;
    Ledger& operator=(Ledger&&) noexcept = default;

    [[nodiscard]] Reconciliation reconcile(const Order& order) {
        Reconciliation r;
        const BookKey match = Policy::match_key(order.key());

        auto it = index_.find(match);
        if (it == index_.end()) {
            books_.push_back(TradeBook{order.action, order.stock_code, order.price, order.volume});
            r.outcome = Outcome::Created;
            r.index   = books_.size() - 1;
            r.book    = books_.back();
            index_.emplace(match, r.index);
            TB_DEBUG("[LEDGER] Created " << r.book);
            return r;
        }

        TradeBook& book = books_[it->second];
        r.index    = it->second;
        r.previous = book;
        if (!Policy::apply(book, order)) {
            r.error = Error::VolumeOverflow;
            r.book  = book;
            TB_WARN("[LEDGER] Volume overflow on " << book.key() << " adding " << order.volume);
            return r;
        }
        r.outcome = Outcome::Adjusted;
        r.book    = book;
        TB_DEBUG("[LEDGER] Adjusted " << r.previous << " -> volume=" << book.volume);
        return r;
    }

    // Undoes `r`, which must be the most recent successful reconciliation.
    // Returns false (and changes nothing) if `r` does not describe the
    // current ledger state.
    [[nodiscard]] bool rollback(const Reconciliation& r) {
        if (!r.ok() || r.index >= books_.size()) return false;
        if (books_[r.index] != r.book) return false;

        if (r.outcome == Outcome::Created) {
            if (r.index + 1 != books_.size()) return false;
            index_.erase(Policy::match_key(books_.back().key()));
            books_.pop_back();
        }
        else {
            books_[r.index] = r.previous;
        }
        TB_DEBUG("[LEDGER] Rolled back " << to_string(r.outcome) << " " << r.book.key());
        return true;
    }

    // Loads persisted books. A key repeated in storage is folded into its
    // first occurrence through the policy, as if it had arrived as an order.
    [[nodiscard]] Error seed(const std::vector<TradeBook>& books) {
        for (const auto& b : books) {
            const Order as_order{b.action, b.stock_code, b.price, b.volume};
            const auto r = reconcile(as_order);
            if (!r.ok()) return r.error;
            if (r.outcome == Outcome::Adjusted) {
                TB_WARN("[LEDGER] Duplicate persisted book " << b.key() << " folded into existing entry");
            }
        }
        return Error::None;
    }

    // Book the key resolves to under the policy, or nullptr.
    [[nodiscard]] const TradeBook* find(const BookKey& key) const {
        auto it = index_.find(Policy::match_key(key));
        return (it == index_.end()) ? nullptr : &books_[it->second];
    }

    [[nodiscard]] const std::vector<TradeBook>& books() const noexcept { return books_; }
    [[nodiscard]] std::size_t size() const noexcept { return books_.size(); }
    [[nodiscard]] bool empty() const noexcept { return books_.empty(); }

private:
    std::vector<TradeBook> books_;
    std::unordered_map<BookKey, std::size_t, BookKeyHash> index_;
};

} // namespace tradebook
