#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "tradebook/error.hpp"
#include "tradebook/ledger.hpp"
#include "tradebook/order.hpp"
#include "tradebook/order_parser.hpp"
#include "tradebook/stock_code_set.hpp"
#include "tradebook/validator.hpp"
#include "tradebook/policy/netting.hpp"
#include "tradebook/storage/book_store.hpp"
#include "lcr/log/logger.hpp"


namespace tradebook {

inline constexpr std::string_view MSG_BOOK_ADDED   = "Trade book added.";
inline constexpr std::string_view MSG_BOOK_UPDATED = "Trade book updated.";
inline constexpr std::string_view MSG_BAD_NUMBER   =
    "Invalid command. Price must be a decimal number and volume must be an integer.";

// -----------------------------------------------------------------------------
// Outcome of one processed order line
// -----------------------------------------------------------------------------
struct Response {
    Error                         error{Error::None};
    std::string                   message;
    std::optional<Reconciliation> reconciliation;   // set when accepted

    [[nodiscard]] bool accepted() const noexcept { return error == Error::None; }
};

// -----------------------------------------------------------------------------
// Running counters (diagnostics only)
// -----------------------------------------------------------------------------
struct ProcessorStats {
    std::uint64_t received{0};
    std::uint64_t created{0};
    std::uint64_t adjusted{0};
    std::uint64_t rejected{0};

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Received : " << received << "\n"
           << "  Created  : " << created << "\n"
           << "  Adjusted : " << adjusted << "\n"
           << "  Rejected : " << rejected << "\n";
    }
};

// ============================================================================
//  class Processor
//  ----------------------------------------------------------------------------
//  Takes one raw order line through
//
//      Received -> Parsed -> Validated -> Reconciled -> Persisted -> Reported
//                         \-> Rejected -------------------------> Reported
//
//  and returns the single status line to show the operator.
//
//  The ledger and the store are owned by the caller. The ledger is written
//  to the store after every accepted order; if that write fails the
//  reconciliation is rolled back and the order is rejected with
//  StorageUnavailable, so memory and storage never disagree.
// ============================================================================
template<policy::NettingPolicy Policy, storage::BookStore Store>
class Processor {
public:
    using ledger_type = Ledger<Policy>;

    Processor(const StockCodeSet& codes, ledger_type& ledger, Store& store) noexcept
        : validator_(codes)
        , ledger_(ledger)
        , store_(store)
    {}

    [[nodiscard]] Response process(std::string_view line) {
        ++stats_.received;

        // Parse
        OrderRequest req;
        const auto ps = parse_order(line, req);
        if (ps != ParseStatus::Ok) {
            return reject_(Error::MalformedOrder,
                           ps == ParseStatus::BadNumber ? MSG_BAD_NUMBER : message(Error::MalformedOrder),
                           line);
        }

        // Validate
        Order order;
        const auto err = validator_.validate(req, order);
        if (err != Error::None) {
            return reject_(err, message(err), line);
        }

        // Reconcile
        const Reconciliation r = ledger_.reconcile(order);
        if (!r.ok()) {
            return reject_(r.error, message(r.error), line);
        }

        // Persist
        const auto status = store_.save(ledger_.books());
        if (status != storage::Status::Ok) {
            TB_ERROR("[PROC] Persist failed (" << storage::to_string(status) << "), rolling back " << order);
            if (!ledger_.rollback(r)) {
                TB_FATAL("[PROC] Rollback refused for " << r.book << ", in-memory ledger diverges from storage");
            }
            return reject_(Error::StorageUnavailable, message(Error::StorageUnavailable), line);
        }

        // Report
        Response resp;
        if (r.outcome == Outcome::Created) {
            ++stats_.created;
            resp.message = MSG_BOOK_ADDED;
        }
        else {
            ++stats_.adjusted;
            resp.message = MSG_BOOK_UPDATED;
        }
        TB_INFO("[PROC] " << to_string(r.outcome) << " " << r.book);
        resp.reconciliation = r;
        return resp;
    }

    [[nodiscard]] const ProcessorStats& stats() const noexcept { return stats_; }
    [[nodiscard]] const ledger_type& ledger() const noexcept { return ledger_; }

private:
    Response reject_(Error err, std::string_view msg, std::string_view line) {
        ++stats_.rejected;
        TB_DEBUG("[PROC] Rejected '" << line << "': " << to_string(err));
        Response resp;
        resp.error   = err;
        resp.message = std::string(msg);
        return resp;
    }

private:
    Validator      validator_;
    ledger_type&   ledger_;
    Store&         store_;
    ProcessorStats stats_;
};

} // namespace tradebook
