// ============================================================================
// stockbroker
//
// Records buy / sell orders into persistent trade books.
//
//   stockbroker                 interactive prompt, "exit" to quit
//   stockbroker orders.txt      batch mode, one order per line
//
// Orders sharing action, stock code and price are consolidated into one book.
// ============================================================================

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "tradebook.hpp"

#include "cli/params.hpp"
namespace cli = tradebook::app::cli;

namespace tb = tradebook;


namespace {

// -----------------------------------------------------------------------------
// Startup: load collaborators, fail fast on storage errors
// -----------------------------------------------------------------------------
int report_storage_failure(const char* what, const std::string& path, tb::storage::Status status, std::size_t line) {
    std::cerr << "Error: cannot load " << what << " from '" << path << "': " << tb::storage::to_string(status);
    if (status == tb::storage::Status::MalformedRecord && line > 0) {
        std::cerr << " (line " << line << ")";
    }
    std::cerr << std::endl;
    return EXIT_FAILURE;
}

template<tb::policy::NettingPolicy Policy>
int run(const cli::Params& params) {
    TB_INFO("[APP] stockbroker " << tb::version_string << ", netting=" << Policy::name);

    tb::StockCodeSet codes;
    std::size_t bad_line = 0;
    auto status = tb::StockCodeSet::load(params.stock_code_file, codes, bad_line);
    if (status != tb::storage::Status::Ok) {
        return report_storage_failure("stock codes", params.stock_code_file, status, bad_line);
    }

    tb::storage::CsvBookStore store{params.ledger_file};
    std::vector<tb::TradeBook> persisted;
    status = store.load(persisted);
    if (status != tb::storage::Status::Ok) {
        return report_storage_failure("trade books", params.ledger_file, status, store.error_line());
    }

    tb::Ledger<Policy> ledger;
    if (const auto err = ledger.seed(persisted); err != tb::Error::None) {
        std::cerr << "Error: cannot load trade books from '" << params.ledger_file << "': "
                  << tb::to_string(err) << std::endl;
        return EXIT_FAILURE;
    }

    tb::Processor<Policy, tb::storage::CsvBookStore> processor{codes, ledger, store};

    // -------------------------------------------------------------
    // Interactive mode
    // -------------------------------------------------------------
    if (params.interactive()) {
        tb::input::InteractiveSource source{std::cin, std::cout};
        const auto n = tb::run_session(source, processor, std::cout);
        TB_DEBUG("[APP] Interactive session processed " << n << " orders"
                 << (source.exit_requested() ? " (exit)" : " (end of input)"));
        return EXIT_SUCCESS;
    }

    // -------------------------------------------------------------
    // Batch mode
    // -------------------------------------------------------------
    tb::input::FileSource source{params.order_file};
    status = source.open();
    if (status != tb::storage::Status::Ok) {
        std::cerr << "Error: File '" << params.order_file << "' not found." << std::endl;
        TB_DEBUG("[APP] Order file open status: " << tb::storage::to_string(status));
        return EXIT_FAILURE;
    }

    const auto n = tb::run_session(source, processor, std::cout, tb::SessionOptions{params.echo});
    if (source.failed()) {
        std::cerr << "Error: read failure on '" << params.order_file << "' after line "
                  << source.line_number() << std::endl;
        return EXIT_FAILURE;
    }

    TB_DEBUG("[APP] Batch processed " << n << " orders from " << params.order_file);
    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        processor.stats().dump("Processor", std::cerr);
    }
    return EXIT_SUCCESS;
}

} // namespace

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    const auto params = cli::configure(argc, argv, "Stockbroker trade book recorder");

    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        params.dump("Configuration", std::cerr);
    }

    if (params.netting == tb::policy::netting::CrossAction::name) {
        return run<tb::policy::netting::CrossAction>(params);
    }
    return run<tb::policy::netting::SameAction>(params);
}
