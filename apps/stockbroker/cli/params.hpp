#pragma once

#include <string>
#include <cstdlib>
#include <iostream>
#include <ostream>
#include <string_view>

#include <CLI/CLI.hpp>

#include "cli/validators.hpp"
#include "lcr/log/logger.hpp"


namespace tradebook::app::cli {

struct Params {
    std::string order_file;                               // empty => interactive
    std::string stock_code_file = "data/stockcode.csv";
    std::string ledger_file     = "data/orders.csv";
    std::string netting         = "same-action";
    bool echo                   = false;
    std::string log_level       = "warn";

    [[nodiscard]] bool interactive() const noexcept { return order_file.empty(); }

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n"
           << "  Mode        : " << (interactive() ? "interactive" : "batch") << "\n";
        if (!interactive()) {
            os << "  Order file  : " << order_file << "\n";
        }
        os << "  Stock codes : " << stock_code_file << "\n"
           << "  Ledger file : " << ledger_file << "\n"
           << "  Netting     : " << netting << "\n"
           << "  Echo        : " << (echo ? "true" : "false") << "\n"
           << "  Log Level   : " << log_level << "\n";
    }
};

// -------------------------------------------------------------
// Build CLI
// -------------------------------------------------------------
[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description), "stockbroker"};
    Params params{};

    app.add_option("order-file", params.order_file, "Batch file of orders, one per line (omit for interactive mode)");
    app.add_option("--stock-codes", params.stock_code_file, "File of valid stock codes, one per line")
        ->envname("STOCKCODE_FILE")->default_val(params.stock_code_file);
    app.add_option("--orders", params.ledger_file, "CSV file holding the persisted trade books")
        ->envname("ORDERS_FILE")->default_val(params.ledger_file);
    app.add_option("--netting", params.netting, "Netting policy: same-action | cross-action")
        ->check(netting_validator)->default_val(params.netting);
    app.add_flag("--echo", params.echo, "Batch mode: print each order line before its result");
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")
        ->check(log_level_validator)->default_val(params.log_level);

    app.footer(
        "Order format: [buy|sell] [STOCKCODE] [PRICE] [VOLUME]\n"
        "Example     : buy AAPL 150.00 100\n"
        "Type 'exit' to leave interactive mode."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    lcr::log::set_level(params.log_level);
    return params;
}

} // namespace tradebook::app::cli
