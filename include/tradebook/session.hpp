#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "tradebook/processor.hpp"
#include "tradebook/text.hpp"
#include "tradebook/input/line_source.hpp"
#include "lcr/log/logger.hpp"


namespace tradebook {

struct SessionOptions {
    bool echo{false};   // write each order line before its status line
};

// Drains `source` through `proc`, one status line per non-blank order line.
// Lines are handled strictly in arrival order. Returns the number of orders
// processed (accepted or rejected).
template<input::LineSource Source, policy::NettingPolicy Policy, storage::BookStore Store>
std::size_t run_session(Source& source, Processor<Policy, Store>& proc, std::ostream& out,
                        const SessionOptions& opts = {}) {
    std::size_t processed = 0;
    std::string line;
    while (source.next(line)) {
        const auto order_line = text::trim(line);
        if (order_line.empty()) continue;

        if (opts.echo) {
            out << order_line << '\n';
        }
        const auto resp = proc.process(order_line);
        out << resp.message << '\n';
        ++processed;
    }
    out.flush();
    TB_DEBUG("[SESSION] Finished after " << processed << " orders");
    return processed;
}

} // namespace tradebook
