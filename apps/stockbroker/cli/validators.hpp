#pragma once

#include <array>
#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "tradebook/policy/netting.hpp"


namespace tradebook::app::cli {

// -------------------------------------------------------------
// Netting policy validator
// -------------------------------------------------------------
inline auto netting_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == policy::netting::SameAction::name || value == policy::netting::CrossAction::name) {
            return {};
        }
        return "Netting must be one of: same-action, cross-action";
    },
    "Netting policy validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline constexpr std::array<std::string_view, 5> valid_log_levels = {
    "trace", "debug", "info", "warn", "error"
};

inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        for (auto v : valid_log_levels) {
            if (value == v) {
                return {};
            }
        }
        return "Log level must be one of: trace, debug, info, warn, error";
    },
    "Log level validator"
);

} // namespace tradebook::app::cli
