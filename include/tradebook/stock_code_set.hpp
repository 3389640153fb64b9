#pragma once

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <set>
#include <string>
#include <string_view>

#include "tradebook/storage/status.hpp"
#include "tradebook/types.hpp"


namespace tradebook {

// True for exactly 4 ASCII uppercase letters.
[[nodiscard]] bool is_stock_code_format(std::string_view code) noexcept;

// ============================================================================
//  StockCodeSet
//  ----------------------------------------------------------------------------
//  The set of tradable stock codes. Filled once at startup, read-only after.
//  Every member satisfies is_stock_code_format().
// ============================================================================
class StockCodeSet {
public:
    StockCodeSet() = default;
    StockCodeSet(std::initializer_list<std::string_view> codes);

    [[nodiscard]] bool contains(std::string_view code) const;

    [[nodiscard]] std::size_t size() const noexcept { return codes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return codes_.empty(); }

    // Reads one code per line. Blank lines and surrounding whitespace are
    // ignored. Any other line that is not a well-formed code aborts the load
    // with MalformedRecord and reports its 1-based number in error_line.
    // `out` is only replaced on success.
    [[nodiscard]] static storage::Status load(const std::filesystem::path& path,
                                              StockCodeSet& out,
                                              std::size_t& error_line);

private:
    std::set<StockCode, std::less<>> codes_;
};

} // namespace tradebook
