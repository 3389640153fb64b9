#pragma once

#include <concepts>
#include <string>


namespace tradebook::input {

// ============================================================================
// Line Source Concept
// ============================================================================
//
// A lazy sequence of order lines. The session runner consumes every source
// the same way, so interactive and batch input differ only in their adapter.
//
//   next(line)   Stores the next line in `line` and returns true, or returns
//                false once the sequence has ended (end of input, or a
//                source-specific terminator such as "exit").
//
// ============================================================================

template<typename S>
concept LineSource =
requires(S& source, std::string& line) {
    { source.next(line) } -> std::same_as<bool>;
};

} // namespace tradebook::input
