#pragma once

#include <istream>
#include <ostream>
#include <string>
#include <string_view>

#include "tradebook/input/line_source.hpp"
#include "tradebook/text.hpp"


namespace tradebook::input {

inline constexpr std::string_view DEFAULT_PROMPT = "$ ";
inline constexpr std::string_view EXIT_COMMAND   = "exit";

// -----------------------------------------------------------------------------
// Operator prompt
// -----------------------------------------------------------------------------
// Prints the prompt, blocks for one line, and ends the sequence on "exit"
// (any case, surrounding whitespace ignored) or end of input. Nothing is
// written after the terminating line.
class InteractiveSource {
public:
    InteractiveSource(std::istream& in, std::ostream& out, std::string_view prompt = DEFAULT_PROMPT)
        : in_(in)
        , out_(out)
        , prompt_(prompt)
    {}

    [[nodiscard]] bool next(std::string& line) {
        if (done_) return false;
        out_ << prompt_ << std::flush;
        if (!std::getline(in_, line)) {
            done_ = true;
            return false;
        }
        if (text::iequals(text::trim(line), EXIT_COMMAND)) {
            exit_requested_ = true;
            done_ = true;
            return false;
        }
        return true;
    }

    // True if the sequence ended on the exit command rather than end of input
    [[nodiscard]] bool exit_requested() const noexcept { return exit_requested_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::string   prompt_;
    bool          done_{false};
    bool          exit_requested_{false};
};

static_assert(LineSource<InteractiveSource>);

} // namespace tradebook::input
