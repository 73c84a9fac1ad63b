#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <string_view>

namespace lrcalc {

struct ReplOptions {
    std::string prompt{"calc> "};
    bool show_prompt{true};
    bool stop_on_error{false}; // stop after the first line that fails
};

struct ReplStats {
    std::size_t evaluated{0}; // lines handed to the evaluator
    std::size_t failed{0};
    bool output_error{false}; // `out` or `err` went bad; the loop stopped early
};

/// True for empty and whitespace-only lines, which are never evaluated.
bool is_blank(std::string_view line);

/// Evaluates one non-blank line, printing the result to `out` or
/// "error: <message>" to `err`. Returns false if the line failed.
bool eval_line(std::string_view line, std::ostream& out, std::ostream& err);

/// Reads lines from `in` until end of stream. Every line is independent.
ReplStats run_repl(std::istream& in, std::ostream& out, std::ostream& err,
                   const ReplOptions& opts = {});

} // namespace lrcalc
