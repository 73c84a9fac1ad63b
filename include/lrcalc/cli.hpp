#pragma once
#include <iosfwd>

namespace lrcalc {

/// Command-line front end of the `lrcalc` executable.
///
///   lrcalc [-e EXPR]... [-p TEXT] [-q] [-s] [FILE]
///
/// Expressions given with -e are evaluated in order and nothing is read.
/// Otherwise lines come from FILE, or from `in` when FILE is absent or "-".
/// `interactive` says whether `in` is a terminal; a prompt is shown only
/// then, or when -p is given for stdin.
///
/// Returns 0 when every line succeeded, 1 when one failed, and 2 on usage
/// errors, an unreadable FILE or a failed write to `out`/`err`.
int run_cli(int argc, const char* const argv[], std::istream& in, std::ostream& out,
            std::ostream& err, bool interactive);

} // namespace lrcalc
