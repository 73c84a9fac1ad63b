#include "lrcalc/repl.hpp"
#include "lrcalc/errors.hpp"
#include "lrcalc/evaluator.hpp"

#include <cctype>
#include <istream>
#include <ostream>

namespace lrcalc {

bool is_blank(std::string_view line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool eval_line(std::string_view line, std::ostream& out, std::ostream& err) {
    try {
        Number n = evaluate(line);
        out << to_string(n) << '\n';
        return true;
    } catch (const Error& e) {
        err << "error: " << e.what() << '\n';
        return false;
    }
}

static bool streams_ok(const std::ostream& out, const std::ostream& err) {
    return !out.fail() && !err.fail();
}

ReplStats run_repl(std::istream& in, std::ostream& out, std::ostream& err,
                   const ReplOptions& opts) {
    ReplStats stats;
    std::string line;

    for (;;) {
        if (opts.show_prompt) {
            out << opts.prompt << std::flush;
            if (!streams_ok(out, err)) {
                stats.output_error = true;
                return stats;
            }
        }
        if (!std::getline(in, line)) break;

        if (!line.empty() && line.back() == '\r') line.pop_back(); // CRLF input
        if (is_blank(line)) continue;

        ++stats.evaluated;
        const bool ok = eval_line(line, out, err);
        out.flush();
        err.flush();
        if (!ok) ++stats.failed;
        if (!streams_ok(out, err)) {
            stats.output_error = true;
            return stats;
        }
        if (!ok && opts.stop_on_error) break;
    }

    if (opts.show_prompt) out << '\n' << std::flush;
    stats.output_error = !streams_ok(out, err);
    return stats;
}

} // namespace lrcalc
