#include "lrcalc/cli.hpp"
#include "lrcalc/repl.hpp"

#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace lrcalc {

namespace {

void usage(std::ostream& os, const char* argv0) {
    os << "usage: " << argv0 << " [OPTIONS] [FILE]\n"
       << "Evaluate +, -, *, / over non-negative integers strictly left to right.\n"
       << "\n"
       << "  -e, --expr EXPR     evaluate EXPR and exit (repeatable)\n"
       << "  -p, --prompt TEXT   prompt shown before each line (default \"calc> \")\n"
       << "  -q, --quiet         never show a prompt\n"
       << "  -s, --strict        stop at the first line that fails\n"
       << "  -h, --help          show this help\n"
       << "\n"
       << "Lines are read from FILE, or from stdin when FILE is absent or \"-\".\n";
}

struct Args {
    ReplOptions repl;
    std::vector<std::string> exprs;
    std::string file;
    bool quiet = false;
    bool prompt_set = false;
};

// Returns -1 to continue, otherwise the exit code.
int parse_args(int argc, const char* const argv[], Args& a, std::ostream& out, std::ostream& err) {
    const char* argv0 = argc > 0 ? argv[0] : "lrcalc";

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto value = [&]() -> const char* {
            if (i + 1 >= argc) {
                err << argv0 << ": option " << arg << " requires an argument\n";
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            usage(out, argv0);
            return 0;
        } else if (arg == "-e" || arg == "--expr") {
            const char* v = value();
            if (!v) return 2;
            a.exprs.emplace_back(v);
        } else if (arg == "-p" || arg == "--prompt") {
            const char* v = value();
            if (!v) return 2;
            a.repl.prompt = v;
            a.prompt_set = true;
        } else if (arg == "-q" || arg == "--quiet") {
            a.quiet = true;
        } else if (arg == "-s" || arg == "--strict") {
            a.repl.stop_on_error = true;
        } else if (arg.size() > 1 && arg[0] == '-') {
            err << argv0 << ": unknown option " << arg << "\n";
            usage(err, argv0);
            return 2;
        } else if (a.file.empty()) {
            a.file = arg;
        } else {
            err << argv0 << ": only one FILE may be given\n";
            return 2;
        }
    }
    return -1;
}

int exit_code(const ReplStats& st) {
    if (st.output_error) return 2;
    return st.failed == 0 ? 0 : 1;
}

int run_exprs(const Args& args, std::ostream& out, std::ostream& err) {
    ReplStats st;
    for (const auto& e : args.exprs) {
        if (is_blank(e)) continue;

        ++st.evaluated;
        const bool ok = eval_line(e, out, err);
        out.flush();
        err.flush();
        if (!ok) ++st.failed;
        if (out.fail() || err.fail()) {
            st.output_error = true;
            break;
        }
        if (!ok && args.repl.stop_on_error) break;
    }
    return exit_code(st);
}

} // namespace

int run_cli(int argc, const char* const argv[], std::istream& in, std::ostream& out,
            std::ostream& err, bool interactive) {
    Args args;
    if (int rc = parse_args(argc, argv, args, out, err); rc >= 0) {
        out.flush();
        return out.fail() ? 2 : rc;
    }

    if (!args.exprs.empty()) return run_exprs(args, out, err);

    if (!args.file.empty() && args.file != "-") {
        std::ifstream input(args.file);
        if (!input) {
            err << "Failed opening file \"" << args.file << "\"." << std::endl;
            return 2;
        }
        args.repl.show_prompt = args.prompt_set && !args.quiet;
        return exit_code(run_repl(input, out, err, args.repl));
    }

    args.repl.show_prompt = !args.quiet && (args.prompt_set || interactive);
    return exit_code(run_repl(in, out, err, args.repl));
}

} // namespace lrcalc
