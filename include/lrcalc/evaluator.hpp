#pragma once
#include <string_view>
#include "lrcalc/lexer.hpp"
#include "lrcalc/number.hpp"

namespace lrcalc {

// Folds `operand (operator operand)*` strictly left to right, pulling tokens
// from the lexer on demand. No precedence: "2 + 3 * 4" is (2 + 3) * 4.
class Evaluator {
public:
    explicit Evaluator(Lexer& lex) : lex_(lex) {}

    /// Throws LexicalError, SyntaxError or DivisionByZeroError; on any of
    /// them no partial result is produced.
    Number run();

private:
    Token operand();

    Lexer& lex_;
};

/// Fresh Lexer + Evaluator over one line.
Number evaluate(std::string_view line);

} // namespace lrcalc
