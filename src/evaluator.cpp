#include "lrcalc/evaluator.hpp"

namespace lrcalc {

Token Evaluator::operand() {
    Token t = lex_.next_token();
    if (!t.is(TokKind::Integer)) throw SyntaxError(Expected::Operand, t);
    return t;
}

Number Evaluator::run() {
    Number acc = operand().integer();

    for (;;) {
        Token op = lex_.next_token();
        if (op.is(TokKind::End)) return acc;
        if (!op.is_operator()) throw SyntaxError(Expected::Operator, op);

        Token rhs = operand();
        acc = apply(op.kind(), acc, rhs.integer(), rhs.pos);
    }
}

Number evaluate(std::string_view line) {
    Lexer lex(line);
    return Evaluator(lex).run();
}

} // namespace lrcalc
