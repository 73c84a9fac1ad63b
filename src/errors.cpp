#include "lrcalc/errors.hpp"

namespace lrcalc {

static std::string quote(char c) {
    if (c >= 0x20 && c < 0x7f) return std::string("'") + c + "'";
    static const char hex[] = "0123456789abcdef";
    const auto u = static_cast<unsigned char>(c);
    return std::string("'\\x") + hex[u >> 4] + hex[u & 0xf] + "'";
}

LexicalError::LexicalError(char c, std::size_t pos)
    : Error("invalid character " + quote(c) + " at position " + std::to_string(pos)),
      c_(c), pos_(pos) {}

const char* to_string(Expected e) noexcept {
    return e == Expected::Operand ? "operand" : "operator";
}

SyntaxError::SyntaxError(Expected expected, const Token& actual)
    : Error(std::string("expected ") + to_string(expected) + " but found " + describe(actual)
            + " at position " + std::to_string(actual.pos)),
      expected_(expected), actual_(actual.kind()), pos_(actual.pos) {}

DivisionByZeroError::DivisionByZeroError(std::size_t pos)
    : Error("division by zero at position " + std::to_string(pos)), pos_(pos) {}

} // namespace lrcalc
