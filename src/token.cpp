#include "lrcalc/token.hpp"

namespace lrcalc {

bool Token::is_operator() const noexcept {
    switch (kind()) {
        case TokKind::Plus:
        case TokKind::Minus:
        case TokKind::Times:
        case TokKind::Divide: return true;
        default:              return false;
    }
}

char Token::symbol() const noexcept {
    switch (kind()) {
        case TokKind::Plus:   return '+';
        case TokKind::Minus:  return '-';
        case TokKind::Times:  return '*';
        case TokKind::Divide: return '/';
        default:              return '\0';
    }
}

const char* to_string(TokKind k) noexcept {
    switch (k) {
        case TokKind::Integer: return "integer";
        case TokKind::Plus:    return "'+'";
        case TokKind::Minus:   return "'-'";
        case TokKind::Times:   return "'*'";
        case TokKind::Divide:  return "'/'";
        case TokKind::End:     return "end of input";
    }
    return "?";
}

std::string describe(const Token& t) {
    if (t.is(TokKind::Integer)) return "integer " + std::to_string(t.integer());
    return to_string(t.kind());
}

} // namespace lrcalc
