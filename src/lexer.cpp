#include "lrcalc/lexer.hpp"
#include <cctype>
#include <charconv>
#include <system_error>

namespace lrcalc {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

void Lexer::skip_ws() {
    while (!is_end() && std::isspace(static_cast<unsigned char>(s_[i_]))) ++i_;
}

Token Lexer::integer() {
    const std::size_t start = i_;
    while (!is_end() && is_digit(s_[i_])) ++i_;

    std::int64_t v = 0;
    auto [ptr, ec] = std::from_chars(s_.data() + start, s_.data() + i_, v);
    if (ec == std::errc::result_out_of_range) {
        throw LexicalError("integer literal out of range at position " + std::to_string(start),
                           s_[start], start);
    }
    if (ec != std::errc() || ptr != s_.data() + i_) {
        throw LexicalError(s_[start], start);
    }
    return {Integer{v}, start};
}

Token Lexer::next_token() {
    skip_ws();
    if (is_end()) return {EndOfInput{}, s_.size()};

    const std::size_t at = i_;
    char c = s_[i_];

    switch (c) {
        case '+': ++i_; return {Plus{}, at};
        case '-': ++i_; return {Minus{}, at};
        case '*': ++i_; return {Times{}, at};
        case '/': ++i_; return {Divide{}, at};
        default: break;
    }

    if (is_digit(c)) return integer();

    throw LexicalError(c, at);
}

} // namespace lrcalc
