#pragma once
#include <cstddef>
#include <string_view>
#include "lrcalc/errors.hpp"
#include "lrcalc/token.hpp"

namespace lrcalc {

// Single forward pass over one line. There is no rewind; once the end is
// reached every further call keeps returning an End token.
class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Throws LexicalError on a character that starts no token.
    Token next_token();

private:
    void skip_ws();
    bool is_end() const { return i_ >= s_.size(); }
    Token integer();

    std::string_view s_;
    std::size_t i_{0};
};

} // namespace lrcalc
