#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

#include "lrcalc/token.hpp"

namespace lrcalc {

struct Error : std::runtime_error { using std::runtime_error::runtime_error; };

class LexicalError : public Error {
public:
    LexicalError(char c, std::size_t pos);
    LexicalError(const std::string& what, char c, std::size_t pos)
        : Error(what), c_(c), pos_(pos) {}

    char character() const noexcept { return c_; }
    std::size_t position() const noexcept { return pos_; }

private:
    char c_;
    std::size_t pos_;
};

enum class Expected { Operand, Operator };

const char* to_string(Expected e) noexcept;

class SyntaxError : public Error {
public:
    SyntaxError(Expected expected, const Token& actual);

    Expected expected() const noexcept { return expected_; }
    TokKind actual() const noexcept { return actual_; }
    std::size_t position() const noexcept { return pos_; }

private:
    Expected expected_;
    TokKind actual_;
    std::size_t pos_;
};

class DivisionByZeroError : public Error {
public:
    explicit DivisionByZeroError(std::size_t pos);

    std::size_t position() const noexcept { return pos_; }

private:
    std::size_t pos_;
};

} // namespace lrcalc
