#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

#include "lrcalc/token.hpp"

namespace lrcalc {

/// Running accumulator. Stays integral through + - * and becomes real after
/// the first division or on integer overflow; it never goes back.
using Number = std::variant<std::int64_t, double>;

inline bool is_integer(const Number& n) noexcept { return std::holds_alternative<std::int64_t>(n); }

inline double as_double(const Number& n) noexcept {
    if (const auto* i = std::get_if<std::int64_t>(&n)) return static_cast<double>(*i);
    return std::get<double>(n);
}

/// Folds `lhs op rhs`. `op` must be an operator kind. Division is always real
/// and throws DivisionByZeroError (reporting `rhs_pos`) when rhs is zero.
Number apply(TokKind op, const Number& lhs, std::int64_t rhs, std::size_t rhs_pos);

/// Integers in plain decimal. Reals in the shortest round-tripping form with
/// a fractional part or exponent always present ("4.0", "0.1", "1e+16").
std::string to_string(const Number& n);

} // namespace lrcalc
