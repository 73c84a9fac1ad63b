#include "lrcalc/number.hpp"
#include "lrcalc/errors.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <system_error>

namespace lrcalc {

using Limits = std::numeric_limits<std::int64_t>;

// Each returns false when the exact result does not fit in int64.
static bool checked_add(std::int64_t a, std::int64_t b, std::int64_t& out) {
    if ((b > 0 && a > Limits::max() - b) || (b < 0 && a < Limits::min() - b)) return false;
    out = a + b;
    return true;
}

static bool checked_sub(std::int64_t a, std::int64_t b, std::int64_t& out) {
    if ((b < 0 && a > Limits::max() + b) || (b > 0 && a < Limits::min() + b)) return false;
    out = a - b;
    return true;
}

static bool checked_mul(std::int64_t a, std::int64_t b, std::int64_t& out) {
    if (a != 0 && b != 0) {
        if (a > 0) {
            if (b > 0 ? a > Limits::max() / b : b < Limits::min() / a) return false;
        } else {
            if (b > 0 ? a < Limits::min() / b : b < Limits::max() / a) return false;
        }
    }
    out = a * b;
    return true;
}

static double real_op(TokKind op, double x, double y) {
    switch (op) {
        case TokKind::Plus:   return x + y;
        case TokKind::Minus:  return x - y;
        case TokKind::Times:  return x * y;
        case TokKind::Divide: return x / y;
        default: break;
    }
    throw Error(std::string("not an operator: ") + to_string(op));
}

// Integer quotient rounded to double once. Exact quotients convert
// directly; the rest divide in long double.
static double int_quotient(std::int64_t a, std::int64_t b) {
    if (b == -1) return -static_cast<double>(a);
    if (a % b == 0) return static_cast<double>(a / b);
    return static_cast<double>(static_cast<long double>(a) / static_cast<long double>(b));
}

Number apply(TokKind op, const Number& lhs, std::int64_t rhs, std::size_t rhs_pos) {
    if (op == TokKind::Divide) {
        if (rhs == 0) throw DivisionByZeroError(rhs_pos);
        if (const auto* a = std::get_if<std::int64_t>(&lhs)) return int_quotient(*a, rhs);
        return std::get<double>(lhs) / static_cast<double>(rhs);
    }

    if (const auto* a = std::get_if<std::int64_t>(&lhs)) {
        std::int64_t r = 0;
        bool fits = false;
        switch (op) {
            case TokKind::Plus:  fits = checked_add(*a, rhs, r); break;
            case TokKind::Minus: fits = checked_sub(*a, rhs, r); break;
            case TokKind::Times: fits = checked_mul(*a, rhs, r); break;
            default: throw Error(std::string("not an operator: ") + to_string(op));
        }
        if (fits) return r;
    }

    return real_op(op, as_double(lhs), static_cast<double>(rhs));
}

static std::string format_real(double x) {
    if (std::isnan(x)) return "nan";
    if (std::isinf(x)) return x < 0 ? "-inf" : "inf";

    // Shortest digits that read back to the same double.
    char buf[40];
    auto [end, ec] = std::to_chars(buf, buf + sizeof buf, x, std::chars_format::scientific);
    if (ec != std::errc()) throw Error("cannot format real number");

    // buf is "[-]d[.ddd]e[+-]XX"
    const std::string s(buf, end);
    const auto epos = s.find('e');
    const int exp = std::atoi(s.c_str() + epos + 1);

    std::string digits;
    for (std::size_t i = 0; i < epos; ++i) {
        if (s[i] >= '0' && s[i] <= '9') digits += s[i];
    }
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();

    std::string out = std::signbit(x) ? "-" : "";

    if (exp < -4 || exp >= 16) {
        out += digits[0];
        if (digits.size() > 1) out += "." + digits.substr(1);
        const int a = std::abs(exp);
        out += exp < 0 ? "e-" : "e+";
        if (a < 10) out += '0';
        out += std::to_string(a);
    } else if (exp >= 0) {
        const auto int_len = static_cast<std::size_t>(exp) + 1;
        if (digits.size() <= int_len) {
            out += digits + std::string(int_len - digits.size(), '0') + ".0";
        } else {
            out += digits.substr(0, int_len) + "." + digits.substr(int_len);
        }
    } else {
        out += "0." + std::string(static_cast<std::size_t>(-exp - 1), '0') + digits;
    }
    return out;
}

std::string to_string(const Number& n) {
    if (const auto* i = std::get_if<std::int64_t>(&n)) return std::to_string(*i);
    return format_real(std::get<double>(n));
}

} // namespace lrcalc
