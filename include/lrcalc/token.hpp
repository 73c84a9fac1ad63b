#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace lrcalc {

// Order matches the alternatives of Token::Value.
enum class TokKind {
    Integer,
    Plus, Minus, Times, Divide,
    End,
};

struct Integer { std::int64_t value{0}; };
struct Plus {};
struct Minus {};
struct Times {};
struct Divide {};
struct EndOfInput {};

struct Token {
    using Value = std::variant<Integer, Plus, Minus, Times, Divide, EndOfInput>;

    Value value{EndOfInput{}};
    std::size_t pos{0}; // offset of the first character in the line

    TokKind kind() const noexcept { return static_cast<TokKind>(value.index()); }
    bool is(TokKind k) const noexcept { return kind() == k; }
    bool is_operator() const noexcept;

    /// Value of an Integer token. Throws std::bad_variant_access otherwise.
    std::int64_t integer() const { return std::get<Integer>(value).value; }

    /// Literal character of an operator token, '\0' for the others.
    char symbol() const noexcept;
};

const char* to_string(TokKind k) noexcept;

/// Human-readable form for diagnostics: "integer 12", "'+'", "end of input".
std::string describe(const Token& t);

} // namespace lrcalc
