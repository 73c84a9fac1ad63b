#include <gtest/gtest.h>
#include <lrcalc/lexer.hpp>

#include <string>
#include <vector>

namespace {

std::vector<lrcalc::Token> lex_all(std::string_view s) {
    lrcalc::Lexer lex(s);
    std::vector<lrcalc::Token> out;
    for (;;) {
        out.push_back(lex.next_token());
        if (out.back().is(lrcalc::TokKind::End)) return out;
    }
}

using lrcalc::TokKind;

TEST(Lexer, OperatorsAndIntegers) {
    auto toks = lex_all("12+3-4*5/6");
    ASSERT_EQ(toks.size(), 10u);

    const TokKind kinds[] = {
        TokKind::Integer, TokKind::Plus, TokKind::Integer, TokKind::Minus, TokKind::Integer,
        TokKind::Times, TokKind::Integer, TokKind::Divide, TokKind::Integer, TokKind::End,
    };
    for (std::size_t i = 0; i < toks.size(); ++i) EXPECT_EQ(toks[i].kind(), kinds[i]) << i;

    EXPECT_EQ(toks[0].integer(), 12);
    EXPECT_EQ(toks[8].integer(), 6);
    EXPECT_EQ(toks[1].symbol(), '+');
    EXPECT_EQ(toks[3].symbol(), '-');
    EXPECT_EQ(toks[5].symbol(), '*');
    EXPECT_EQ(toks[7].symbol(), '/');
    EXPECT_EQ(toks[0].symbol(), '\0');
}

TEST(Lexer, MultiDigitIsOneToken) {
    auto toks = lex_all("123");
    ASSERT_EQ(toks.size(), 2u);
    EXPECT_EQ(toks[0].integer(), 123);
    EXPECT_TRUE(toks[1].is(TokKind::End));
}

TEST(Lexer, SkipsWhitespaceAndTracksPositions) {
    auto toks = lex_all("  3 \t+   45  ");
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[0].pos, 2u);
    EXPECT_EQ(toks[1].pos, 5u);
    EXPECT_EQ(toks[2].pos, 9u);
    EXPECT_EQ(toks[2].integer(), 45);
    EXPECT_EQ(toks[3].pos, 13u);
}

TEST(Lexer, EndIsRepeatable) {
    lrcalc::Lexer lex("7");
    EXPECT_TRUE(lex.next_token().is(TokKind::Integer));
    for (int i = 0; i < 3; ++i) EXPECT_TRUE(lex.next_token().is(TokKind::End));
}

TEST(Lexer, EmptyAndBlankGiveEnd) {
    EXPECT_TRUE(lrcalc::Lexer("").next_token().is(TokKind::End));
    EXPECT_TRUE(lrcalc::Lexer("   ").next_token().is(TokKind::End));
}

TEST(Lexer, InvalidCharacterReportsCharAndPosition) {
    lrcalc::Lexer lex("3 @ 5");
    EXPECT_TRUE(lex.next_token().is(TokKind::Integer));
    try {
        lex.next_token();
        FAIL() << "expected LexicalError";
    } catch (const lrcalc::LexicalError& e) {
        EXPECT_EQ(e.character(), '@');
        EXPECT_EQ(e.position(), 2u);
        EXPECT_NE(std::string(e.what()).find("'@'"), std::string::npos);
    }
}

TEST(Lexer, NoSignsOrFractions) {
    lrcalc::Lexer lex("1.5");
    EXPECT_EQ(lex.next_token().integer(), 1);
    EXPECT_THROW(lex.next_token(), lrcalc::LexicalError);

    // '-' is always a separate operator token
    auto toks = lex_all("-2");
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_TRUE(toks[0].is(TokKind::Minus));
    EXPECT_EQ(toks[1].integer(), 2);
}

TEST(Lexer, LiteralOutOfRange) {
    EXPECT_EQ(lrcalc::Lexer("9223372036854775807").next_token().integer(), 9223372036854775807LL);

    lrcalc::Lexer lex("1 + 9223372036854775808");
    lex.next_token();
    lex.next_token();
    try {
        lex.next_token();
        FAIL() << "expected LexicalError";
    } catch (const lrcalc::LexicalError& e) {
        EXPECT_EQ(e.position(), 4u);
        EXPECT_EQ(e.character(), '9');
    }
}

TEST(Token, Describe) {
    lrcalc::Lexer lex("12 +");
    EXPECT_EQ(lrcalc::describe(lex.next_token()), "integer 12");
    EXPECT_EQ(lrcalc::describe(lex.next_token()), "'+'");
    EXPECT_EQ(lrcalc::describe(lex.next_token()), "end of input");
}

} // namespace
